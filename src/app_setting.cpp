#include "app_setting.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "logger.hpp"
#include "stream_types.hpp"

using json = nlohmann::json;

namespace
{
    template <typename T>
    void read_key(const json &config, const char *key, T &out)
    {
        if (config.contains(key))
            out = config.at(key).get<T>();
    }

    int parse_port(const char *name, const std::string &value)
    {
        try
        {
            size_t used = 0;
            int port = std::stoi(value, &used);
            if (used == value.size())
                return port;
        }
        catch (const std::exception &)
        {
        }
        throw SupervisorError(ErrorKind::CONFIG_ERROR,
                              std::string(name) + " is not a number: " + value);
    }

    void require(bool condition, const std::string &message)
    {
        if (!condition)
            throw SupervisorError(ErrorKind::CONFIG_ERROR, message);
    }
}

std::string AppSettings::rtsp_publish_url(const std::string &stream_id) const
{
    return "rtsp://" + rtsp_host + ":" + std::to_string(rtsp_port) + "/" + stream_id;
}

std::string AppSettings::rtsp_public_url(const std::string &stream_id) const
{
    return "rtsp://" + public_host + ":" + std::to_string(rtsp_port) + "/" + stream_id;
}

void load_settings_file(const std::string &path, AppSettings &settings)
{
    std::ifstream file(path);
    if (!file.is_open())
        throw SupervisorError(ErrorKind::CONFIG_ERROR, "cannot open config file: " + path);

    try
    {
        json config;
        file >> config;

        read_key(config, "videos_dir", settings.videos_dir);
        read_key(config, "video_extensions", settings.video_extensions);

        read_key(config, "rtsp_host", settings.rtsp_host);
        read_key(config, "rtsp_port", settings.rtsp_port);
        read_key(config, "public_host", settings.public_host);
        read_key(config, "wait_for_media_server", settings.wait_for_media_server);
        read_key(config, "media_server_wait_s", settings.media_server_wait_s);

        read_key(config, "relay_command", settings.relay_command);
        read_key(config, "stop_grace_ms", settings.stop_grace_ms);
        read_key(config, "restart_on_crash", settings.restart_on_crash);
        read_key(config, "auto_start", settings.auto_start);

        read_key(config, "watch_mode", settings.watch_mode);
        read_key(config, "poll_interval_ms", settings.poll_interval_ms);
        read_key(config, "debounce_ms", settings.debounce_ms);
        read_key(config, "event_queue_capacity", settings.event_queue_capacity);
        read_key(config, "reconcile_interval_ms", settings.reconcile_interval_ms);

        read_key(config, "api_bind_address", settings.api_bind_address);
        read_key(config, "api_port", settings.api_port);
        read_key(config, "api_threads", settings.api_threads);

        read_key(config, "log_level", settings.log_level);
        read_key(config, "log_file", settings.log_file);
    }
    catch (const json::exception &e)
    {
        throw SupervisorError(ErrorKind::CONFIG_ERROR,
                              "invalid config file " + path + ": " + e.what());
    }
}

void apply_env_overrides(AppSettings &settings)
{
    if (const char *dir = std::getenv("VIDEOS_DIR"))
        settings.videos_dir = dir;
    if (const char *port = std::getenv("MEDIAMTX_RTSP_PORT"))
        settings.rtsp_port = parse_port("MEDIAMTX_RTSP_PORT", port);
    if (const char *port = std::getenv("STREAM_API_PORT"))
        settings.api_port = parse_port("STREAM_API_PORT", port);
    if (const char *level = std::getenv("LOG_LEVEL"))
        settings.log_level = level;
    if (const char *file = std::getenv("LOG_FILE"))
        settings.log_file = file;
    if (const char *host = std::getenv("CONTAINER_NAME"))
    {
        if (*host != '\0')
            settings.public_host = host;
    }
}

void validate_settings(const AppSettings &settings)
{
    require(!settings.videos_dir.empty(), "videos_dir must not be empty");
    require(!settings.video_extensions.empty(), "video_extensions must not be empty");
    for (const auto &ext : settings.video_extensions)
        require(ext.size() > 1 && ext[0] == '.', "video extension must start with '.': " + ext);

    require(settings.rtsp_port > 0 && settings.rtsp_port < 65536,
            "rtsp_port out of range: " + std::to_string(settings.rtsp_port));
    require(settings.api_port >= 0 && settings.api_port < 65536,
            "api_port out of range: " + std::to_string(settings.api_port));
    require(settings.media_server_wait_s >= 0, "media_server_wait_s must be >= 0");

    require(!settings.relay_command.empty(), "relay_command must not be empty");
    require(settings.stop_grace_ms >= 0, "stop_grace_ms must be >= 0");

    require(settings.watch_mode == "notify" || settings.watch_mode == "poll",
            "watch_mode must be \"notify\" or \"poll\": " + settings.watch_mode);
    require(settings.poll_interval_ms > 0, "poll_interval_ms must be > 0");
    require(settings.debounce_ms >= 0, "debounce_ms must be >= 0");
    require(settings.event_queue_capacity > 0, "event_queue_capacity must be > 0");
    require(settings.reconcile_interval_ms > 0, "reconcile_interval_ms must be > 0");
    require(settings.api_threads > 0, "api_threads must be > 0");

    try
    {
        Logger::parse_level(settings.log_level);
    }
    catch (const std::invalid_argument &e)
    {
        throw SupervisorError(ErrorKind::CONFIG_ERROR, e.what());
    }
}

AppSettings load_settings(int argc, char *argv[])
{
    AppSettings settings;

    std::string config_path;
    if (argc > 1 && argv[1] != nullptr)
        config_path = argv[1];
    else if (const char *env_path = std::getenv("SUPERVISOR_CONFIG"))
        config_path = env_path;

    if (!config_path.empty())
        load_settings_file(config_path, settings);

    apply_env_overrides(settings);
    validate_settings(settings);
    return settings;
}
