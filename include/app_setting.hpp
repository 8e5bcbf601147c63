#pragma once
#include <string>
#include <vector>

struct AppSettings {

    /* ---------- SOURCE DIRECTORY ---------- */
    std::string videos_dir = "/app/videos";
    std::vector<std::string> video_extensions = {
        ".mp4", ".mkv", ".mov", ".avi", ".m4v", ".ts", ".webm", ".flv"};

    /* ---------- MEDIA SERVER ---------- */
    std::string rtsp_host = "localhost";
    int rtsp_port = 8554;
    std::string public_host = "localhost";   // host shown in rtsp_url
    bool wait_for_media_server = true;
    int media_server_wait_s = 0;              // 0 waits forever

    /* ---------- RELAY ---------- */
    // {input} {url} {loop} {id} are substituted per stream
    std::vector<std::string> relay_command = {
        "ffmpeg", "-hide_banner", "-loglevel", "error",
        "-re", "-stream_loop", "{loop}", "-i", "{input}",
        "-c", "copy", "-map", "0", "-f", "rtsp", "{url}"};
    int stop_grace_ms = 5000;
    bool restart_on_crash = false;
    bool auto_start = true;

    /* ---------- WATCHER ---------- */
    std::string watch_mode = "notify";        // "notify" | "poll"
    int poll_interval_ms = 2000;
    int debounce_ms = 1000;
    int event_queue_capacity = 256;
    int reconcile_interval_ms = 2000;

    /* ---------- CONTROL API ---------- */
    std::string api_bind_address = "0.0.0.0";
    int api_port = 8080;
    int api_threads = 4;

    /* ---------- DEBUG ---------- */
    std::string log_level = "info";
    std::string log_file;

    std::string rtsp_publish_url(const std::string &stream_id) const;
    std::string rtsp_public_url(const std::string &stream_id) const;
};

/**
 * @brief Overlay the keys present in a JSON config file onto @p settings
 * @throw SupervisorError (CONFIG_ERROR) if the file is unreadable or malformed
 */
void load_settings_file(const std::string &path, AppSettings &settings);

/**
 * @brief Apply VIDEOS_DIR, MEDIAMTX_RTSP_PORT, STREAM_API_PORT, LOG_LEVEL,
 * LOG_FILE and CONTAINER_NAME from the environment
 */
void apply_env_overrides(AppSettings &settings);

/** @throw SupervisorError (CONFIG_ERROR) on the first invalid value */
void validate_settings(const AppSettings &settings);

/**
 * @brief Defaults, then the config file (argv[1] or SUPERVISOR_CONFIG),
 * then the environment, then validation
 */
AppSettings load_settings(int argc, char *argv[]);
