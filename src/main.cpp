#include <exception>
#include <iostream>

#include "app_setting.hpp"
#include "logger.hpp"
#include "stream_types.hpp"
#include "supervisor.hpp"

int main(int argc, char *argv[])
{
    AppSettings settings;
    try
    {
        settings = load_settings(argc, argv);
    }
    catch (const SupervisorError &e)
    {
        std::cerr << "ConfigError: " << e.what() << std::endl;
        return 1;
    }

    Logger *logger = Logger::get_instance();
    logger->set_log_level(Logger::parse_level(settings.log_level));
    if (!settings.log_file.empty() && !logger->set_log_file(settings.log_file))
        LOG_WARNING("Cannot open log file " + settings.log_file + ", logging to console only");

    LOG_INFO("Video directory: " + settings.videos_dir);
    LOG_INFO("RTSP server: " + settings.rtsp_host + ":" + std::to_string(settings.rtsp_port));
    LOG_INFO("API port: " + std::to_string(settings.api_port));

    int code = 1;
    try
    {
        Supervisor supervisor(settings);
        code = supervisor.run();
    }
    catch (const std::exception &e)
    {
        LOG_CRITICAL(std::string("Fatal: ") + e.what());
    }

    return code;
}
