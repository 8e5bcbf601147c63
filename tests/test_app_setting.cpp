#include <cstdlib>

#include <gtest/gtest.h>

#include "app_setting.hpp"
#include "stream_types.hpp"
#include "test_util.hpp"

using test_util::TempDir;

namespace
{
    const char *SUPERVISOR_ENV[] = {
        "VIDEOS_DIR", "MEDIAMTX_RTSP_PORT", "STREAM_API_PORT",
        "LOG_LEVEL", "LOG_FILE", "CONTAINER_NAME", "SUPERVISOR_CONFIG"};

    class AppSettingTest : public ::testing::Test
    {
    protected:
        void SetUp() override { clear_env(); }
        void TearDown() override { clear_env(); }

        static void clear_env()
        {
            for (const char *name : SUPERVISOR_ENV)
                unsetenv(name);
        }

        static ErrorKind error_of(const std::function<void()> &fn)
        {
            try
            {
                fn();
            }
            catch (const SupervisorError &e)
            {
                return e.kind();
            }
            return ErrorKind::NONE;
        }
    };
}

TEST_F(AppSettingTest, DefaultsMatchTheDeployment)
{
    AppSettings settings;
    EXPECT_EQ(settings.videos_dir, "/app/videos");
    EXPECT_EQ(settings.rtsp_port, 8554);
    EXPECT_EQ(settings.api_port, 8080);
    EXPECT_EQ(settings.watch_mode, "notify");
    EXPECT_FALSE(settings.restart_on_crash);
    ASSERT_FALSE(settings.relay_command.empty());
    EXPECT_EQ(settings.relay_command.front(), "ffmpeg");
    EXPECT_NO_THROW(validate_settings(settings));
}

TEST_F(AppSettingTest, BuildsRtspUrls)
{
    AppSettings settings;
    settings.rtsp_host = "mediamtx";
    settings.public_host = "streams.local";
    settings.rtsp_port = 9554;

    EXPECT_EQ(settings.rtsp_publish_url("sailboat"), "rtsp://mediamtx:9554/sailboat");
    EXPECT_EQ(settings.rtsp_public_url("sailboat"), "rtsp://streams.local:9554/sailboat");
}

TEST_F(AppSettingTest, ConfigFileOverlaysPresentKeysOnly)
{
    TempDir dir;
    const std::string path = dir.file("supervisor.json");
    test_util::write_file(path, R"({
        "videos_dir": "/data/videos",
        "api_port": 9000,
        "watch_mode": "poll",
        "video_extensions": [".mp4"],
        "restart_on_crash": true
    })");

    AppSettings settings;
    load_settings_file(path, settings);

    EXPECT_EQ(settings.videos_dir, "/data/videos");
    EXPECT_EQ(settings.api_port, 9000);
    EXPECT_EQ(settings.watch_mode, "poll");
    EXPECT_EQ(settings.video_extensions, std::vector<std::string>{".mp4"});
    EXPECT_TRUE(settings.restart_on_crash);
    EXPECT_EQ(settings.rtsp_port, 8554);
}

TEST_F(AppSettingTest, BadConfigFilesAreConfigErrors)
{
    TempDir dir;
    AppSettings settings;

    EXPECT_EQ(error_of([&] { load_settings_file(dir.file("missing.json"), settings); }),
              ErrorKind::CONFIG_ERROR);

    test_util::write_file(dir.file("broken.json"), "{ not json");
    EXPECT_EQ(error_of([&] { load_settings_file(dir.file("broken.json"), settings); }),
              ErrorKind::CONFIG_ERROR);

    test_util::write_file(dir.file("typed.json"), R"({"api_port": "eighty"})");
    EXPECT_EQ(error_of([&] { load_settings_file(dir.file("typed.json"), settings); }),
              ErrorKind::CONFIG_ERROR);
}

TEST_F(AppSettingTest, EnvironmentOverrides)
{
    setenv("VIDEOS_DIR", "/srv/videos", 1);
    setenv("MEDIAMTX_RTSP_PORT", "9554", 1);
    setenv("STREAM_API_PORT", "9090", 1);
    setenv("LOG_LEVEL", "debug", 1);
    setenv("CONTAINER_NAME", "media-box", 1);

    AppSettings settings;
    apply_env_overrides(settings);

    EXPECT_EQ(settings.videos_dir, "/srv/videos");
    EXPECT_EQ(settings.rtsp_port, 9554);
    EXPECT_EQ(settings.api_port, 9090);
    EXPECT_EQ(settings.log_level, "debug");
    EXPECT_EQ(settings.rtsp_public_url("x"), "rtsp://media-box:9554/x");
    EXPECT_EQ(settings.rtsp_publish_url("x"), "rtsp://localhost:9554/x");
}

TEST_F(AppSettingTest, EmptyContainerNameKeepsDefaultHost)
{
    setenv("CONTAINER_NAME", "", 1);
    AppSettings settings;
    apply_env_overrides(settings);
    EXPECT_EQ(settings.public_host, "localhost");
}

TEST_F(AppSettingTest, NonNumericPortIsConfigError)
{
    setenv("STREAM_API_PORT", "80a", 1);
    AppSettings settings;
    EXPECT_EQ(error_of([&] { apply_env_overrides(settings); }), ErrorKind::CONFIG_ERROR);
}

TEST_F(AppSettingTest, ValidationRejectsBadValues)
{
    AppSettings settings;
    settings.watch_mode = "inotify";
    EXPECT_EQ(error_of([&] { validate_settings(settings); }), ErrorKind::CONFIG_ERROR);

    settings = AppSettings{};
    settings.log_level = "loud";
    EXPECT_EQ(error_of([&] { validate_settings(settings); }), ErrorKind::CONFIG_ERROR);

    settings = AppSettings{};
    settings.api_port = 70000;
    EXPECT_EQ(error_of([&] { validate_settings(settings); }), ErrorKind::CONFIG_ERROR);

    settings = AppSettings{};
    settings.video_extensions = {"mp4"};
    EXPECT_EQ(error_of([&] { validate_settings(settings); }), ErrorKind::CONFIG_ERROR);

    settings = AppSettings{};
    settings.relay_command.clear();
    EXPECT_EQ(error_of([&] { validate_settings(settings); }), ErrorKind::CONFIG_ERROR);
}

TEST_F(AppSettingTest, LoadSettingsLayersFileThenEnvironment)
{
    TempDir dir;
    const std::string path = dir.file("supervisor.json");
    test_util::write_file(path, R"({"api_port": 9000, "videos_dir": "/from/file"})");
    setenv("STREAM_API_PORT", "9100", 1);

    std::string program = "stream-supervisor";
    std::string config = path;
    char *argv[] = {&program[0], &config[0], nullptr};

    AppSettings settings = load_settings(2, argv);
    EXPECT_EQ(settings.api_port, 9100);
    EXPECT_EQ(settings.videos_dir, "/from/file");
}

TEST_F(AppSettingTest, ConfigPathFromEnvironment)
{
    TempDir dir;
    const std::string path = dir.file("supervisor.json");
    test_util::write_file(path, R"({"debounce_ms": 250})");
    setenv("SUPERVISOR_CONFIG", path.c_str(), 1);

    std::string program = "stream-supervisor";
    char *argv[] = {&program[0], nullptr};

    AppSettings settings = load_settings(1, argv);
    EXPECT_EQ(settings.debounce_ms, 250);
}
