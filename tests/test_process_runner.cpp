#include <csignal>
#include <fstream>

#include <unistd.h>

#include <gtest/gtest.h>

#include "process_runner.hpp"
#include "stream_types.hpp"
#include "test_util.hpp"

using test_util::TempDir;

namespace
{
    class ProcessRunnerTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            settings_ = test_util::make_settings(dir_.path());
            source_ = dir_.file("clip.mp4");
            test_util::write_file(source_);
        }

        TempDir dir_;
        AppSettings settings_;
        std::string source_;
    };
}

TEST_F(ProcessRunnerTest, SubstitutesCommandPlaceholders)
{
    AppSettings settings;
    settings.rtsp_host = "mediamtx";
    ProcessRunner runner(settings);

    auto argv = runner.build_command("/videos/My Clip.mp4", "my_clip", 2);
    const std::vector<std::string> expected = {
        "ffmpeg", "-hide_banner", "-loglevel", "error",
        "-re", "-stream_loop", "2", "-i", "/videos/My Clip.mp4",
        "-c", "copy", "-map", "0", "-f", "rtsp", "rtsp://mediamtx:8554/my_clip"};
    EXPECT_EQ(argv, expected);
}

TEST_F(ProcessRunnerTest, SubstitutesInsideLargerArguments)
{
    settings_.relay_command = {"relay", "--name={id}", "--loops={loop}", "{url}?src={input}"};
    ProcessRunner runner(settings_);

    auto argv = runner.build_command("/v/a.mp4", "a", -1);
    ASSERT_EQ(argv.size(), 4u);
    EXPECT_EQ(argv[1], "--name=a");
    EXPECT_EQ(argv[2], "--loops=-1");
    EXPECT_EQ(argv[3], "rtsp://localhost:8554/a?src=/v/a.mp4");
}

TEST_F(ProcessRunnerTest, StartReturnsLiveHandleAndStopReapsIt)
{
    ProcessRunner runner(settings_);
    auto child = runner.start(source_, "clip", -1);

    ASSERT_TRUE(child);
    EXPECT_GT(child->pid(), 0);
    EXPECT_EQ(child->stream_id(), "clip");
    EXPECT_TRUE(runner.is_alive(*child));
    EXPECT_TRUE(test_util::process_running(child->pid()));

    runner.stop(*child);

    EXPECT_FALSE(runner.is_alive(*child));
    EXPECT_FALSE(test_util::process_running(child->pid()));

    ExitInfo info = child->exit_info();
    EXPECT_TRUE(info.exited);
    EXPECT_TRUE(info.stop_requested);
    EXPECT_TRUE(info.signaled);
    EXPECT_EQ(info.signal, SIGTERM);
    EXPECT_FALSE(child->crashed());
}

TEST_F(ProcessRunnerTest, StopIsIdempotent)
{
    ProcessRunner runner(settings_);
    auto child = runner.start(source_, "clip", -1);

    runner.stop(*child);
    EXPECT_NO_THROW(runner.stop(*child));
    EXPECT_FALSE(runner.is_alive(*child));
}

TEST_F(ProcessRunnerTest, ChildLeadsItsOwnProcessGroup)
{
    ProcessRunner runner(settings_);
    auto child = runner.start(source_, "clip", -1);

    ASSERT_TRUE(test_util::wait_until([&] { return getpgid(child->pid()) == child->pid(); }));
    EXPECT_NE(getpgid(child->pid()), getpgid(0));
    runner.stop(*child);
}

TEST_F(ProcessRunnerTest, MissingExecutableIsSpawnFailure)
{
    settings_.relay_command = {"/nonexistent/relay-binary", "{input}"};
    ProcessRunner runner(settings_);

    try
    {
        runner.start(source_, "clip", -1);
        FAIL() << "expected a spawn failure";
    }
    catch (const SupervisorError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::PROCESS_SPAWN_FAILURE);
        EXPECT_NE(std::string(e.what()).find("clip"), std::string::npos);
    }
}

TEST_F(ProcessRunnerTest, ChildIgnoringTermIsKilledAfterGrace)
{
    settings_.relay_command = test_util::stubborn_relay();
    settings_.stop_grace_ms = 300;
    ProcessRunner runner(settings_);

    auto child = runner.start(source_, "clip", -1);
    ASSERT_TRUE(test_util::wait_until([&] { return test_util::file_exists(source_ + ".ready"); }));

    const auto begin = std::chrono::steady_clock::now();
    runner.stop(*child);
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_GE(elapsed, std::chrono::milliseconds(300));
    EXPECT_LT(elapsed, std::chrono::seconds(3));

    ExitInfo info = child->exit_info();
    EXPECT_TRUE(info.signaled);
    EXPECT_EQ(info.signal, SIGKILL);
    EXPECT_FALSE(child->crashed());
}

TEST_F(ProcessRunnerTest, StopAlsoKillsGrandchildren)
{
    const std::string pid_file = source_ + ".grandchild";
    settings_.relay_command = test_util::shell_relay("sleep 30 & echo $! > \"$0.grandchild\"; wait");
    ProcessRunner runner(settings_);

    auto child = runner.start(source_, "clip", -1);
    ASSERT_TRUE(test_util::wait_until([&] {
        std::ifstream in(pid_file);
        pid_t pid = 0;
        return static_cast<bool>(in >> pid) && pid > 0;
    }));

    pid_t grandchild = 0;
    std::ifstream(pid_file) >> grandchild;
    ASSERT_TRUE(test_util::process_running(grandchild));

    runner.stop(*child);
    EXPECT_TRUE(test_util::wait_until([&] { return !test_util::process_running(grandchild); }));
}

TEST_F(ProcessRunnerTest, NonZeroExitIsCrash)
{
    settings_.relay_command = test_util::shell_relay("exit 3");
    ProcessRunner runner(settings_);

    auto child = runner.start(source_, "clip", 0);
    child->wait();

    EXPECT_TRUE(child->crashed());
    EXPECT_EQ(child->exit_info().code, 3);
    EXPECT_EQ(child->describe_exit(), "exited with status 3");
}

TEST_F(ProcessRunnerTest, FiniteRelayExitingCleanlyHasFinished)
{
    settings_.relay_command = test_util::shell_relay("exit 0");
    ProcessRunner runner(settings_);

    auto child = runner.start(source_, "clip", 0);
    child->wait();
    EXPECT_FALSE(child->crashed());
}

TEST_F(ProcessRunnerTest, InfiniteRelayExitingAtAllHasCrashed)
{
    settings_.relay_command = test_util::shell_relay("exit 0");
    ProcessRunner runner(settings_);

    auto child = runner.start(source_, "clip", -1);
    child->wait();
    EXPECT_TRUE(child->crashed());
}

TEST_F(ProcessRunnerTest, UnrequestedSignalIsCrash)
{
    settings_.relay_command = test_util::shell_relay("kill -9 $$");
    ProcessRunner runner(settings_);

    auto child = runner.start(source_, "clip", 0);
    child->wait();

    ExitInfo info = child->exit_info();
    EXPECT_TRUE(info.signaled);
    EXPECT_EQ(info.signal, SIGKILL);
    EXPECT_TRUE(child->crashed());
}

TEST_F(ProcessRunnerTest, DroppingLiveHandleKillsChild)
{
    ProcessRunner runner(settings_);
    auto child = runner.start(source_, "clip", -1);
    const pid_t pid = child->pid();

    child.reset();
    EXPECT_FALSE(test_util::process_running(pid));
}
