/**
 * @file process_runner.cpp
 * @brief Implementation of ChildProcess and ProcessRunner
 */

#include "process_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

#include <glib.h>

#include "logger.hpp"
#include "stream_types.hpp"

namespace
{
    constexpr std::chrono::milliseconds STOP_POLL_INTERVAL{50};

    // Runs in the forked child before exec
    void enter_own_process_group(gpointer)
    {
        setpgid(0, 0);
    }

    void replace_all(std::string &text, const std::string &token, const std::string &value)
    {
        size_t pos = 0;
        while ((pos = text.find(token, pos)) != std::string::npos)
        {
            text.replace(pos, token.size(), value);
            pos += value.size();
        }
    }
}

/* ---------- ChildProcess ---------- */

ChildProcess::ChildProcess(pid_t pid, const std::string &stream_id, int loop_count)
    : pid_(pid),
      stream_id_(stream_id),
      loop_count_(loop_count),
      started_at_(std::chrono::system_clock::now())
{
}

ChildProcess::~ChildProcess()
{
    if (poll())
    {
        LOG_WARNING("Killing relay of " + stream_id_ + " (pid " + std::to_string(pid_) +
                    ") dropped while still running");
        mark_stop_requested();
        signal_group(SIGKILL);
        wait();
    }
    kill_group_remnants();
}

void ChildProcess::record_status_locked(int status)
{
    exit_.exited = true;
    if (WIFSIGNALED(status))
    {
        exit_.signaled = true;
        exit_.signal = WTERMSIG(status);
    }
    else if (WIFEXITED(status))
    {
        exit_.code = WEXITSTATUS(status);
    }
}

bool ChildProcess::poll()
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (exit_.exited)
        return false;

    for (;;)
    {
        int status = 0;
        pid_t r = waitpid(pid_, &status, WNOHANG);
        if (r == 0)
            return true;
        if (r == pid_)
        {
            record_status_locked(status);
            return false;
        }
        if (r == -1 && errno == EINTR)
            continue;

        // ECHILD: reaped elsewhere, status unknown
        exit_.exited = true;
        exit_.code = -1;
        return false;
    }
}

void ChildProcess::wait()
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (exit_.exited)
        return;

    for (;;)
    {
        int status = 0;
        pid_t r = waitpid(pid_, &status, 0);
        if (r == pid_)
        {
            record_status_locked(status);
            return;
        }
        if (r == -1 && errno == EINTR)
            continue;

        exit_.exited = true;
        exit_.code = -1;
        return;
    }
}

bool ChildProcess::signal_group(int signo)
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (exit_.exited)
        return false;

    if (kill(-pid_, signo) == 0)
        return true;

    // Group not formed yet; fall back to the leader alone
    return kill(pid_, signo) == 0;
}

void ChildProcess::kill_group_remnants()
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (!exit_.exited)
        return;

    // A pgid is not recycled while any member is alive
    if (kill(-pid_, SIGKILL) == 0)
        LOG_DEBUG("Killed leftover processes in group " + std::to_string(pid_));
}

void ChildProcess::mark_stop_requested()
{
    std::lock_guard<std::mutex> lock(mtx_);
    exit_.stop_requested = true;
}

ExitInfo ChildProcess::exit_info() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return exit_;
}

bool ChildProcess::crashed() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (!exit_.exited || exit_.stop_requested)
        return false;
    if (exit_.signaled || exit_.code != 0)
        return true;
    return loop_count_ < 0;
}

std::string ChildProcess::describe_exit() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (!exit_.exited)
        return "running";
    if (exit_.signaled)
        return "killed by signal " + std::to_string(exit_.signal) +
               " (" + strsignal(exit_.signal) + ")";
    return "exited with status " + std::to_string(exit_.code);
}

/* ---------- ProcessRunner ---------- */

ProcessRunner::ProcessRunner(const AppSettings &settings)
    : settings_(settings),
      grace_(settings.stop_grace_ms)
{
}

std::vector<std::string> ProcessRunner::build_command(const std::string &source_path,
                                                      const std::string &stream_id,
                                                      int loop_count) const
{
    const std::string url = settings_.rtsp_publish_url(stream_id);
    const std::string loop = std::to_string(loop_count);

    std::vector<std::string> argv;
    argv.reserve(settings_.relay_command.size());

    for (std::string arg : settings_.relay_command)
    {
        replace_all(arg, "{input}", source_path);
        replace_all(arg, "{url}", url);
        replace_all(arg, "{loop}", loop);
        replace_all(arg, "{id}", stream_id);
        argv.push_back(std::move(arg));
    }
    return argv;
}

std::unique_ptr<ChildProcess> ProcessRunner::start(const std::string &source_path,
                                                   const std::string &stream_id,
                                                   int loop_count) const
{
    std::vector<std::string> command = build_command(source_path, stream_id, loop_count);
    if (command.empty() || command.front().empty())
        throw SupervisorError(ErrorKind::PROCESS_SPAWN_FAILURE, "relay command is empty");

    std::vector<gchar *> argv;
    argv.reserve(command.size() + 1);
    for (auto &arg : command)
        argv.push_back(const_cast<gchar *>(arg.c_str()));
    argv.push_back(nullptr);

    int flags = G_SPAWN_SEARCH_PATH | G_SPAWN_DO_NOT_REAP_CHILD;
    if (!Logger::get_instance()->is_enabled(Logger::Level::DEBUG))
        flags |= G_SPAWN_STDOUT_TO_DEV_NULL | G_SPAWN_STDERR_TO_DEV_NULL;

    GPid pid = 0;
    GError *error = nullptr;

    if (!g_spawn_async(nullptr, argv.data(), nullptr,
                       static_cast<GSpawnFlags>(flags),
                       enter_own_process_group, nullptr,
                       &pid, &error))
    {
        std::string message = error ? error->message : "unknown error";
        g_clear_error(&error);
        throw SupervisorError(ErrorKind::PROCESS_SPAWN_FAILURE,
                              "cannot launch relay for " + stream_id + ": " + message);
    }

    LOG_DEBUG("Spawned relay for " + stream_id + " (pid " + std::to_string(pid) +
              ", loop " + std::to_string(loop_count) + ")");

    return std::make_unique<ChildProcess>(pid, stream_id, loop_count);
}

void ProcessRunner::stop(ChildProcess &child) const
{
    if (!child.poll())
    {
        child.kill_group_remnants();
        return;
    }

    child.mark_stop_requested();
    child.signal_group(SIGTERM);

    const auto deadline = std::chrono::steady_clock::now() + grace_;
    while (child.poll())
    {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
        {
            LOG_WARNING("Relay of " + child.stream_id() + " (pid " +
                        std::to_string(child.pid()) + ") ignored SIGTERM, killing it");
            child.signal_group(SIGKILL);
            child.wait();
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(STOP_POLL_INTERVAL, remaining));
    }

    child.kill_group_remnants();
}

bool ProcessRunner::is_alive(ChildProcess &child) const
{
    return child.poll();
}
