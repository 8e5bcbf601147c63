/**
 * @file process_runner.hpp
 * @brief Launch, observe and terminate the external relay process of a stream
 */

#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

#include "app_setting.hpp"

/**
 * @brief How a child process ended
 */
struct ExitInfo
{
    bool exited = false;         // reaped
    bool signaled = false;       // terminated by a signal
    int code = 0;                // exit status when !signaled
    int signal = 0;              // signal number when signaled
    bool stop_requested = false; // the supervisor asked it to stop
};

/**
 * @class ChildProcess
 * @brief Handle owning one spawned relay process
 *
 * The child leads its own process group so that signals reach anything it
 * spawned. Destroying a handle whose child is still alive kills the group
 * and reaps it.
 */
class ChildProcess
{
public:
    ChildProcess(pid_t pid, const std::string &stream_id, int loop_count);
    ~ChildProcess();

    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    pid_t pid() const noexcept { return pid_; }
    const std::string &stream_id() const noexcept { return stream_id_; }
    int loop_count() const noexcept { return loop_count_; }
    std::chrono::system_clock::time_point started_at() const noexcept { return started_at_; }

    /**
     * @brief Non-blocking liveness check, reaps the child once it has exited
     * @return true while the child is running
     */
    bool poll();

    /** Blocks until the child has exited and is reaped */
    void wait();

    /** Send @p signo to the child's process group; false if already reaped */
    bool signal_group(int signo);

    /** SIGKILL whatever is left of the process group after the leader died */
    void kill_group_remnants();

    void mark_stop_requested();

    ExitInfo exit_info() const;

    /**
     * @brief Whether the child ended on its own in a way that was not expected
     *
     * Non-zero status, an unrequested signal, or any exit of an
     * infinite-loop relay counts as a crash. A finite relay exiting 0 has
     * simply finished.
     */
    bool crashed() const;

    std::string describe_exit() const;

private:
    void record_status_locked(int status);

    const pid_t pid_;
    const std::string stream_id_;
    const int loop_count_;
    const std::chrono::system_clock::time_point started_at_;

    mutable std::mutex mtx_;
    ExitInfo exit_;
};

/**
 * @class ProcessRunner
 * @brief Builds the relay command line and manages child lifetimes
 *
 * The command is an argv template in which {input}, {url}, {loop} and {id}
 * are substituted, so the encoder invocation can change without touching
 * the registry or the API.
 */
class ProcessRunner
{
public:
    explicit ProcessRunner(const AppSettings &settings);

    std::vector<std::string> build_command(const std::string &source_path,
                                           const std::string &stream_id,
                                           int loop_count) const;

    /**
     * @brief Spawn the relay for one stream; returns as soon as it runs
     * @throw SupervisorError (PROCESS_SPAWN_FAILURE) if it could not be launched
     */
    std::unique_ptr<ChildProcess> start(const std::string &source_path,
                                        const std::string &stream_id,
                                        int loop_count) const;

    /**
     * @brief SIGTERM, wait up to the grace period, then SIGKILL
     *
     * Returns once the child is reaped. No-op for a child that already exited.
     */
    void stop(ChildProcess &child) const;

    bool is_alive(ChildProcess &child) const;

    std::chrono::milliseconds grace_period() const noexcept { return grace_; }

private:
    AppSettings settings_;
    std::chrono::milliseconds grace_;
};

#endif // PROCESS_RUNNER_HPP
