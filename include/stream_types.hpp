/**
 * @file stream_types.hpp
 * @brief Stream record, operation result and error taxonomy shared by
 * the registry, the watcher and the control API
 */

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <sys/types.h>

enum class StreamStatus
{
    STOPPED,
    RUNNING
};

enum class ErrorKind
{
    NONE,
    NOT_FOUND,
    NAMING_COLLISION,
    PROCESS_SPAWN_FAILURE,
    PROCESS_CRASH,
    WATCHER_FAILURE,
    BAD_REQUEST,
    CONFIG_ERROR,
    LISTEN_FAILURE
};

/** "NotFound", "NamingCollision", ... as reported to API callers */
const char *error_kind_name(ErrorKind kind) noexcept;
const char *stream_status_name(StreamStatus status) noexcept;

/**
 * @brief Fatal supervisor failure carrying its taxonomy kind
 *
 * Raised for startup failures and by the process runner on spawn errors.
 * Per-stream operations of the registry never let it escape; they report
 * a StreamResult instead.
 */
class SupervisorError : public std::runtime_error
{
public:
    SupervisorError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Point-in-time copy of one stream's state
 */
struct StreamRecord
{
    std::string id;
    std::string source_path;
    StreamStatus status = StreamStatus::STOPPED;

    // -1 infinite, 0 play once, N play N+1 times
    int loop_count = -1;

    pid_t pid = 0;
    std::chrono::system_clock::time_point started_at{};
    std::string last_error;
};

/**
 * @brief Outcome of one registry operation for one stream id
 */
struct StreamResult
{
    std::string id;
    ErrorKind error = ErrorKind::NONE;
    std::string message;

    // Valid unless error is NOT_FOUND
    StreamRecord record;

    bool ok() const noexcept { return error == ErrorKind::NONE; }

    static StreamResult success(const StreamRecord &record)
    {
        StreamResult result;
        result.id = record.id;
        result.record = record;
        return result;
    }

    static StreamResult failure(const std::string &id, ErrorKind error,
                                const std::string &message)
    {
        StreamResult result;
        result.id = id;
        result.error = error;
        result.message = message;
        return result;
    }
};
