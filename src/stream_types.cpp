#include "stream_types.hpp"

const char *error_kind_name(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::NONE:                  return "None";
    case ErrorKind::NOT_FOUND:             return "NotFound";
    case ErrorKind::NAMING_COLLISION:      return "NamingCollision";
    case ErrorKind::PROCESS_SPAWN_FAILURE: return "ProcessSpawnFailure";
    case ErrorKind::PROCESS_CRASH:         return "ProcessCrash";
    case ErrorKind::WATCHER_FAILURE:       return "WatcherFailure";
    case ErrorKind::BAD_REQUEST:           return "BadRequest";
    case ErrorKind::CONFIG_ERROR:          return "ConfigError";
    case ErrorKind::LISTEN_FAILURE:        return "ListenFailure";
    }
    return "Unknown";
}

const char *stream_status_name(StreamStatus status) noexcept
{
    return status == StreamStatus::RUNNING ? "running" : "stopped";
}
