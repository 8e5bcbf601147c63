/**
 * @file directory_watcher.hpp
 * @brief Turns files appearing in and disappearing from the videos
 * directory into registry intents
 */

#ifndef DIRECTORY_WATCHER_HPP
#define DIRECTORY_WATCHER_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <gio/gio.h>

#include "app_setting.hpp"
#include "event_queue.hpp"
#include "stream_registry.hpp"

struct WatchEvent
{
    enum class Type
    {
        CREATED,
        REMOVED
    };

    Type type = Type::CREATED;
    std::string path;
};

/**
 * @class DirectoryWatcher
 * @brief Non-recursive watch of one directory with debounced, typed events
 *
 * Raw notifications (GFileMonitor in "notify" mode, snapshot diffs in
 * "poll" mode) only mark a path pending. Once a path has been quiet for
 * debounce_ms its presence on disk decides whether a Created or Removed
 * event is queued. A single dispatcher thread drains the queue into the
 * registry, so a copy that shows up as create, write and rename yields one
 * stream.
 *
 * The GLib sources are attached to @p context (the global default context
 * when null) and are only dispatched while a main loop runs on it.
 */
class DirectoryWatcher
{
public:
    DirectoryWatcher(const AppSettings &settings,
                     StreamRegistry &registry,
                     GMainContext *context = nullptr);
    ~DirectoryWatcher();

    DirectoryWatcher(const DirectoryWatcher &) = delete;
    DirectoryWatcher &operator=(const DirectoryWatcher &) = delete;

    /**
     * @brief Initial scan, then subscribe to changes and start dispatching
     * @return number of streams registered by the initial scan
     * @throw SupervisorError (WATCHER_FAILURE) if the directory cannot be
     * read or watched
     */
    size_t start();

    /**
     * @brief Unsubscribe, drain the queue and join the dispatcher
     *
     * Call from the thread that runs the context, or once its loop stopped.
     */
    void stop();

    bool running() const noexcept { return running_; }

    /** Recognized video files currently in the directory, sorted */
    std::vector<std::string> scan_directory() const;

    /** Mark @p path as changed; ignored unless it looks like a video file */
    void note_change(const std::string &path);

    /**
     * @brief Queue events for pending paths that have been quiet long enough
     * @return number of events queued
     */
    size_t flush_pending();

    size_t pending_count() const;

private:
    static void on_monitor_changed(GFileMonitor *monitor,
                                   GFile *file,
                                   GFile *other_file,
                                   GFileMonitorEvent event_type,
                                   gpointer user_data);
    static gboolean on_debounce_tick(gpointer user_data);
    static gboolean on_poll_tick(gpointer user_data);

    size_t initial_scan();
    void create_monitor();
    GSource *attach_timeout(guint interval_ms, GSourceFunc callback);
    void poll_directory();

    void dispatch_loop();
    void handle_event(const WatchEvent &event);

    AppSettings settings_;
    StreamRegistry &registry_;
    GMainContext *context_;

    GFileMonitor *monitor_{nullptr};
    GSource *debounce_source_{nullptr};
    GSource *poll_source_{nullptr};

    mutable std::mutex mtx_;
    std::map<std::string, std::chrono::steady_clock::time_point> pending_;
    std::set<std::string> known_;
    std::set<std::string> poll_snapshot_;

    EventQueue<WatchEvent> queue_;
    std::thread dispatcher_;
    bool running_ = false;
};

#endif // DIRECTORY_WATCHER_HPP
