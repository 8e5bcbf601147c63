#include "directory_watcher.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <system_error>

#include "logger.hpp"
#include "stream_name.hpp"
#include "stream_types.hpp"

namespace fs = std::filesystem;

namespace
{
    constexpr guint MIN_DEBOUNCE_TICK_MS = 50;

    // Same spelling GFile reports: absolute, no "." / ".." and no trailing '/'
    std::string normalize_dir(const std::string &dir)
    {
        std::error_code ec;
        fs::path path = fs::absolute(dir, ec);
        if (ec)
            path = dir;

        std::string normal = path.lexically_normal().string();
        while (normal.size() > 1 && normal.back() == '/')
            normal.pop_back();
        return normal;
    }
}

DirectoryWatcher::DirectoryWatcher(const AppSettings &settings,
                                   StreamRegistry &registry,
                                   GMainContext *context)
    : settings_(settings),
      registry_(registry),
      context_(context ? g_main_context_ref(context) : nullptr),
      queue_(static_cast<size_t>(settings.event_queue_capacity))
{
    settings_.videos_dir = normalize_dir(settings.videos_dir);
}

DirectoryWatcher::~DirectoryWatcher()
{
    stop();
    if (context_)
        g_main_context_unref(context_);
}

std::vector<std::string> DirectoryWatcher::scan_directory() const
{
    std::vector<std::string> files;

    std::error_code ec;
    fs::directory_iterator it(settings_.videos_dir, ec);
    if (ec)
        throw SupervisorError(ErrorKind::WATCHER_FAILURE,
                              "cannot read " + settings_.videos_dir + ": " + ec.message());

    for (fs::directory_iterator end; !ec && it != end; it.increment(ec))
    {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec))
            continue;

        std::string path = it->path().string();
        if (is_video_file(path, settings_.video_extensions))
            files.push_back(path);
    }
    if (ec)
        throw SupervisorError(ErrorKind::WATCHER_FAILURE,
                              "cannot read " + settings_.videos_dir + ": " + ec.message());

    std::sort(files.begin(), files.end());
    return files;
}

size_t DirectoryWatcher::initial_scan()
{
    LOG_INFO("Scanning " + settings_.videos_dir + " for video files...");

    std::vector<std::string> files = scan_directory();
    size_t registered = 0;

    for (const auto &path : files)
    {
        StreamResult result = registry_.upsert(path);
        if (result.ok())
            ++registered;

        std::lock_guard<std::mutex> lock(mtx_);
        known_.insert(path);
        poll_snapshot_.insert(path);
    }

    LOG_INFO("Found " + std::to_string(registered) + " streams in " + settings_.videos_dir);
    return registered;
}

GSource *DirectoryWatcher::attach_timeout(guint interval_ms, GSourceFunc callback)
{
    GSource *source = g_timeout_source_new(interval_ms);
    g_source_set_callback(source, callback, this, nullptr);
    g_source_attach(source, context_);
    return source;
}

void DirectoryWatcher::create_monitor()
{
    GFile *dir = g_file_new_for_path(settings_.videos_dir.c_str());
    GError *error = nullptr;

    // Signals are emitted on the thread-default context at creation time
    g_main_context_push_thread_default(context_);
    monitor_ = g_file_monitor_directory(dir, G_FILE_MONITOR_WATCH_MOVES, nullptr, &error);
    g_main_context_pop_thread_default(context_);
    g_object_unref(dir);

    if (!monitor_)
    {
        std::string message = error ? error->message : "unknown error";
        g_clear_error(&error);
        throw SupervisorError(ErrorKind::WATCHER_FAILURE,
                              "cannot watch " + settings_.videos_dir + ": " + message);
    }

    g_signal_connect(monitor_, "changed", G_CALLBACK(DirectoryWatcher::on_monitor_changed), this);
}

size_t DirectoryWatcher::start()
{
    if (running_)
        return 0;

    size_t registered = initial_scan();

    if (settings_.watch_mode == "poll")
    {
        poll_source_ = attach_timeout(static_cast<guint>(settings_.poll_interval_ms),
                                      DirectoryWatcher::on_poll_tick);
        LOG_INFO("Watching " + settings_.videos_dir + " for changes (polling every " +
                 std::to_string(settings_.poll_interval_ms) + " ms)");
    }
    else
    {
        create_monitor();
        LOG_INFO("Watching " + settings_.videos_dir + " for changes");
    }

    guint tick = std::max(MIN_DEBOUNCE_TICK_MS, static_cast<guint>(settings_.debounce_ms / 4));
    debounce_source_ = attach_timeout(tick, DirectoryWatcher::on_debounce_tick);

    dispatcher_ = std::thread(&DirectoryWatcher::dispatch_loop, this);
    running_ = true;
    return registered;
}

void DirectoryWatcher::stop()
{
    if (monitor_)
    {
        g_signal_handlers_disconnect_by_data(monitor_, this);
        g_file_monitor_cancel(monitor_);
        g_object_unref(monitor_);
        monitor_ = nullptr;
    }
    for (GSource **source : {&poll_source_, &debounce_source_})
    {
        if (*source)
        {
            g_source_destroy(*source);
            g_source_unref(*source);
            *source = nullptr;
        }
    }

    queue_.close();
    if (dispatcher_.joinable())
        dispatcher_.join();

    if (running_)
        LOG_INFO("Stopped watching " + settings_.videos_dir);
    running_ = false;
}

void DirectoryWatcher::note_change(const std::string &path)
{
    if (!is_video_file(path, settings_.video_extensions))
        return;

    std::lock_guard<std::mutex> lock(mtx_);
    pending_[path] = std::chrono::steady_clock::now();
}

size_t DirectoryWatcher::pending_count() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return pending_.size();
}

size_t DirectoryWatcher::flush_pending()
{
    const auto quiet_since = std::chrono::steady_clock::now() -
                             std::chrono::milliseconds(settings_.debounce_ms);

    std::vector<WatchEvent> events;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto it = pending_.begin(); it != pending_.end();)
        {
            if (it->second > quiet_since)
            {
                ++it;
                continue;
            }

            const std::string &path = it->first;
            bool present = g_file_test(path.c_str(), G_FILE_TEST_IS_REGULAR);
            bool known = known_.count(path) > 0;

            if (present && !known)
            {
                events.push_back({WatchEvent::Type::CREATED, path});
                known_.insert(path);
            }
            else if (!present && known)
            {
                events.push_back({WatchEvent::Type::REMOVED, path});
                known_.erase(path);
            }
            it = pending_.erase(it);
        }
    }

    size_t queued = 0;
    for (auto &event : events)
    {
        if (queue_.push(std::move(event)))
            ++queued;
    }
    return queued;
}

void DirectoryWatcher::poll_directory()
{
    std::vector<std::string> files;
    try
    {
        files = scan_directory();
    }
    catch (const SupervisorError &e)
    {
        LOG_ERROR(std::string("Error scanning directory: ") + e.what());
        return;
    }

    std::set<std::string> current(files.begin(), files.end());
    std::vector<std::string> changed;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::set_symmetric_difference(current.begin(), current.end(),
                                      poll_snapshot_.begin(), poll_snapshot_.end(),
                                      std::back_inserter(changed));
        poll_snapshot_.swap(current);
    }

    for (const auto &path : changed)
        note_change(path);
}

void DirectoryWatcher::on_monitor_changed(GFileMonitor *,
                                          GFile *file,
                                          GFile *other_file,
                                          GFileMonitorEvent event_type,
                                          gpointer user_data)
{
    auto *self = static_cast<DirectoryWatcher *>(user_data);

    switch (event_type)
    {
    case G_FILE_MONITOR_EVENT_CREATED:
    case G_FILE_MONITOR_EVENT_DELETED:
    case G_FILE_MONITOR_EVENT_CHANGED:
    case G_FILE_MONITOR_EVENT_CHANGES_DONE_HINT:
    case G_FILE_MONITOR_EVENT_MOVED_IN:
    case G_FILE_MONITOR_EVENT_MOVED_OUT:
    case G_FILE_MONITOR_EVENT_RENAMED:
        break;
    default:
        return;
    }

    for (GFile *f : {file, other_file})
    {
        if (!f)
            continue;
        gchar *path = g_file_get_path(f);
        if (path)
        {
            self->note_change(path);
            g_free(path);
        }
    }
}

gboolean DirectoryWatcher::on_debounce_tick(gpointer user_data)
{
    static_cast<DirectoryWatcher *>(user_data)->flush_pending();
    return G_SOURCE_CONTINUE;
}

gboolean DirectoryWatcher::on_poll_tick(gpointer user_data)
{
    static_cast<DirectoryWatcher *>(user_data)->poll_directory();
    return G_SOURCE_CONTINUE;
}

void DirectoryWatcher::dispatch_loop()
{
    WatchEvent event;
    while (queue_.pop(event))
    {
        try
        {
            handle_event(event);
        }
        catch (const std::exception &e)
        {
            LOG_ERROR("Failed to handle change of " + event.path + ": " + e.what());
        }
    }
}

void DirectoryWatcher::handle_event(const WatchEvent &event)
{
    const std::string name = base_filename(event.path);

    if (event.type == WatchEvent::Type::CREATED)
    {
        LOG_INFO("Video added: " + name);
        StreamResult added = registry_.upsert(event.path);
        if (!added.ok())
            return;

        StreamResult started = registry_.start(added.id, -1);
        if (!started.ok())
            LOG_WARNING("Stream " + added.id + " not started: " + started.message);
        return;
    }

    LOG_INFO("Video removed: " + name);
    StreamResult removed = registry_.remove(event.path);
    if (!removed.ok())
        LOG_DEBUG(removed.message);
}
