#include "stream_registry.hpp"

#include <condition_variable>
#include <future>
#include <utility>

#include "logger.hpp"
#include "stream_name.hpp"

/*
 * Every operation takes a ticket under the table lock when it is accepted
 * and runs when that ticket is served. next_ticket/serving, removed, record
 * and process are guarded by Entry::mtx; process is only touched by the
 * holder of the current turn.
 */
struct StreamRegistry::Entry
{
    explicit Entry(StreamRecord initial) : record(std::move(initial)) {}

    std::mutex mtx;
    std::condition_variable cv;
    uint64_t next_ticket = 0;
    uint64_t serving = 0;
    bool removed = false;

    StreamRecord record;
    std::unique_ptr<ChildProcess> process;
};

class StreamRegistry::Turn
{
public:
    Turn(std::shared_ptr<Entry> entry, uint64_t ticket)
        : entry_(std::move(entry))
    {
        std::unique_lock<std::mutex> lock(entry_->mtx);
        entry_->cv.wait(lock, [&] { return entry_->serving == ticket; });
        removed_ = entry_->removed;
    }

    ~Turn()
    {
        {
            std::lock_guard<std::mutex> lock(entry_->mtx);
            ++entry_->serving;
        }
        entry_->cv.notify_all();
    }

    Turn(const Turn &) = delete;
    Turn &operator=(const Turn &) = delete;

    bool removed() const noexcept { return removed_; }

private:
    std::shared_ptr<Entry> entry_;
    bool removed_ = false;
};

StreamRegistry::StreamRegistry(const AppSettings &settings)
    : settings_(settings),
      runner_(settings)
{
}

StreamRegistry::~StreamRegistry()
{
    stop_all();
}

StreamResult StreamRegistry::not_found(const std::string &id)
{
    return StreamResult::failure(id, ErrorKind::NOT_FOUND, "Stream not found: " + id);
}

StreamRecord StreamRegistry::snapshot(Entry &entry)
{
    std::lock_guard<std::mutex> lock(entry.mtx);
    return entry.record;
}

std::shared_ptr<StreamRegistry::Entry> StreamRegistry::accept(const std::string &id, uint64_t &ticket)
{
    std::lock_guard<std::mutex> table_lock(table_mtx_);
    auto it = streams_.find(id);
    if (it == streams_.end())
        return nullptr;

    std::lock_guard<std::mutex> lock(it->second->mtx);
    ticket = it->second->next_ticket++;
    return it->second;
}

template <typename Op>
StreamResult StreamRegistry::with_turn(const std::string &id, Op &&op)
{
    uint64_t ticket = 0;
    std::shared_ptr<Entry> entry = accept(id, ticket);
    if (!entry)
        return not_found(id);

    Turn turn(entry, ticket);
    if (turn.removed())
        return not_found(id);

    reconcile_entry(*entry);
    return op(*entry);
}

StreamRegistry::ExitOutcome StreamRegistry::reconcile_entry(Entry &entry)
{
    std::unique_ptr<ChildProcess> finished;
    ExitOutcome outcome = ExitOutcome::NONE;

    {
        std::lock_guard<std::mutex> lock(entry.mtx);
        if (!entry.process || runner_.is_alive(*entry.process))
            return ExitOutcome::NONE;

        finished = std::move(entry.process);
        entry.record.status = StreamStatus::STOPPED;
        entry.record.pid = 0;

        if (finished->crashed())
        {
            outcome = ExitOutcome::CRASHED;
            entry.record.last_error = std::string(error_kind_name(ErrorKind::PROCESS_CRASH)) +
                                      ": relay " + finished->describe_exit();
        }
        else
        {
            outcome = ExitOutcome::FINISHED;
            entry.record.last_error.clear();
        }
    }

    if (outcome == ExitOutcome::CRASHED)
        LOG_ERROR("Relay of " + finished->stream_id() + " crashed: " + finished->describe_exit());
    else
        LOG_INFO("Process ended: " + finished->stream_id() + " (" + finished->describe_exit() + ")");

    return outcome;
}

StreamResult StreamRegistry::do_start(Entry &entry, int loop_count)
{
    std::string id;
    std::string source_path;
    {
        std::lock_guard<std::mutex> lock(entry.mtx);
        if (entry.record.status == StreamStatus::RUNNING)
        {
            LOG_DEBUG("Stream already running: " + entry.record.id);
            return StreamResult::success(entry.record);
        }
        id = entry.record.id;
        source_path = entry.record.source_path;
    }

    std::unique_ptr<ChildProcess> child;
    try
    {
        child = runner_.start(source_path, id, loop_count);
    }
    catch (const SupervisorError &e)
    {
        LOG_ERROR(std::string("Failed to start stream ") + id + ": " + e.what());
        std::lock_guard<std::mutex> lock(entry.mtx);
        entry.record.last_error = std::string(error_kind_name(e.kind())) + ": " + e.what();
        entry.record.loop_count = loop_count;
        StreamResult result = StreamResult::failure(id, e.kind(), e.what());
        result.record = entry.record;
        return result;
    }

    StreamRecord record;
    {
        std::lock_guard<std::mutex> lock(entry.mtx);
        entry.record.status = StreamStatus::RUNNING;
        entry.record.loop_count = loop_count;
        entry.record.pid = child->pid();
        entry.record.started_at = child->started_at();
        entry.record.last_error.clear();
        entry.process = std::move(child);
        record = entry.record;
    }

    LOG_INFO("Now playing " + settings_.rtsp_public_url(id) +
             " (loop " + std::to_string(loop_count) + ")");
    return StreamResult::success(record);
}

StreamResult StreamRegistry::do_stop(Entry &entry)
{
    std::unique_ptr<ChildProcess> child;
    {
        std::lock_guard<std::mutex> lock(entry.mtx);
        if (!entry.process)
        {
            entry.record.status = StreamStatus::STOPPED;
            return StreamResult::success(entry.record);
        }
        child = std::move(entry.process);
    }

    // Record still reads RUNNING while the relay winds down
    runner_.stop(*child);

    StreamRecord record;
    {
        std::lock_guard<std::mutex> lock(entry.mtx);
        entry.record.status = StreamStatus::STOPPED;
        entry.record.pid = 0;
        entry.record.last_error.clear();
        record = entry.record;
    }

    LOG_INFO("Stopped stream: " + record.id);
    return StreamResult::success(record);
}

StreamResult StreamRegistry::upsert(const std::string &source_path)
{
    const std::string id = sanitize_stream_name(source_path);

    std::lock_guard<std::mutex> table_lock(table_mtx_);
    auto it = streams_.find(id);
    if (it != streams_.end())
    {
        StreamRecord existing = snapshot(*it->second);
        if (existing.source_path == source_path)
            return StreamResult::success(existing);

        std::string message = source_path + " maps to stream id '" + id +
                              "' already used by " + existing.source_path;
        LOG_ERROR("Naming collision: " + message + "; skipping");

        StreamResult result = StreamResult::failure(id, ErrorKind::NAMING_COLLISION, message);
        result.record = existing;
        return result;
    }

    StreamRecord record;
    record.id = id;
    record.source_path = source_path;
    record.status = StreamStatus::STOPPED;
    record.loop_count = -1;

    streams_.emplace(id, std::make_shared<Entry>(record));
    LOG_INFO("Discovered stream " + id + " <- " + source_path);
    return StreamResult::success(record);
}

StreamResult StreamRegistry::remove(const std::string &source_path)
{
    const std::string id = sanitize_stream_name(source_path);

    uint64_t ticket = 0;
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> table_lock(table_mtx_);
        auto it = streams_.find(id);
        if (it == streams_.end())
            return not_found(id);

        std::lock_guard<std::mutex> lock(it->second->mtx);
        if (it->second->record.source_path != source_path)
        {
            return StreamResult::failure(id, ErrorKind::NOT_FOUND,
                                         source_path + " is not the source of stream " + id);
        }
        ticket = it->second->next_ticket++;
        entry = it->second;
    }

    Turn turn(entry, ticket);
    if (turn.removed())
        return not_found(id);

    reconcile_entry(*entry);
    StreamResult stopped = do_stop(*entry);

    {
        std::lock_guard<std::mutex> table_lock(table_mtx_);
        auto it = streams_.find(id);
        if (it != streams_.end() && it->second == entry)
            streams_.erase(it);
    }
    {
        std::lock_guard<std::mutex> lock(entry->mtx);
        entry->removed = true;
    }

    LOG_INFO("Removed stream " + id);
    return stopped;
}

StreamResult StreamRegistry::start(const std::string &id, int loop_count)
{
    return with_turn(id, [&](Entry &entry) { return do_start(entry, loop_count); });
}

StreamResult StreamRegistry::stop(const std::string &id)
{
    return with_turn(id, [&](Entry &entry) { return do_stop(entry); });
}

StreamResult StreamRegistry::restart(const std::string &id, int loop_count)
{
    return with_turn(id, [&](Entry &entry) {
        StreamResult stopped = do_stop(entry);
        if (!stopped.ok())
            return stopped;
        return do_start(entry, loop_count);
    });
}

StreamResult StreamRegistry::get(const std::string &id) const
{
    std::lock_guard<std::mutex> table_lock(table_mtx_);
    auto it = streams_.find(id);
    if (it == streams_.end())
        return not_found(id);
    return StreamResult::success(snapshot(*it->second));
}

std::vector<StreamResult> StreamRegistry::start_all()
{
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> table_lock(table_mtx_);
        for (const auto &item : streams_)
            ids.push_back(item.first);
    }

    std::vector<StreamResult> results;
    results.reserve(ids.size());

    for (const auto &id : ids)
    {
        results.push_back(with_turn(id, [&](Entry &entry) {
            int loop_count = -1;
            {
                std::lock_guard<std::mutex> lock(entry.mtx);
                loop_count = entry.record.loop_count;
            }
            return do_start(entry, loop_count);
        }));
    }
    return results;
}

std::vector<StreamResult> StreamRegistry::stop_all()
{
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> table_lock(table_mtx_);
        for (const auto &item : streams_)
            ids.push_back(item.first);
    }

    std::vector<std::future<StreamResult>> pending;
    pending.reserve(ids.size());
    for (const auto &id : ids)
        pending.push_back(std::async(std::launch::async, [this, id] { return stop(id); }));

    std::vector<StreamResult> results;
    results.reserve(ids.size());
    for (auto &f : pending)
        results.push_back(f.get());
    return results;
}

size_t StreamRegistry::reconcile()
{
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> table_lock(table_mtx_);
        for (const auto &item : streams_)
            entries.push_back(item.second);
    }

    size_t changed = 0;
    for (auto &entry : entries)
    {
        uint64_t ticket = 0;
        {
            std::lock_guard<std::mutex> lock(entry->mtx);
            if (entry->serving != entry->next_ticket || entry->removed)
                continue;
            ticket = entry->next_ticket++;
        }

        Turn turn(entry, ticket);
        ExitOutcome outcome = reconcile_entry(*entry);
        if (outcome == ExitOutcome::NONE)
            continue;
        ++changed;

        if (outcome == ExitOutcome::CRASHED && settings_.restart_on_crash)
        {
            StreamRecord record = snapshot(*entry);
            if (record.loop_count < 0)
            {
                LOG_WARNING("Restarting crashed stream " + record.id);
                do_start(*entry, record.loop_count);
            }
        }
    }
    return changed;
}

std::vector<StreamRecord> StreamRegistry::list() const
{
    std::lock_guard<std::mutex> table_lock(table_mtx_);

    std::vector<StreamRecord> records;
    records.reserve(streams_.size());
    for (const auto &item : streams_)
        records.push_back(snapshot(*item.second));
    return records;
}

size_t StreamRegistry::size() const
{
    std::lock_guard<std::mutex> table_lock(table_mtx_);
    return streams_.size();
}
