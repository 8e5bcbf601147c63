#ifndef STREAM_REGISTRY_HPP
#define STREAM_REGISTRY_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "app_setting.hpp"
#include "process_runner.hpp"
#include "stream_types.hpp"


/**
 * @class StreamRegistry
 * @brief The single authority over stream state and relay processes
 *
 * Operations on one stream id run one at a time, in the order they were
 * accepted; operations on different ids run in parallel. Spawning and
 * stopping a relay only hold the stream's turn, never the table lock, so a
 * slow stop of one stream does not block list() or any other stream.
 *
 * Per-stream failures come back as StreamResult values; nothing in here
 * throws for a single stream's problem.
 */
class StreamRegistry
{
public:
    explicit StreamRegistry(const AppSettings &settings);

    // Stops every relay still running
    ~StreamRegistry();

    StreamRegistry(const StreamRegistry &) = delete;
    StreamRegistry &operator=(const StreamRegistry &) = delete;

    /**
     * @brief Register the file at @p source_path as a stopped stream
     *
     * Registering the same path again is a no-op. A different path whose
     * name sanitizes to an id already taken fails with NAMING_COLLISION and
     * leaves the first mapping in place.
     */
    StreamResult upsert(const std::string &source_path);

    /**
     * @brief Stop the stream backed by @p source_path, then forget it
     *
     * Returns after its relay has exited. A path that is not the registered
     * source of its id is reported as NOT_FOUND and changes nothing.
     */
    StreamResult remove(const std::string &source_path);

    StreamResult start(const std::string &id, int loop_count);
    StreamResult stop(const std::string &id);

    /** Stop (if running) and start again with @p loop_count in one turn */
    StreamResult restart(const std::string &id, int loop_count);

    StreamResult get(const std::string &id) const;

    /** Start every stopped stream with the loop count it last used */
    std::vector<StreamResult> start_all();

    /** Stop every running stream concurrently */
    std::vector<StreamResult> stop_all();

    /**
     * @brief Bring recorded status in line with relay liveness
     *
     * Streams with an operation in flight are skipped; that operation
     * reconciles them itself.
     * @return number of streams whose status changed
     */
    size_t reconcile();

    /** Snapshots ordered by id */
    std::vector<StreamRecord> list() const;

    size_t size() const;

    const AppSettings &settings() const noexcept { return settings_; }

private:
    struct Entry;
    class Turn;

    enum class ExitOutcome
    {
        NONE,
        FINISHED,
        CRASHED
    };

    std::shared_ptr<Entry> accept(const std::string &id, uint64_t &ticket);

    template <typename Op>
    StreamResult with_turn(const std::string &id, Op &&op);

    ExitOutcome reconcile_entry(Entry &entry);
    StreamResult do_start(Entry &entry, int loop_count);
    StreamResult do_stop(Entry &entry);

    static StreamRecord snapshot(Entry &entry);
    static StreamResult not_found(const std::string &id);

    AppSettings settings_;
    ProcessRunner runner_;

    mutable std::mutex table_mtx_;
    std::map<std::string, std::shared_ptr<Entry>> streams_;
};

#endif // STREAM_REGISTRY_HPP
