// =================================================================
// include/Hotify/BatchDebouncer.hpp
// =================================================================
// Accumulates bursts of arriving files into batches that fire once the
// hot folder has been quiet for the settle delay.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

namespace Hotify {

/**
 * @brief Identifies a pending batch: (environment, hot-folder instance)
 */
using BatchKey = std::pair<std::string, std::string>;

/**
 * @brief A batch whose settle timer expired
 */
struct CompletedBatch {
    std::string environment;
    std::string instance;
    std::vector<std::string> files;  ///< Arrival order, without duplicates
};

/**
 * @brief Debounces file arrivals per (environment, instance) key
 *
 * Every arrival appends the file to its key's pending batch and restarts
 * that batch's deadline. A single timer thread sleeps until the earliest
 * deadline and flushes every batch whose deadline has passed. Each batch
 * has its own mutex, so arrivals for unrelated keys never wait on each
 * other beyond the short map lookup, and an arrival can never be lost to
 * a concurrent flush of the same key.
 *
 * Shutdown policy: stop() flushes every pending batch immediately by
 * default. When asked to drop them instead, the files stay in the hot
 * folder and are rediscovered by the initial scan of the next run.
 */
class BatchDebouncer {
public:
    using FlushCallback = std::function<void(CompletedBatch)>;

    /**
     * @brief Construct a debouncer
     * @param delay Quiet period after the last arrival before a batch fires
     * @param on_flush Receives every completed batch, called without locks held
     */
    BatchDebouncer(std::chrono::milliseconds delay, FlushCallback on_flush);

    ~BatchDebouncer();

    BatchDebouncer(const BatchDebouncer&) = delete;
    BatchDebouncer& operator=(const BatchDebouncer&) = delete;

    /**
     * @brief Start the timer thread. Does nothing if already running.
     */
    void start();

    /**
     * @brief Stop the timer thread
     * @param flush_pending Emit outstanding batches (true) or drop them (false)
     * @return Number of batches flushed or dropped
     */
    size_t stop(bool flush_pending = true);

    /**
     * @brief Record the arrival of a file and restart the key's settle timer
     * @param environment Environment name
     * @param instance Hot-folder instance
     * @param file_path Arrived file
     * @return False if the debouncer is not running and the file was not recorded
     */
    bool addFile(const std::string& environment, const std::string& instance, const std::string& file_path);

    /**
     * @brief Emit every pending batch now, regardless of its deadline
     * @return Number of batches emitted
     */
    size_t flushAll();

    size_t pendingBatchCount() const;

    /**
     * @brief True when no batch is pending and no flush callback is running
     */
    bool isIdle() const;

    /**
     * @brief Files currently accumulated for a key
     */
    std::vector<std::string> pendingFiles(const std::string& environment, const std::string& instance) const;

    std::chrono::milliseconds getDelay() const { return m_delay; }

    bool isRunning() const { return m_running.load(); }

private:
    struct PendingBatch {
        std::mutex mutex;
        std::vector<std::string> files;
        std::unordered_set<std::string> seen;
        std::chrono::steady_clock::time_point deadline;
        bool closed = false;
    };

    /**
     * @brief Timer thread: flush expired batches, then sleep until the next deadline
     */
    void timerLoop();

    /**
     * @brief Close and remove batches from the live set
     * @param force Take every batch regardless of its deadline
     * @return The batches taken
     * @pre m_map_mutex is held
     */
    std::vector<CompletedBatch> takeBatches(std::chrono::steady_clock::time_point now, bool force,
                                            std::chrono::steady_clock::time_point* next_deadline);

    void emit(std::vector<CompletedBatch> batches);

    const std::chrono::milliseconds m_delay;
    FlushCallback m_on_flush;

    mutable std::mutex m_map_mutex;
    std::condition_variable m_cv;
    std::map<BatchKey, std::shared_ptr<PendingBatch>> m_pending;

    std::atomic<size_t> m_emitting{0};  ///< Batches taken but not yet handed to the callback
    std::atomic<bool> m_running{false};
    std::thread m_timer_thread;
};

} // namespace Hotify
