// =================================================================
// include/Hotify/HotFolderEngine.hpp
// =================================================================
// The dispatcher: turns file events into rendered, executed invocations.

#pragma once

#include "Hotify/BatchDebouncer.hpp"
#include "Hotify/CommandExecutor.hpp"
#include "Hotify/Environment.hpp"
#include "Hotify/FileEvent.hpp"
#include "Hotify/PatternRouter.hpp"
#include "Hotify/SysInteraction.hpp"
#include "Hotify/TemplateRenderer.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>

namespace Hotify {

/**
 * @brief Process-wide engine tunables
 */
struct EngineOptions {
    std::chrono::milliseconds batch_delay{5000};  ///< Settle delay for batch environments
    bool cleanup_inputs = false;                  ///< Delete consumed inputs after success
};

/**
 * @brief Counters for the lifetime of the engine
 */
struct EngineStats {
    size_t events_received = 0;
    size_t unmatched_files = 0;
    size_t batches_flushed = 0;
    size_t invocations_started = 0;
    size_t invocations_succeeded = 0;
    size_t invocations_failed = 0;
    size_t render_errors = 0;
    size_t cleanup_errors = 0;
};

/**
 * @brief Routes file events and runs the resulting invocations
 *
 * Single-file environments fire a worker task per event. Batch
 * environments hand the event to the debouncer, whose settled batches
 * enter the same render-and-execute path. Worker tasks for different
 * (environment, instance) keys run concurrently; tasks for the same key
 * are serialized so they cannot race on the same out_file.
 */
class HotFolderEngine {
public:
    using ResultObserver = std::function<void(const CommandInvocation&, const ExecutionResult&)>;

    /**
     * @brief Construct the engine
     * @param registry Immutable environment registry
     * @param options Engine tunables
     * @param resolver Derives out_file when a chain references it
     * @param sys System access for the executor
     */
    HotFolderEngine(EnvironmentRegistryPtr registry, const EngineOptions& options,
                    OutputPathResolver resolver,
                    std::shared_ptr<SysInteraction> sys = std::make_shared<SysInteraction>());

    ~HotFolderEngine();

    HotFolderEngine(const HotFolderEngine&) = delete;
    HotFolderEngine& operator=(const HotFolderEngine&) = delete;

    /**
     * @brief Start the batch timer. Events are rejected before start().
     */
    void start();

    /**
     * @brief Handle one "file appeared" event
     * @param event The complete file and the hot folder it arrived in
     * @return False if the file was unmatched or the engine is not accepting events
     */
    bool onFileAppeared(const FileEvent& event);

    /**
     * @brief Block until no batch is pending and no invocation is running
     */
    void waitIdle();

    /**
     * @brief Stop accepting events, flush pending batches and wait for every invocation
     */
    void shutdown();

    EngineStats getStats() const;

    /**
     * @brief Observe every executed invocation (called from worker threads)
     */
    void setResultObserver(ResultObserver observer);

    const PatternRouter& getRouter() const { return m_router; }
    const EngineOptions& getOptions() const { return m_options; }

private:
    /**
     * @brief Launch a worker task for one invocation
     */
    void dispatch(const Environment& environment, RenderContext context, const std::string& instance);

    /**
     * @brief Worker body: render, execute and record one invocation under its key lock
     */
    void runInvocation(const Environment& environment, const RenderContext& context,
                       const std::string& instance);

    void onBatchSettled(CompletedBatch batch);

    std::shared_ptr<std::mutex> keyMutex(const BatchKey& key);

    /**
     * @brief Drop futures of tasks that have finished
     * @pre m_tasks_mutex is held
     */
    void reapFinishedTasks();

    EnvironmentRegistryPtr m_registry;
    EngineOptions m_options;
    PatternRouter m_router;
    TemplateRenderer m_renderer;
    CommandExecutor m_executor;
    BatchDebouncer m_debouncer;

    std::mutex m_key_mutexes_mutex;
    std::map<BatchKey, std::shared_ptr<std::mutex>> m_key_mutexes;

    std::mutex m_tasks_mutex;
    std::condition_variable m_idle_cv;
    std::list<std::future<void>> m_tasks;
    size_t m_active_tasks = 0;

    std::atomic<bool> m_accepting{false};
    std::atomic<bool> m_shut_down{false};

    mutable std::mutex m_stats_mutex;
    EngineStats m_stats;
    ResultObserver m_result_observer;
};

} // namespace Hotify
