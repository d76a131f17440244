// =================================================================
// src/Hotify/HotFolderEngine.cpp
// =================================================================
// Implementation for the hot-folder dispatcher.

#include "Hotify/HotFolderEngine.hpp"
#include "Hotify/Errors.hpp"
#include "Hotify/Logger.hpp"
#include <stdexcept>

namespace Hotify {

namespace {

// Decrements the active task count when a worker leaves, however it leaves
class ActiveTaskGuard {
public:
    ActiveTaskGuard(std::mutex& mutex, size_t& active, std::condition_variable& idle_cv)
        : m_mutex(mutex), m_active(active), m_idle_cv(idle_cv) {}

    ~ActiveTaskGuard() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_active;
        }
        m_idle_cv.notify_all();
    }

private:
    std::mutex& m_mutex;
    size_t& m_active;
    std::condition_variable& m_idle_cv;
};

} // namespace

HotFolderEngine::HotFolderEngine(EnvironmentRegistryPtr registry, const EngineOptions& options,
                                 OutputPathResolver resolver, std::shared_ptr<SysInteraction> sys)
    : m_registry(registry),
      m_options(options),
      m_router(registry),
      m_renderer(std::move(resolver)),
      m_executor(std::move(sys), options.cleanup_inputs),
      m_debouncer(options.batch_delay, [this](CompletedBatch batch) { onBatchSettled(std::move(batch)); })
{
}

HotFolderEngine::~HotFolderEngine() {
    shutdown();
}

void HotFolderEngine::start() {
    if (m_shut_down.load()) {
        throw std::logic_error("HotFolderEngine cannot be restarted after shutdown");
    }
    m_debouncer.start();
    m_accepting.store(true);
    
    Logger::getInstance().info("Engine", "Engine started",
        "Environments: " + std::to_string(m_registry->size()) +
        ", Batch delay: " + std::to_string(m_options.batch_delay.count()) + "ms" +
        ", Cleanup: " + (m_options.cleanup_inputs ? "on" : "off"));
}

bool HotFolderEngine::onFileAppeared(const FileEvent& event) {
    if (!m_accepting.load()) {
        LOG_DEBUG("Engine", "Not accepting events, ignoring: " + event.path);
        return false;
    }
    
    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.events_received++;
    }
    
    const Environment* environment = m_router.route(event.path, event.hot_folder);
    if (environment == nullptr) {
        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_stats.unmatched_files++;
        }
        Logger::getInstance().logUnmatched(event.path);
        return false;
    }
    
    const std::string instance = event.instance.empty() ? event.hot_folder : event.instance;
    LOG_DEBUG(environment->getName(), "File arrived (" + triggerModeName(environment->getMode()) + "): " + event.path);
    
    if (environment->getMode() == TriggerMode::Batch) {
        if (!m_debouncer.addFile(environment->getName(), instance, event.path)) {
            LOG_WARNING("Engine", "Debouncer stopped, file left in place: " + event.path);
            return false;
        }
        return true;
    }
    
    dispatch(*environment, RenderContext::forFile(event.path), instance);
    return true;
}

void HotFolderEngine::onBatchSettled(CompletedBatch batch) {
    const Environment* environment = m_registry->find(batch.environment);
    if (environment == nullptr) {
        LOG_ERROR("Engine", "Settled batch for unknown environment '" + batch.environment + "'");
        return;
    }
    
    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.batches_flushed++;
    }
    dispatch(*environment, RenderContext::forBatch(batch.files), batch.instance);
}

void HotFolderEngine::dispatch(const Environment& environment, RenderContext context, const std::string& instance) {
    std::lock_guard<std::mutex> lock(m_tasks_mutex);
    reapFinishedTasks();
    
    m_active_tasks++;
    try {
        m_tasks.push_back(std::async(std::launch::async,
            [this, &environment, context = std::move(context), instance]() {
                ActiveTaskGuard guard(m_tasks_mutex, m_active_tasks, m_idle_cv);
                runInvocation(environment, context, instance);
            }));
    } catch (const std::system_error& e) {
        m_active_tasks--;
        Logger::getInstance().error(environment.getName(), "Failed to start worker task: " + std::string(e.what()),
                                    instance);
    }
}

void HotFolderEngine::runInvocation(const Environment& environment, const RenderContext& context,
                                    const std::string& instance) {
    // Serialize invocations of the same (environment, instance)
    auto key_lock_mutex = keyMutex(BatchKey(environment.getName(), instance));
    std::lock_guard<std::mutex> key_lock(*key_lock_mutex);
    
    CommandInvocation invocation;
    try {
        invocation = m_renderer.render(environment, context, instance);
    } catch (const ConfigurationError& e) {
        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_stats.render_errors++;
        }
        Logger::getInstance().error(environment.getName(), "Invocation aborted: " + std::string(e.what()),
                                    errorKindName(e.kind()));
        return;
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_stats.render_errors++;
        }
        Logger::getInstance().error(environment.getName(), "Invocation aborted: " + std::string(e.what()));
        return;
    }
    
    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.invocations_started++;
    }
    Logger::getInstance().logInvocation(environment.getName(), invocation);
    
    auto start_time = std::chrono::steady_clock::now();
    ExecutionResult result;
    try {
        result = m_executor.execute(invocation);
    } catch (const std::exception& e) {
        result.state = InvocationState::Failed;
        result.reason = std::string("unexpected error: ") + e.what();
    }
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    
    Logger::getInstance().logExecutionResult(environment.getName(), result, static_cast<long>(duration.count()));
    
    ResultObserver observer;
    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        if (result.succeeded()) {
            m_stats.invocations_succeeded++;
        } else {
            m_stats.invocations_failed++;
        }
        m_stats.cleanup_errors += result.cleanup_errors.size();
        observer = m_result_observer;
    }
    
    if (observer) {
        observer(invocation, result);
    }
}

std::shared_ptr<std::mutex> HotFolderEngine::keyMutex(const BatchKey& key) {
    std::lock_guard<std::mutex> lock(m_key_mutexes_mutex);
    auto& slot = m_key_mutexes[key];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

void HotFolderEngine::reapFinishedTasks() {
    for (auto it = m_tasks.begin(); it != m_tasks.end();) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            try {
                it->get();
            } catch (const std::exception& e) {
                LOG_ERROR("Engine", "Worker task failed: " + std::string(e.what()));
            }
            it = m_tasks.erase(it);
        } else {
            ++it;
        }
    }
}

void HotFolderEngine::waitIdle() {
    std::unique_lock<std::mutex> lock(m_tasks_mutex);
    for (;;) {
        m_idle_cv.wait(lock, [this]() { return m_active_tasks == 0; });
        
        // A settling batch turns into a task later; keep waiting for it
        if (m_debouncer.isIdle() && m_active_tasks == 0) {
            break;
        }
        m_idle_cv.wait_for(lock, std::chrono::milliseconds(20));
    }
    reapFinishedTasks();
}

void HotFolderEngine::shutdown() {
    if (m_shut_down.exchange(true)) {
        return;
    }
    m_accepting.store(false);
    
    // Pending batches are flushed, not dropped
    m_debouncer.stop(true);
    
    std::list<std::future<void>> tasks;
    {
        std::unique_lock<std::mutex> lock(m_tasks_mutex);
        m_idle_cv.wait(lock, [this]() { return m_active_tasks == 0; });
        tasks.swap(m_tasks);
    }
    for (auto& task : tasks) {
        task.wait();
    }
    
    EngineStats stats = getStats();
    Logger::getInstance().info("Engine", "Engine stopped",
        "Invocations: " + std::to_string(stats.invocations_started) +
        ", Succeeded: " + std::to_string(stats.invocations_succeeded) +
        ", Failed: " + std::to_string(stats.invocations_failed) +
        ", Unmatched: " + std::to_string(stats.unmatched_files));
}

EngineStats HotFolderEngine::getStats() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_stats;
}

void HotFolderEngine::setResultObserver(ResultObserver observer) {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    m_result_observer = std::move(observer);
}

} // namespace Hotify
