// =================================================================
// src/Hotify/BatchDebouncer.cpp
// =================================================================
// Implementation for per-key batch debouncing.

#include "Hotify/BatchDebouncer.hpp"
#include "Hotify/Logger.hpp"
#include <stdexcept>

namespace Hotify {

BatchDebouncer::BatchDebouncer(std::chrono::milliseconds delay, FlushCallback on_flush)
    : m_delay(delay),
      m_on_flush(std::move(on_flush))
{
    if (m_delay.count() < 0) {
        throw std::invalid_argument("Batch settle delay must not be negative");
    }
    if (!m_on_flush) {
        throw std::invalid_argument("BatchDebouncer requires a flush callback");
    }
}

BatchDebouncer::~BatchDebouncer() {
    stop(false);
}

void BatchDebouncer::start() {
    std::lock_guard<std::mutex> lock(m_map_mutex);
    if (m_running.load()) {
        return;
    }
    m_running.store(true);
    m_timer_thread = std::thread(&BatchDebouncer::timerLoop, this);
    
    LOG_DEBUG("Debouncer", "Started with " + std::to_string(m_delay.count()) + "ms settle delay");
}

size_t BatchDebouncer::stop(bool flush_pending) {
    {
        std::lock_guard<std::mutex> lock(m_map_mutex);
        m_running.store(false);
    }
    m_cv.notify_all();
    
    if (m_timer_thread.joinable()) {
        m_timer_thread.join();
    }
    
    std::vector<CompletedBatch> remaining;
    {
        std::lock_guard<std::mutex> lock(m_map_mutex);
        remaining = takeBatches(std::chrono::steady_clock::now(), true, nullptr);
    }
    
    const size_t count = remaining.size();
    if (flush_pending) {
        if (count > 0) {
            Logger::getInstance().info("Debouncer", "Flushing pending batches on shutdown",
                                       "Batches: " + std::to_string(count));
        }
        emit(std::move(remaining));
    } else {
        for (const auto& batch : remaining) {
            Logger::getInstance().warning("Debouncer", "Dropping pending batch on shutdown",
                batch.environment + "/" + batch.instance + ", files: " + std::to_string(batch.files.size()));
        }
        m_emitting -= count;
    }
    return count;
}

bool BatchDebouncer::addFile(const std::string& environment, const std::string& instance,
                             const std::string& file_path) {
    const BatchKey key(environment, instance);
    
    for (;;) {
        std::shared_ptr<PendingBatch> batch;
        {
            std::lock_guard<std::mutex> lock(m_map_mutex);
            if (!m_running.load()) {
                return false;
            }
            auto& slot = m_pending[key];
            if (!slot) {
                slot = std::make_shared<PendingBatch>();
            }
            batch = slot;
        }
        
        {
            std::lock_guard<std::mutex> lock(batch->mutex);
            if (batch->closed) {
                // Flushed between lookup and lock; start a fresh batch
                continue;
            }
            if (batch->seen.insert(file_path).second) {
                batch->files.push_back(file_path);
            } else {
                LOG_DEBUG("Debouncer", "Ignoring duplicate arrival: " + file_path);
            }
            batch->deadline = std::chrono::steady_clock::now() + m_delay;
        }
        
        m_cv.notify_all();
        return true;
    }
}

size_t BatchDebouncer::flushAll() {
    std::vector<CompletedBatch> batches;
    {
        std::lock_guard<std::mutex> lock(m_map_mutex);
        batches = takeBatches(std::chrono::steady_clock::now(), true, nullptr);
    }
    const size_t count = batches.size();
    emit(std::move(batches));
    return count;
}

size_t BatchDebouncer::pendingBatchCount() const {
    std::lock_guard<std::mutex> lock(m_map_mutex);
    return m_pending.size();
}

bool BatchDebouncer::isIdle() const {
    std::lock_guard<std::mutex> lock(m_map_mutex);
    return m_pending.empty() && m_emitting.load() == 0;
}

std::vector<std::string> BatchDebouncer::pendingFiles(const std::string& environment,
                                                      const std::string& instance) const {
    std::shared_ptr<PendingBatch> batch;
    {
        std::lock_guard<std::mutex> lock(m_map_mutex);
        auto it = m_pending.find(BatchKey(environment, instance));
        if (it == m_pending.end()) {
            return {};
        }
        batch = it->second;
    }
    std::lock_guard<std::mutex> lock(batch->mutex);
    return batch->files;
}

void BatchDebouncer::timerLoop() {
    std::unique_lock<std::mutex> lock(m_map_mutex);
    
    while (m_running.load()) {
        auto next_deadline = std::chrono::steady_clock::time_point::max();
        auto ready = takeBatches(std::chrono::steady_clock::now(), false, &next_deadline);
        
        if (!ready.empty()) {
            lock.unlock();
            emit(std::move(ready));
            lock.lock();
            continue;
        }
        
        if (next_deadline == std::chrono::steady_clock::time_point::max()) {
            m_cv.wait(lock);
        } else {
            m_cv.wait_until(lock, next_deadline);
        }
    }
}

std::vector<CompletedBatch> BatchDebouncer::takeBatches(std::chrono::steady_clock::time_point now, bool force,
                                                        std::chrono::steady_clock::time_point* next_deadline) {
    std::vector<CompletedBatch> taken;
    
    for (auto it = m_pending.begin(); it != m_pending.end();) {
        // Keep the batch alive while its mutex is held across erase()
        std::shared_ptr<PendingBatch> holder = it->second;
        std::lock_guard<std::mutex> batch_lock(holder->mutex);
        PendingBatch& batch = *holder;
        
        if (force || batch.deadline <= now) {
            batch.closed = true;
            if (!batch.files.empty()) {
                taken.push_back(CompletedBatch{it->first.first, it->first.second, std::move(batch.files)});
            }
            it = m_pending.erase(it);
        } else {
            if (next_deadline != nullptr && batch.deadline < *next_deadline) {
                *next_deadline = batch.deadline;
            }
            ++it;
        }
    }
    
    m_emitting += taken.size();
    return taken;
}

void BatchDebouncer::emit(std::vector<CompletedBatch> batches) {
    for (auto& batch : batches) {
        Logger::getInstance().debug("Debouncer", "Batch settled",
            batch.environment + "/" + batch.instance + ", files: " + std::to_string(batch.files.size()));
        try {
            m_on_flush(std::move(batch));
        } catch (const std::exception& e) {
            Logger::getInstance().error("Debouncer", "Flush callback failed: " + std::string(e.what()));
        }
        --m_emitting;
    }
}

} // namespace Hotify
