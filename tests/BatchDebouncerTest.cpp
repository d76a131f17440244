// =================================================================
// tests/BatchDebouncerTest.cpp
// =================================================================
// Unit tests for BatchDebouncer component.

#include "Hotify/BatchDebouncer.hpp"
#include <iostream>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class BatchDebouncerTest {
private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<Hotify::CompletedBatch> m_flushed;
    
    Hotify::BatchDebouncer::FlushCallback collector() {
        return [this](Hotify::CompletedBatch batch) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_flushed.push_back(std::move(batch));
            }
            m_cv.notify_all();
        };
    }
    
    bool waitForBatches(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [&]() { return m_flushed.size() >= count; });
    }
    
    size_t flushedCount() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_flushed.size();
    }
    
    void reset() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_flushed.clear();
    }
    
public:
    void testBurstBecomesOneBatch() {
        std::cout << "Testing a burst settles into one batch..." << std::endl;
        reset();
        
        Hotify::BatchDebouncer debouncer(300ms, collector());
        debouncer.start();
        
        assert(debouncer.addFile("images", "images", "/h/images/1.jpg"));
        std::this_thread::sleep_for(50ms);
        assert(debouncer.addFile("images", "images", "/h/images/2.jpg"));
        std::this_thread::sleep_for(50ms);
        assert(debouncer.addFile("images", "images", "/h/images/3.jpg"));
        
        assert(debouncer.pendingBatchCount() == 1);
        assert(debouncer.pendingFiles("images", "images").size() == 3);
        assert(flushedCount() == 0 && "Nothing fires while files keep arriving");
        
        assert(waitForBatches(1, 3000ms));
        std::this_thread::sleep_for(400ms);
        assert(flushedCount() == 1 && "Exactly one batch for the burst");
        
        const auto& batch = m_flushed[0];
        assert(batch.environment == "images");
        assert(batch.instance == "images");
        assert(batch.files.size() == 3);
        assert(batch.files[0] == "/h/images/1.jpg" && batch.files[2] == "/h/images/3.jpg" &&
               "Arrival order is preserved");
        assert(debouncer.isIdle());
        
        debouncer.stop();
        std::cout << "✓ Burst test passed" << std::endl;
    }
    
    void testEachArrivalRestartsTheTimer() {
        std::cout << "Testing the timer restarts on every arrival..." << std::endl;
        reset();
        
        Hotify::BatchDebouncer debouncer(400ms, collector());
        debouncer.start();
        
        auto started = std::chrono::steady_clock::now();
        for (int i = 0; i < 5; i++) {
            debouncer.addFile("e", "e", "/f" + std::to_string(i));
            std::this_thread::sleep_for(150ms);
        }
        // 750ms elapsed; a fixed timer would already have fired
        assert(flushedCount() == 0);
        
        assert(waitForBatches(1, 3000ms));
        auto elapsed = std::chrono::steady_clock::now() - started;
        assert(elapsed >= 600ms + 400ms - 50ms);
        assert(m_flushed[0].files.size() == 5);
        
        debouncer.stop();
        std::cout << "✓ Timer restart test passed" << std::endl;
    }
    
    void testGapSplitsBatches() {
        std::cout << "Testing a quiet gap splits batches..." << std::endl;
        reset();
        
        Hotify::BatchDebouncer debouncer(200ms, collector());
        debouncer.start();
        
        debouncer.addFile("e", "e", "/first/a");
        debouncer.addFile("e", "e", "/first/b");
        assert(waitForBatches(1, 3000ms));
        
        debouncer.addFile("e", "e", "/second/c");
        assert(waitForBatches(2, 3000ms));
        
        assert(m_flushed[0].files.size() == 2);
        assert(m_flushed[1].files.size() == 1);
        assert(m_flushed[1].files[0] == "/second/c");
        
        debouncer.stop();
        std::cout << "✓ Gap split test passed" << std::endl;
    }
    
    void testKeysAreIndependent() {
        std::cout << "Testing independent keys..." << std::endl;
        reset();
        
        Hotify::BatchDebouncer debouncer(250ms, collector());
        debouncer.start();
        
        debouncer.addFile("images", "images", "/a.jpg");
        debouncer.addFile("scans", "scans", "/b.tif");
        debouncer.addFile("images", "images/sub", "/sub/c.jpg");
        assert(debouncer.pendingBatchCount() == 3);
        
        assert(waitForBatches(3, 3000ms));
        size_t total_files = 0;
        for (const auto& batch : m_flushed) {
            assert(batch.files.size() == 1);
            total_files += batch.files.size();
        }
        assert(total_files == 3);
        
        debouncer.stop();
        std::cout << "✓ Independent key test passed" << std::endl;
    }
    
    void testDuplicatesIgnored() {
        std::cout << "Testing duplicate arrivals..." << std::endl;
        reset();
        
        Hotify::BatchDebouncer debouncer(150ms, collector());
        debouncer.start();
        
        debouncer.addFile("e", "e", "/same");
        debouncer.addFile("e", "e", "/other");
        debouncer.addFile("e", "e", "/same");
        
        assert(waitForBatches(1, 3000ms));
        assert(m_flushed[0].files.size() == 2);
        assert(m_flushed[0].files[0] == "/same");
        assert(m_flushed[0].files[1] == "/other");
        
        debouncer.stop();
        std::cout << "✓ Duplicate test passed" << std::endl;
    }
    
    void testZeroDelay() {
        std::cout << "Testing zero settle delay..." << std::endl;
        reset();
        
        Hotify::BatchDebouncer debouncer(0ms, collector());
        debouncer.start();
        debouncer.addFile("e", "e", "/now");
        assert(waitForBatches(1, 2000ms));
        
        debouncer.stop();
        std::cout << "✓ Zero delay test passed" << std::endl;
    }
    
    void testStopFlushesPending() {
        std::cout << "Testing stop flushes pending batches..." << std::endl;
        reset();
        
        Hotify::BatchDebouncer debouncer(10s, collector());
        debouncer.start();
        debouncer.addFile("e", "one", "/1");
        debouncer.addFile("e", "two", "/2");
        
        assert(debouncer.stop(true) == 2);
        assert(flushedCount() == 2 && "Flushed synchronously on stop");
        assert(!debouncer.isRunning());
        assert(!debouncer.addFile("e", "one", "/3") && "Arrivals after stop are refused");
        assert(debouncer.isIdle());
        
        std::cout << "✓ Stop flush test passed" << std::endl;
    }
    
    void testStopCanDropPending() {
        std::cout << "Testing stop can drop pending batches..." << std::endl;
        reset();
        
        Hotify::BatchDebouncer debouncer(10s, collector());
        debouncer.start();
        debouncer.addFile("e", "e", "/1");
        
        assert(debouncer.stop(false) == 1);
        assert(flushedCount() == 0);
        assert(debouncer.isIdle());
        
        std::cout << "✓ Stop drop test passed" << std::endl;
    }
    
    void testFlushAll() {
        std::cout << "Testing flushAll..." << std::endl;
        reset();
        
        Hotify::BatchDebouncer debouncer(10s, collector());
        debouncer.start();
        debouncer.addFile("e", "e", "/1");
        assert(debouncer.flushAll() == 1);
        assert(flushedCount() == 1);
        assert(debouncer.pendingBatchCount() == 0);
        
        debouncer.addFile("e", "e", "/2");
        assert(debouncer.pendingFiles("e", "e").size() == 1 && "A new batch starts after a flush");
        
        debouncer.stop(false);
        std::cout << "✓ flushAll test passed" << std::endl;
    }
    
    void testConcurrentArrivalsAreNeverLost() {
        std::cout << "Testing concurrent arrivals..." << std::endl;
        reset();
        
        Hotify::BatchDebouncer debouncer(5ms, collector());
        debouncer.start();
        
        const int kThreads = 4;
        const int kFilesPerThread = 200;
        std::vector<std::thread> producers;
        for (int t = 0; t < kThreads; t++) {
            producers.emplace_back([&debouncer, t]() {
                for (int i = 0; i < kFilesPerThread; i++) {
                    debouncer.addFile("e", "e", "/t" + std::to_string(t) + "/" + std::to_string(i));
                    if (i % 25 == 0) {
                        std::this_thread::sleep_for(10ms);
                    }
                }
            });
        }
        for (auto& producer : producers) {
            producer.join();
        }
        debouncer.stop(true);
        
        size_t total = 0;
        for (const auto& batch : m_flushed) {
            total += batch.files.size();
        }
        assert(total == static_cast<size_t>(kThreads * kFilesPerThread) && "Every arrival lands in exactly one batch");
        
        std::cout << "✓ Concurrent arrival test passed" << std::endl;
    }
    
    void testInvalidConstruction() {
        std::cout << "Testing invalid construction..." << std::endl;
        
        bool threw = false;
        try {
            Hotify::BatchDebouncer debouncer(-1ms, collector());
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        
        threw = false;
        try {
            Hotify::BatchDebouncer debouncer(1ms, nullptr);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        
        Hotify::BatchDebouncer idle(1ms, collector());
        assert(!idle.addFile("e", "e", "/x") && "Arrivals before start are refused");
        
        std::cout << "✓ Invalid construction test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "=== Running BatchDebouncer Tests ===" << std::endl;
        
        testBurstBecomesOneBatch();
        testEachArrivalRestartsTheTimer();
        testGapSplitsBatches();
        testKeysAreIndependent();
        testDuplicatesIgnored();
        testZeroDelay();
        testStopFlushesPending();
        testStopCanDropPending();
        testFlushAll();
        testConcurrentArrivalsAreNeverLost();
        testInvalidConstruction();
        
        std::cout << "All BatchDebouncer tests passed!" << std::endl;
    }
};

int main() {
    try {
        BatchDebouncerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
