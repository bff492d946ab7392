#include "thread_pool.h"

#include <string>

#include "utils/logging.h"

std::size_t resolve_thread_count(std::size_t requested) {
    if (requested != 0) return requested;
    std::size_t hw = std::thread::hardware_concurrency();
    return hw != 0 ? hw : 1;
}

ThreadPool::ThreadPool(std::size_t thread_count) {
    const std::size_t n = resolve_thread_count(thread_count);

    workers_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        workers_.emplace_back(&ThreadPool::worker_loop, this);
    }
    LOG_TRACE("thread pool: started " + std::to_string(n) + " workers");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    bool expected = true;
    if (!accepting_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }

    // queued jobs still run; workers exit once the queue is empty
    queue_.close();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

void ThreadPool::worker_loop() {
    // Every job is a packaged_task wrapper, so a throwing task stores its
    // exception in its future and never unwinds through here.
    while (auto job = queue_.pop()) {
        (*job)();
    }
}
