#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "blocking_queue.h"

// 0 -> std::thread::hardware_concurrency() (at least 1); otherwise requested.
std::size_t resolve_thread_count(std::size_t requested);

// Fixed-size worker pool:
// - submit(...) returns std::future<R>
// - graceful shutdown in destructor (waits for queued tasks to finish)
// - exceptions thrown by a task are delivered through its future
class ThreadPool {
public:
    // 0 -> std::thread::hardware_concurrency() (at least 1)
    explicit ThreadPool(std::size_t thread_count = 0);
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    ~ThreadPool();

    // Submit any callable + args. Returns future of result type.
    template <class F, class... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>
    {
        using R = std::invoke_result_t<F, Args...>;

        if (!accepting_.load(std::memory_order_acquire)) {
            throw std::runtime_error("ThreadPool is not accepting new tasks (shutdown in progress)");
        }

        auto task_ptr = std::make_shared<std::packaged_task<R()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<R> fut = task_ptr->get_future();

        bool pushed = queue_.push([task_ptr]() {
            (*task_ptr)();
        });

        if (!pushed) {
            throw std::runtime_error("ThreadPool queue is closed");
        }

        return fut;
    }

    // Stops accepting new tasks, closes queue, waits workers.
    // Safe to call multiple times.
    void shutdown();

    std::size_t size() const { return workers_.size(); }

private:
    using Job = std::function<void()>;

    void worker_loop();

    std::vector<std::thread> workers_;
    BlockingQueue<Job> queue_;
    std::atomic<bool> accepting_{true};
};

// Run body(begin, end) over [0, count) split into contiguous chunks on the pool,
// then wait for every chunk. The first exception thrown by a chunk is rethrown
// after all chunks have finished.
// Must not be called from one of the pool's own workers.
template <class Body>
void parallel_for(ThreadPool& pool, std::size_t count, Body body) {
    if (count == 0) return;

    std::size_t chunks = std::max<std::size_t>(1, pool.size() * 4);
    std::size_t step = (count + chunks - 1) / chunks;
    if (step == 0) step = 1;

    std::vector<std::future<void>> futs;
    futs.reserve(chunks);
    for (std::size_t begin = 0; begin < count; begin += step) {
        std::size_t end = std::min(count, begin + step);
        futs.push_back(pool.submit([&body, begin, end]() { body(begin, end); }));
    }

    std::exception_ptr first;
    for (auto& f : futs) {
        try {
            f.get();
        } catch (...) {
            if (!first) first = std::current_exception();
        }
    }
    if (first) std::rethrow_exception(first);
}
