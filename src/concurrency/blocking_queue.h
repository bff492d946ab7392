#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

// MPMC FIFO channel. Used as the pool's job queue and as the watcher ->
// session invalidation channel.
//
// Once closed, push() is refused and blocked consumers wake up; items already
// queued can still be popped or drained.
template <typename T>
class BlockingQueue {
public:
    BlockingQueue() = default;
    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    // false when closed; the item is dropped.
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (closed_) return false;
            items_.push_back(std::move(item));
        }
        ready_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mu_);
        return take_front_();
    }

    // Waits for an item; nullopt only after close() with nothing left.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mu_);
        ready_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return take_front_();
    }

    // Like pop() but gives up after `timeout`.
    template <class Rep, class Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mu_);
        ready_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        return take_front_();
    }

    // Everything queued right now, oldest first. Never blocks.
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mu_);
        std::vector<T> out;
        out.reserve(items_.size());
        for (auto& item : items_) out.push_back(std::move(item));
        items_.clear();
        return out;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mu_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return items_.size();
    }

private:
    // caller holds mu_
    std::optional<T> take_front_() {
        if (items_.empty()) return std::nullopt;
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    mutable std::mutex mu_;
    std::condition_variable ready_;
    std::deque<T> items_;
    bool closed_ = false;
};
