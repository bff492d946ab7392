#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace core {

// Called on the watcher thread, once per create/modify event.
using ChangeCallback = std::function<void(const std::string& path)>;

// Recursive create/modify watcher over one root (Linux inotify).
// Directories created after start() are watched as they appear.
// On platforms without inotify, start() returns false.
class ChangeWatcher {
public:
    ChangeWatcher();
    ~ChangeWatcher();

    ChangeWatcher(const ChangeWatcher&) = delete;
    ChangeWatcher& operator=(const ChangeWatcher&) = delete;

    // Returns false (and logs a warning) if the watch cannot be set up;
    // callers keep working without change notifications.
    bool start(const std::string& root, ChangeCallback on_change);

    // Blocks until the background thread has exited. Idempotent.
    void stop();

    bool is_running() const { return running_.load(); }

    std::size_t watched_directories() const;

private:
    void watch_loop_();
    bool add_watch_(const std::string& dir);
    void add_watches_recursive_(const std::string& dir);
    void handle_events_(const char* buf, long len);
    void close_fds_();

    int inotify_fd_ = -1;
    int pipe_fd_[2] = {-1, -1};  // self-pipe to wake the loop on stop()

    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex mu_;
    std::unordered_map<int, std::string> wd_to_dir_;
    std::unordered_set<std::string> watched_dirs_;

    ChangeCallback on_change_;
};

} // namespace core
