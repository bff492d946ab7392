#include "change_watcher.h"

#include <filesystem>
#include <system_error>

#include "utils/logging.h"

#ifdef __linux__
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>
#endif

namespace core {

namespace fs = std::filesystem;

#ifdef __linux__
namespace {
// IN_MOVED_TO covers rename-over saves; deletes and moves away are not reported.
constexpr std::uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_MOVED_TO | IN_ONLYDIR;
constexpr std::uint32_t kReported = IN_CREATE | IN_MODIFY | IN_MOVED_TO;
constexpr std::size_t kEventBufferSize = 64 * 1024;
} // namespace
#endif

ChangeWatcher::ChangeWatcher() = default;

ChangeWatcher::~ChangeWatcher() {
    stop();
}

std::size_t ChangeWatcher::watched_directories() const {
    std::lock_guard<std::mutex> lock(mu_);
    return watched_dirs_.size();
}

#ifdef __linux__

bool ChangeWatcher::start(const std::string& root, ChangeCallback on_change) {
    if (running_.load()) {
        LOG_WARN("watcher: already running");
        return false;
    }

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        LOG_WARN(std::string("watcher: inotify unavailable: ") + std::strerror(errno));
        return false;
    }
    if (pipe2(pipe_fd_, O_CLOEXEC) != 0) {
        LOG_WARN(std::string("watcher: pipe failed: ") + std::strerror(errno));
        close_fds_();
        return false;
    }

    on_change_ = std::move(on_change);

    if (!add_watch_(root)) {
        LOG_WARN("watcher: cannot watch " + root + "; changes will not be noticed until refresh");
        close_fds_();
        return false;
    }
    add_watches_recursive_(root);

    running_.store(true);
    thread_ = std::thread(&ChangeWatcher::watch_loop_, this);

    LOG_INFO("watcher: watching " + std::to_string(watched_directories()) +
             " directories under " + root);
    return true;
}

void ChangeWatcher::stop() {
    if (thread_.joinable()) {
        char b = 1;
        if (::write(pipe_fd_[1], &b, 1) != 1) {
            LOG_WARN(std::string("watcher: wake-up write failed: ") + std::strerror(errno));
        }
        thread_.join();
    }
    running_.store(false);
    close_fds_();

    std::lock_guard<std::mutex> lock(mu_);
    wd_to_dir_.clear();
    watched_dirs_.clear();
}

void ChangeWatcher::close_fds_() {
    if (inotify_fd_ >= 0) ::close(inotify_fd_);
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
    inotify_fd_ = -1;
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;
}

bool ChangeWatcher::add_watch_(const std::string& dir) {
    std::lock_guard<std::mutex> lock(mu_);
    if (watched_dirs_.count(dir)) return true;

    int wd = inotify_add_watch(inotify_fd_, dir.c_str(), kWatchMask);
    if (wd < 0) {
        if (errno == ENOSPC) {
            LOG_WARN("watcher: inotify watch limit reached at " + dir);
        } else {
            LOG_DEBUG("watcher: cannot watch " + dir + ": " + std::strerror(errno));
        }
        return false;
    }

    wd_to_dir_[wd] = dir;
    watched_dirs_.insert(dir);
    return true;
}

void ChangeWatcher::add_watches_recursive_(const std::string& dir) {
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) return;

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        std::error_code sec;
        if (fs::is_directory(it->symlink_status(sec)) && !sec) {
            add_watch_(it->path().string());
        }
    }
}

void ChangeWatcher::watch_loop_() {
    alignas(inotify_event) char buf[kEventBufferSize];

    pollfd fds[2];
    fds[0] = pollfd{inotify_fd_, POLLIN, 0};
    fds[1] = pollfd{pipe_fd_[0], POLLIN, 0};

    while (running_.load()) {
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR(std::string("watcher: poll failed: ") + std::strerror(errno));
            break;
        }

        if (fds[1].revents & POLLIN) break;
        if (!(fds[0].revents & POLLIN)) continue;

        while (true) {
            ssize_t n = ::read(inotify_fd_, buf, sizeof(buf));
            if (n > 0) {
                handle_events_(buf, (long)n);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && errno != EAGAIN) {
                LOG_ERROR(std::string("watcher: read failed: ") + std::strerror(errno));
            }
            break;
        }
    }

    LOG_DEBUG("watcher: loop exited");
}

void ChangeWatcher::handle_events_(const char* buf, long len) {
    const char* p = buf;
    const char* end = buf + len;

    while (p < end) {
        const auto* ev = reinterpret_cast<const inotify_event*>(p);
        p += sizeof(inotify_event) + ev->len;

        if (ev->mask & IN_Q_OVERFLOW) {
            LOG_WARN("watcher: event queue overflow; some changes were missed");
            continue;
        }

        if (ev->mask & IN_IGNORED) {
            std::lock_guard<std::mutex> lock(mu_);
            auto it = wd_to_dir_.find(ev->wd);
            if (it != wd_to_dir_.end()) {
                watched_dirs_.erase(it->second);
                wd_to_dir_.erase(it);
            }
            continue;
        }

        if (!(ev->mask & kReported)) continue;

        std::string dir;
        {
            std::lock_guard<std::mutex> lock(mu_);
            auto it = wd_to_dir_.find(ev->wd);
            if (it == wd_to_dir_.end()) continue;
            dir = it->second;
        }

        std::string path = ev->len > 0 ? (fs::path(dir) / ev->name).string() : dir;

        if ((ev->mask & (IN_CREATE | IN_MOVED_TO)) && (ev->mask & IN_ISDIR)) {
            add_watch_(path);
            add_watches_recursive_(path);
        }

        if (!on_change_) continue;
        try {
            on_change_(path);
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("watcher: change handler failed for ") + path + ": " + e.what());
        }
    }
}

#else

bool ChangeWatcher::start(const std::string& root, ChangeCallback) {
    LOG_WARN("watcher: file watching is not supported on this platform; not watching " + root);
    return false;
}

void ChangeWatcher::stop() {
    running_.store(false);
}

void ChangeWatcher::watch_loop_() {}
bool ChangeWatcher::add_watch_(const std::string&) { return false; }
void ChangeWatcher::add_watches_recursive_(const std::string&) {}
void ChangeWatcher::handle_events_(const char*, long) {}
void ChangeWatcher::close_fds_() {}

#endif

} // namespace core
