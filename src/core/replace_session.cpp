#include "replace_session.h"

#include <system_error>
#include <utility>

#include "utils/logging.h"

namespace core {

ReplaceSession::ReplaceSession(SessionConfig cfg)
    : cfg_(std::move(cfg)),
      indexer_(IndexConfig{cfg_.threads, cfg_.is_text}),
      pool_(cfg_.threads),
      contents_(cfg_.cache_shards),
      filter_(contents_, regexes_, pool_),
      subst_(contents_, regexes_, filter_) {}

ReplaceSession::~ReplaceSession() {
    stop_watch();
    join_loader_();
    events_.close();
}

FileIndexPtr ReplaceSession::build_index(const std::string& root, BuildStats* stats) {
    FileIndexPtr idx = indexer_.build(root, stats);
    install_index_(idx);
    return idx;
}

bool ReplaceSession::start_index_load(const std::string& root) {
    if (loading_.exchange(true)) {
        return false; // already running
    }

    // previous loader has finished; its result (if never polled) is replaced
    if (loader_.joinable()) loader_.join();
    {
        std::lock_guard<std::mutex> lk(load_mu_);
        load_result_.reset();
    }

    try {
        loader_ = std::thread([this, root]() {
            LoadResult res;
            try {
                res.index = indexer_.build(root, &res.stats);
            } catch (const std::exception& e) {
                res.error = e.what();
                LOG_ERROR(std::string("index load failed: ") + e.what());
            }

            {
                std::lock_guard<std::mutex> lk(load_mu_);
                load_result_ = std::move(res);
            }
            loading_.store(false);
        });
    } catch (const std::system_error& e) {
        loading_.store(false);
        LOG_ERROR(std::string("index load: cannot start loader thread: ") + e.what());
        return false;
    }

    LOG_DEBUG("index load started: root=" + root);
    return true;
}

bool ReplaceSession::poll_index_load(BuildStats* stats) {
    if (loading_.load()) return false;

    LoadResult res;
    {
        std::lock_guard<std::mutex> lk(load_mu_);
        if (!load_result_.has_value()) return false;
        res = std::move(*load_result_);
        load_result_.reset();
    }
    if (loader_.joinable()) loader_.join();

    if (stats) *stats = res.stats;
    if (!res.index) return false;

    install_index_(std::move(res.index));
    return true;
}

FileIndexPtr ReplaceSession::refresh(BuildStats* stats) {
    contents_.invalidate_all();
    return build_index(root(), stats);
}

FileIndexPtr ReplaceSession::index() const {
    std::shared_lock<std::shared_mutex> lock(index_mu_);
    return index_;
}

std::string ReplaceSession::root() const {
    std::shared_lock<std::shared_mutex> lock(index_mu_);
    return root_;
}

void ReplaceSession::install_index_(FileIndexPtr idx) {
    {
        std::unique_lock<std::shared_mutex> lock(index_mu_);
        root_ = idx->root;
        index_ = std::move(idx);
    }
    filter_.invalidate_memo();
}

void ReplaceSession::join_loader_() {
    if (loader_.joinable()) loader_.join();
}

void ReplaceSession::set_query(const std::string& glob_query, const std::string& content_query) {
    glob_query_ = glob_query;
    content_query_ = content_query;
}

FileListPtr ReplaceSession::filter() {
    pump_invalidations();
    return filter_.filter(index(), glob_query_, content_query_);
}

PreviewResult ReplaceSession::preview(const std::string& path, const std::string& from_pattern,
                                      const std::string& to_template) {
    pump_invalidations();

    PreviewResult r;
    r.file.path = path;

    std::string err;
    ContentPtr text = contents_.get(path, &err);
    if (!text) {
        r.file.kind = FileErrorKind::Read;
        r.file.error = err;
        return r;
    }

    r.original = text;
    r.preview = subst_.preview(*text, from_pattern, to_template);
    r.file.ok = true;
    r.file.replacements = r.preview.replacements;
    return r;
}

FileResult ReplaceSession::commit_one(const std::string& path, const std::string& from_pattern,
                                      const std::string& to_template) {
    pump_invalidations();
    return subst_.commit(path, from_pattern, to_template);
}

std::vector<FileResult> ReplaceSession::commit_all(const std::vector<std::string>& paths,
                                                   const std::string& from_pattern,
                                                   const std::string& to_template) {
    pump_invalidations();
    return subst_.commit_all(paths, from_pattern, to_template);
}

std::vector<MatchSpan> ReplaceSession::find_matches(std::string_view text, const std::string& pattern) {
    return subst_.matches(text, pattern);
}

bool ReplaceSession::start_watch(const std::string& root) {
    stop_watch();

    std::string dir = root.empty() ? this->root() : root;
    if (dir.empty()) {
        LOG_WARN("watch: no root to watch");
        return false;
    }

    auto w = std::make_unique<ChangeWatcher>();
    if (!w->start(dir, [this](const std::string& path) { events_.push(path); })) {
        return false;
    }
    watcher_ = std::move(w);
    return true;
}

void ReplaceSession::stop_watch() {
    if (!watcher_) return;
    watcher_->stop();
    watcher_.reset();
}

bool ReplaceSession::is_watching() const {
    return watcher_ && watcher_->is_running();
}

void ReplaceSession::notify_changed(const std::string& path) {
    events_.push(path);
}

std::size_t ReplaceSession::pump_invalidations() {
    std::vector<std::string> paths = events_.drain();
    if (paths.empty()) return 0;

    for (const auto& p : paths) {
        LOG_TRACE("invalidate: " + p);
        contents_.invalidate(p);
    }
    filter_.invalidate_memo();

    LOG_DEBUG("applied " + std::to_string(paths.size()) + " change events");
    return paths.size();
}

} // namespace core
