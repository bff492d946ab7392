#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include "concurrency/blocking_queue.h"
#include "concurrency/thread_pool.h"
#include "change_watcher.h"
#include "content_cache.h"
#include "filter_engine.h"
#include "regex_cache.h"
#include "substitution.h"
#include "text_file_index.h"

namespace core {

struct SessionConfig {
    std::size_t threads = 0;          // filter pool and index walk; 0 = hardware
    std::size_t cache_shards = 64;
    TextPredicate is_text;            // empty = looks_like_text
};

// Preview of one file: file.ok == false means the read failed and
// preview is empty.
struct PreviewResult {
    FileResult file;
    ContentPtr original;
    Preview preview;
};

// Facade over the index, caches, filter and substitution engines.
//
// Threading: queries (set_query, filter, preview, commit_*) and
// pump_invalidations are made from one query thread. The change watcher and
// notify_changed only enqueue paths; they are applied on the query thread at
// the start of filter, preview, commit_one and commit_all.
class ReplaceSession {
public:
    explicit ReplaceSession(SessionConfig cfg = {});
    ~ReplaceSession();

    ReplaceSession(const ReplaceSession&) = delete;
    ReplaceSession& operator=(const ReplaceSession&) = delete;

    // Walk root on the calling thread and install the result.
    FileIndexPtr build_index(const std::string& root, BuildStats* stats = nullptr);

    // Walk root on a background thread. Returns false if a load is
    // already in progress or the loader thread cannot be started.
    bool start_index_load(const std::string& root);

    // Installs a finished background load and returns true; false while
    // loading or when nothing was started.
    bool poll_index_load(BuildStats* stats = nullptr);

    bool is_loading() const { return loading_.load(); }

    // Rebuild from the current root. Cached contents are dropped too.
    FileIndexPtr refresh(BuildStats* stats = nullptr);

    FileIndexPtr index() const;
    std::string root() const;

    void set_query(const std::string& glob_query, const std::string& content_query);
    const std::string& glob_query() const { return glob_query_; }
    const std::string& content_query() const { return content_query_; }

    FileListPtr filter();

    PreviewResult preview(const std::string& path, const std::string& from_pattern,
                          const std::string& to_template);

    FileResult commit_one(const std::string& path, const std::string& from_pattern,
                          const std::string& to_template);

    std::vector<FileResult> commit_all(const std::vector<std::string>& paths,
                                       const std::string& from_pattern,
                                       const std::string& to_template);

    // Match spans of pattern in text (empty for a malformed pattern).
    std::vector<MatchSpan> find_matches(std::string_view text, const std::string& pattern);

    // Empty root = the installed index's root. False if the watch could not
    // be established; the session keeps working without it.
    bool start_watch(const std::string& root = "");
    void stop_watch();
    bool is_watching() const;

    // Same channel the watcher feeds.
    void notify_changed(const std::string& path);

    // Apply queued change events; returns the number applied.
    std::size_t pump_invalidations();

    CacheStats cache_stats() const { return contents_.stats(); }
    FilterStats filter_stats() const { return filter_.stats(); }
    std::size_t compiled_regexes() const { return regexes_.size(); }

private:
    struct LoadResult {
        FileIndexPtr index;
        BuildStats stats;
        std::string error;
    };

    void install_index_(FileIndexPtr idx);
    void join_loader_();

    SessionConfig cfg_;
    TextFileIndex indexer_;

    ThreadPool pool_;
    ContentCache contents_;
    RegexCache regexes_;
    FilterEngine filter_;
    SubstitutionEngine subst_;

    mutable std::shared_mutex index_mu_;
    FileIndexPtr index_;
    std::string root_;

    std::string glob_query_;
    std::string content_query_;

    BlockingQueue<std::string> events_;
    std::unique_ptr<ChangeWatcher> watcher_;

    std::thread loader_;
    std::atomic<bool> loading_{false};
    std::mutex load_mu_;
    std::optional<LoadResult> load_result_;
};

} // namespace core
