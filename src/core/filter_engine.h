#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "content_cache.h"
#include "regex_cache.h"
#include "text_file_index.h"

class ThreadPool;

namespace core {

using FileList = std::vector<std::string>;
using FileListPtr = std::shared_ptr<const FileList>;

struct FilterStats {
    std::size_t recomputations = 0;
    std::size_t memo_hits = 0;
    std::size_t fast_path = 0;
};

// Glob include/exclude plus content-regex filtering over a FileIndex,
// memoized on the exact (glob query, content query) pair.
class FilterEngine {
public:
    FilterEngine(ContentCache& contents, RegexCache& regexes, ThreadPool& pool);

    FilterEngine(const FilterEngine&) = delete;
    FilterEngine& operator=(const FilterEngine&) = delete;

    // Ordered subset of index->paths. With both queries blank the index's own
    // list is returned; an unchanged query returns the memoized list object.
    FileListPtr filter(const FileIndexPtr& index,
                       const std::string& glob_query,
                       const std::string& content_query);

    // Drop the memo (watcher event, commit, new index).
    void invalidate_memo();

    bool has_memo() const;

    FilterStats stats() const;

private:
    struct Memo {
        std::string glob_query;
        std::string content_query;
        FileListPtr files;
    };

    FileListPtr recompute_(const FileIndex& index,
                           const std::string& glob_query,
                           const std::string& content_query);

    ContentCache& contents_;
    RegexCache& regexes_;
    ThreadPool& pool_;

    mutable std::shared_mutex memo_mu_;
    std::optional<Memo> memo_;

    std::atomic<std::size_t> recomputations_{0};
    std::atomic<std::size_t> memo_hits_{0};
    std::atomic<std::size_t> fast_path_{0};
};

} // namespace core
