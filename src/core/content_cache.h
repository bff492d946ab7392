#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

#include "concurrency/sharded_map.h"

namespace core {

using ContentPtr = std::shared_ptr<const std::string>;

struct CacheStats {
    std::size_t entries = 0;
    std::size_t hits = 0;
    std::size_t misses = 0;        // each miss is one disk read attempt
    std::size_t read_errors = 0;
    std::size_t invalidations = 0;
};

// path -> last-read file text. Read-through on miss; entries are dropped
// explicitly (watcher events, commits). A present entry reflects the bytes
// of the most recent read not followed by an invalidation.
// There is no size bound; invalidate_all() is the only bulk release.
class ContentCache {
public:
    explicit ContentCache(std::size_t shards = 64);

    ContentCache(const ContentCache&) = delete;
    ContentCache& operator=(const ContentCache&) = delete;

    // Cached content, or a fresh read on miss.
    // Returns nullptr on read failure (nothing is stored; *err describes it).
    ContentPtr get(const std::string& path, std::string* err = nullptr);

    // Cached content only; never touches the disk.
    ContentPtr peek(const std::string& path) const;

    // Remove one entry (no-op if absent).
    void invalidate(const std::string& path);

    void invalidate_all();

    CacheStats stats() const;

private:
    ShardedMap<ContentPtr> entries_;

    std::atomic<std::size_t> hits_{0};
    std::atomic<std::size_t> misses_{0};
    std::atomic<std::size_t> read_errors_{0};
    std::atomic<std::size_t> invalidations_{0};
};

} // namespace core
