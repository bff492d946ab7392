#include "content_cache.h"

#include "text_io.h"
#include "utils/logging.h"

namespace core {

ContentCache::ContentCache(std::size_t shards) : entries_(shards) {}

ContentPtr ContentCache::get(const std::string& path, std::string* err) {
    if (auto hit = entries_.find(path); hit.has_value()) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        return *hit;
    }

    misses_.fetch_add(1, std::memory_order_relaxed);

    // Read without holding any shard lock. Concurrent misses on the same
    // path may both read; the later insert wins, both see valid content.
    std::string text;
    std::string read_err;
    if (!read_text_file(path, text, &read_err)) {
        read_errors_.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("cache: read failed: " + read_err);
        if (err) *err = std::move(read_err);
        return nullptr;
    }

    auto content = std::make_shared<const std::string>(std::move(text));
    entries_.insert_or_assign(path, content);
    return content;
}

ContentPtr ContentCache::peek(const std::string& path) const {
    auto hit = entries_.find(path);
    return hit.has_value() ? *hit : nullptr;
}

void ContentCache::invalidate(const std::string& path) {
    if (entries_.erase(path)) {
        invalidations_.fetch_add(1, std::memory_order_relaxed);
        LOG_TRACE("cache: invalidated " + path);
    }
}

void ContentCache::invalidate_all() {
    entries_.clear();
    LOG_DEBUG("cache: cleared");
}

CacheStats ContentCache::stats() const {
    CacheStats st;
    st.entries = entries_.size();
    st.hits = hits_.load(std::memory_order_relaxed);
    st.misses = misses_.load(std::memory_order_relaxed);
    st.read_errors = read_errors_.load(std::memory_order_relaxed);
    st.invalidations = invalidations_.load(std::memory_order_relaxed);
    return st;
}

} // namespace core
