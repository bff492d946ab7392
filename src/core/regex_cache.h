#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <re2/re2.h>

#include "concurrency/sharded_map.h"

namespace core {

using RegexPtr = std::shared_ptr<const re2::RE2>;

// Outcome of compiling one pattern. Exactly one of matcher / error is set.
struct CompiledRegex {
    RegexPtr matcher;
    std::string error;

    bool ok() const { return matcher != nullptr; }
};

// Compile a pattern with the engine-wide RE2 options, uncached.
CompiledRegex compile_regex(const std::string& pattern);

// pattern text -> compiled matcher. Identical text always yields the same
// matcher object; failures are never cached. Nothing is evicted: every
// distinct pattern compiled stays resident for the life of the cache.
class RegexCache {
public:
    explicit RegexCache(std::size_t shards = 16);

    RegexCache(const RegexCache&) = delete;
    RegexCache& operator=(const RegexCache&) = delete;

    CompiledRegex compile(const std::string& pattern);

    std::size_t size() const { return compiled_.size(); }

private:
    ShardedMap<RegexPtr> compiled_;
};

} // namespace core
