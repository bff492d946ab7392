#include "regex_cache.h"

#include "utils/logging.h"

namespace core {

CompiledRegex compile_regex(const std::string& pattern) {
    RE2::Options opts;
    opts.set_log_errors(false);

    CompiledRegex out;
    auto re = std::make_shared<const re2::RE2>(pattern, opts);
    if (!re->ok()) {
        out.error = re->error();
        return out;
    }
    out.matcher = std::move(re);
    return out;
}

RegexCache::RegexCache(std::size_t shards) : compiled_(shards) {}

CompiledRegex RegexCache::compile(const std::string& pattern) {
    if (auto hit = compiled_.find(pattern); hit.has_value()) {
        CompiledRegex out;
        out.matcher = *hit;
        return out;
    }

    CompiledRegex fresh = compile_regex(pattern);
    if (!fresh.ok()) {
        LOG_DEBUG("regex: cannot compile '" + pattern + "': " + fresh.error);
        return fresh;
    }

    // Two threads may compile the same text concurrently; whichever insert
    // lands first is the matcher everyone gets from now on.
    fresh.matcher = compiled_.insert_if_absent(pattern, fresh.matcher);
    return fresh;
}

} // namespace core
