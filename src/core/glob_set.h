#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <re2/re2.h>

namespace core {

// One shell-style wildcard pattern matched against a root-relative path.
// Supports: * and ? (both may cross '/'), ** as a whole path segment
// (zero or more directories), [abc] [a-z] [!0-9] [^0-9], \ escapes and
// single-alternative {...} groups. A pattern without '/' also matches the
// path's last component.
//
// Compiled to an anchored RE2 program; matching is linear in the path length.
class GlobPattern {
public:
    // Returns nullopt for a malformed pattern (unclosed class or group,
    // reversed range, dangling escape); *err gets the reason.
    static std::optional<GlobPattern> compile(std::string_view text, std::string* err = nullptr);

    bool matches(std::string_view path) const;

    const std::string& text() const { return text_; }

private:
    GlobPattern() = default;

    std::string text_;
    std::shared_ptr<const re2::RE2> re_;
    bool match_basename_ = false;
};

// Matches if any member pattern matches.
class GlobSet {
public:
    void add(GlobPattern p) { patterns_.push_back(std::move(p)); }
    bool empty() const { return patterns_.empty(); }
    std::size_t size() const { return patterns_.size(); }
    bool is_match(std::string_view path) const;

private:
    std::vector<GlobPattern> patterns_;
};

// Parsed comma-separated glob query: "src/**,*.rs,!mod.rs".
struct GlobQuery {
    GlobSet include;
    GlobSet exclude;
    bool has_include = false;          // any non-'!' clause, valid or not
    std::size_t skipped_clauses = 0;   // malformed clauses dropped

    // Include test (vacuous without include clauses) and no exclude hit.
    bool accepts(std::string_view path) const;
};

GlobQuery parse_glob_query(std::string_view query);

// Path relative to root ("./" prefixes removed) for glob matching.
std::string_view relative_to_root(std::string_view path, std::string_view root);

// Leading/trailing whitespace removed.
std::string_view trim_view(std::string_view s);

} // namespace core
