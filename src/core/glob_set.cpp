#include "glob_set.h"

#include <cstdio>

#include "text_io.h"
#include "utils/logging.h"

namespace core {

namespace {

char32_t decode_utf8(std::string_view s, std::size_t pos, std::size_t& len) {
    len = utf8_seq_len(s, pos);
    unsigned char c = (unsigned char)s[pos];
    if (len == 1) return c;

    char32_t cp = c & (0x7F >> len);
    for (std::size_t k = 1; k < len; ++k) {
        cp = (cp << 6) | ((unsigned char)s[pos + k] & 0x3F);
    }
    return cp;
}

bool fail(std::string* err, const std::string& why) {
    if (err) *err = why;
    return false;
}

void append_code_point(std::string& out, char32_t cp) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "\\x{%X}", (unsigned)cp);
    out += buf;
}

} // namespace

std::optional<GlobPattern> GlobPattern::compile(std::string_view text, std::string* err) {
    GlobPattern g;
    g.text_ = std::string(text);
    g.match_basename_ = text.find('/') == std::string_view::npos;

    std::string re;        // translated program
    std::string literal;   // pending literal run, quoted on flush
    auto flush = [&re, &literal]() {
        if (literal.empty()) return;
        re += RE2::QuoteMeta(literal);
        literal.clear();
    };

    int group_depth = 0;
    const std::size_t n = text.size();
    std::size_t i = 0;

    while (i < n) {
        char c = text[i];

        if (c == '\\') {
            if (i + 1 >= n) {
                fail(err, "dangling escape");
                return std::nullopt;
            }
            literal += text[i + 1];
            i += 2;
            continue;
        }

        if (c == '*') {
            std::size_t j = i;
            while (j < n && text[j] == '*') ++j;

            bool segment_start = (i == 0) || text[i - 1] == '/';
            bool segment_end = (j == n) || text[j] == '/';

            flush();
            if (j - i >= 2 && segment_start && segment_end && j < n) {
                // "**/" : zero or more leading directories
                re += "(?:.*/)?";
                i = j + 1;
            } else {
                re += ".*";
                i = j;
            }
            continue;
        }

        if (c == '?') {
            flush();
            re += '.';
            ++i;
            continue;
        }

        if (c == '[') {
            std::string cls = "[";
            std::size_t j = i + 1;
            if (j < n && (text[j] == '!' || text[j] == '^')) {
                cls += '^';
                ++j;
            }
            if (j < n && text[j] == ']') {
                append_code_point(cls, U']');
                ++j;
            }
            while (j < n && text[j] != ']') {
                std::size_t len = 0;
                char32_t lo = decode_utf8(text, j, len);
                j += len;
                append_code_point(cls, lo);
                if (j + 1 < n && text[j] == '-' && text[j + 1] != ']') {
                    char32_t hi = decode_utf8(text, j + 1, len);
                    j += 1 + len;
                    if (hi < lo) {
                        fail(err, "invalid character range");
                        return std::nullopt;
                    }
                    cls += '-';
                    append_code_point(cls, hi);
                }
            }
            if (j >= n) {
                fail(err, "unclosed character class");
                return std::nullopt;
            }
            flush();
            re += cls;
            re += ']';
            i = j + 1;
            continue;
        }

        if (c == '{') {
            if (group_depth > 0) {
                fail(err, "nested alternate group");
                return std::nullopt;
            }
            ++group_depth;
            ++i;
            continue;
        }

        if (c == '}') {
            if (group_depth == 0) {
                fail(err, "unopened alternate group");
                return std::nullopt;
            }
            --group_depth;
            ++i;
            continue;
        }

        literal += c;
        ++i;
    }

    if (group_depth != 0) {
        fail(err, "unclosed alternate group");
        return std::nullopt;
    }
    flush();

    RE2::Options opts;
    opts.set_log_errors(false);
    opts.set_dot_nl(true);
    auto program = std::make_shared<const re2::RE2>(re, opts);
    if (!program->ok()) {
        fail(err, program->error());
        return std::nullopt;
    }
    g.re_ = std::move(program);
    return g;
}

bool GlobPattern::matches(std::string_view path) const {
    if (RE2::FullMatch(re2::StringPiece(path.data(), path.size()), *re_)) return true;
    if (!match_basename_) return false;

    auto slash = path.rfind('/');
    if (slash == std::string_view::npos) return false;
    std::string_view base = path.substr(slash + 1);
    return RE2::FullMatch(re2::StringPiece(base.data(), base.size()), *re_);
}

bool GlobSet::is_match(std::string_view path) const {
    for (const auto& p : patterns_) {
        if (p.matches(path)) return true;
    }
    return false;
}

bool GlobQuery::accepts(std::string_view path) const {
    bool included = has_include ? include.is_match(path) : true;
    if (!included) return false;
    return !exclude.is_match(path);
}

std::string_view trim_view(std::string_view s) {
    auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

GlobQuery parse_glob_query(std::string_view query) {
    GlobQuery q;

    std::size_t start = 0;
    while (start <= query.size()) {
        std::size_t comma = query.find(',', start);
        if (comma == std::string_view::npos) comma = query.size();

        std::string_view clause = trim_view(query.substr(start, comma - start));
        start = comma + 1;
        if (clause.empty()) continue;

        bool exclude = clause.front() == '!';
        if (exclude) {
            clause.remove_prefix(1);
        } else {
            q.has_include = true;
        }

        std::string err;
        auto pat = GlobPattern::compile(clause, &err);
        if (!pat.has_value()) {
            q.skipped_clauses++;
            LOG_DEBUG("glob: skipping '" + std::string(clause) + "': " + err);
            continue;
        }

        if (exclude) q.exclude.add(std::move(*pat));
        else q.include.add(std::move(*pat));
    }

    return q;
}

std::string_view relative_to_root(std::string_view path, std::string_view root) {
    std::string_view rel = path;

    if (!root.empty() && rel.size() > root.size() && rel.substr(0, root.size()) == root) {
        if (root.back() == '/') {
            rel.remove_prefix(root.size());
        } else if (rel[root.size()] == '/') {
            rel.remove_prefix(root.size() + 1);
        }
    }

    while (rel.size() >= 2 && rel[0] == '.' && rel[1] == '/') {
        rel.remove_prefix(2);
    }
    while (!rel.empty() && rel.front() == '/' && rel.size() < path.size()) {
        rel.remove_prefix(1);
    }
    return rel;
}

} // namespace core
