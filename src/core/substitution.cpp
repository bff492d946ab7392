#include "substitution.h"

#include <algorithm>

#include "content_cache.h"
#include "filter_engine.h"
#include "regex_cache.h"
#include "text_io.h"
#include "utils/logging.h"
#include "utils/stopwatch.h"

namespace core {

namespace {

// Calls on_match(begin, end, groups) for each non-overlapping match, left to
// right. An empty match ending where the previous match ended is skipped and
// the search resumes one code point further.
template <class OnMatch>
void for_each_match(const re2::RE2& re, std::string_view text, int nsub, OnMatch on_match) {
    std::vector<re2::StringPiece> sub((std::size_t)nsub);
    const re2::StringPiece whole(text.data(), text.size());

    std::size_t pos = 0;
    bool have_last = false;
    std::size_t last_end = 0;

    while (pos <= text.size()) {
        if (!re.Match(whole, pos, text.size(), RE2::UNANCHORED, sub.data(), nsub)) break;

        std::size_t begin = (std::size_t)(sub[0].data() - text.data());
        std::size_t end = begin + sub[0].size();

        if (begin == end && have_last && end == last_end) {
            if (pos >= text.size()) break;
            pos += utf8_seq_len(text, pos);
            continue;
        }

        on_match(begin, end, sub);
        have_last = true;
        last_end = end;
        pos = end;
    }
}

void replace_all_in(std::string& s, const std::string& token, std::string_view value) {
    std::size_t pos = 0;
    while ((pos = s.find(token, pos)) != std::string::npos) {
        s.replace(pos, token.size(), value.data(), value.size());
        pos += value.size();
    }
}

std::string expand_template(const std::string& tmpl,
                            const std::vector<re2::StringPiece>& sub,
                            int groups) {
    if (tmpl.find('$') == std::string::npos) return tmpl;

    std::string out = tmpl;
    for (int i = 1; i <= groups; ++i) {
        const re2::StringPiece& g = sub[(std::size_t)i];
        std::string_view value = g.data() ? std::string_view(g.data(), g.size()) : std::string_view();
        replace_all_in(out, "$" + std::to_string(i), value);
    }
    return out;
}

} // namespace

std::string substitute(const re2::RE2& re, std::string_view content,
                       const std::string& tmpl, std::size_t* count) {
    int groups = re.NumberOfCapturingGroups();
    if (groups < 0) groups = 0;

    std::string out;
    std::size_t copied = 0;
    std::size_t n = 0;

    for_each_match(re, content, groups + 1,
        [&](std::size_t begin, std::size_t end, const std::vector<re2::StringPiece>& sub) {
            if (n == 0) out.reserve(content.size() + tmpl.size());
            out.append(content.data() + copied, begin - copied);
            out += expand_template(tmpl, sub, groups);
            copied = end;
            ++n;
        });

    if (count) *count = n;
    if (n == 0) return std::string(content);

    out.append(content.data() + copied, content.size() - copied);
    return out;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        std::string_view line = text.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        start = nl + 1;
    }
    return lines;
}

std::vector<DiffLine> diff_lines(std::string_view original, std::string_view replaced) {
    auto left = split_lines(original);
    auto right = split_lines(replaced);

    std::vector<DiffLine> out;
    out.reserve(std::max(left.size(), right.size()) + 8);

    const std::size_t n = std::max(left.size(), right.size());
    for (std::size_t i = 0; i < n; ++i) {
        bool has_l = i < left.size();
        bool has_r = i < right.size();

        if (has_l && has_r) {
            if (left[i] == right[i]) {
                out.push_back(DiffLine{DiffTag::Unchanged, std::string(left[i])});
            } else {
                out.push_back(DiffLine{DiffTag::Removed, std::string(left[i])});
                out.push_back(DiffLine{DiffTag::Added, std::string(right[i])});
            }
        } else if (has_l) {
            out.push_back(DiffLine{DiffTag::Removed, std::string(left[i])});
        } else {
            out.push_back(DiffLine{DiffTag::Added, std::string(right[i])});
        }
    }
    return out;
}

std::string render_diff_line(const DiffLine& line) {
    switch (line.tag) {
        case DiffTag::Removed: return "- " + line.text;
        case DiffTag::Added:   return "+ " + line.text;
        default:               return line.text;
    }
}

std::vector<MatchSpan> find_matches(const re2::RE2& re, std::string_view text) {
    std::vector<MatchSpan> spans;
    for_each_match(re, text, 1,
        [&spans](std::size_t begin, std::size_t end, const std::vector<re2::StringPiece>&) {
            spans.push_back(MatchSpan{begin, end});
        });
    return spans;
}

SubstitutionEngine::SubstitutionEngine(ContentCache& contents, RegexCache& regexes, FilterEngine& filter)
    : contents_(contents), regexes_(regexes), filter_(filter) {}

std::string SubstitutionEngine::apply(std::string_view content, const std::string& from_pattern,
                                      const std::string& to_template, std::size_t* count) {
    CompiledRegex re = regexes_.compile(from_pattern);
    if (!re.ok()) {
        if (count) *count = 0;
        return std::string(content);
    }
    return substitute(*re.matcher, content, to_template, count);
}

Preview SubstitutionEngine::preview(std::string_view content, const std::string& from_pattern,
                                    const std::string& to_template) {
    Preview p;
    p.replaced = apply(content, from_pattern, to_template, &p.replacements);
    p.diff = diff_lines(content, p.replaced);
    return p;
}

FileResult SubstitutionEngine::commit(const std::string& path, const std::string& from_pattern,
                                      const std::string& to_template) {
    FileResult r;
    r.path = path;

    // on-disk text, not the cached copy
    std::string content;
    std::string err;
    if (!read_text_file(path, content, &err)) {
        r.kind = FileErrorKind::Read;
        r.error = err;
        LOG_WARN("commit: " + err);
        return r;
    }

    std::size_t n = 0;
    std::string replaced = apply(content, from_pattern, to_template, &n);

    bool written = write_text_file(path, replaced, &err);

    // A failed write may have truncated the file, so drop the entry either way.
    contents_.invalidate(path);
    filter_.invalidate_memo();

    if (!written) {
        r.kind = FileErrorKind::Write;
        r.error = err;
        LOG_WARN("commit: " + err);
        return r;
    }

    r.ok = true;
    r.replacements = n;
    LOG_INFO("commit: " + path + " replacements=" + std::to_string(n));
    return r;
}

std::vector<FileResult> SubstitutionEngine::commit_all(const std::vector<std::string>& paths,
                                                       const std::string& from_pattern,
                                                       const std::string& to_template) {
    utils::Stopwatch sw;

    std::vector<FileResult> results;
    results.reserve(paths.size());

    std::size_t failed = 0;
    for (const auto& p : paths) {
        results.push_back(commit(p, from_pattern, to_template));
        if (!results.back().ok) failed++;
    }

    LOG_INFO(
        "commit_all: files=" + std::to_string(paths.size()) +
        " failed=" + std::to_string(failed) +
        " t_ms=" + std::to_string(sw.elapsed_ms())
    );
    return results;
}

std::vector<MatchSpan> SubstitutionEngine::matches(std::string_view text, const std::string& pattern) {
    CompiledRegex re = regexes_.compile(pattern);
    if (!re.ok()) return {};
    return find_matches(*re.matcher, text);
}

} // namespace core
