#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <re2/re2.h>

namespace core {

class ContentCache;
class FilterEngine;
class RegexCache;

enum class DiffTag {
    Unchanged,
    Removed,
    Added,
};

struct DiffLine {
    DiffTag tag = DiffTag::Unchanged;
    std::string text;

    bool operator==(const DiffLine& o) const { return tag == o.tag && text == o.text; }
    bool operator!=(const DiffLine& o) const { return !(*this == o); }
};

// Byte range [begin, end) of one regex match.
struct MatchSpan {
    std::size_t begin = 0;
    std::size_t end = 0;
};

struct Preview {
    std::string replaced;
    std::vector<DiffLine> diff;
    std::size_t replacements = 0;
};

enum class FileErrorKind {
    None,
    Read,
    Write,
};

// Outcome of one per-file operation (preview read, commit).
struct FileResult {
    std::string path;
    bool ok = false;
    FileErrorKind kind = FileErrorKind::None;
    std::string error;
    std::size_t replacements = 0;
};

// Replace every non-overlapping match of re in content. In tmpl, "$1".."$N"
// are replaced by the corresponding group text (empty if the group did not
// take part), substituted in group order 1..N; everything else, "$0"
// included, is literal.
std::string substitute(const re2::RE2& re, std::string_view content,
                       const std::string& tmpl, std::size_t* count = nullptr);

// Lines split on '\n' with a trailing '\r' dropped; a final terminator does
// not open an extra empty line.
std::vector<std::string_view> split_lines(std::string_view text);

// Positional line diff (no alignment): line i of original is paired with
// line i of replaced.
std::vector<DiffLine> diff_lines(std::string_view original, std::string_view replaced);

// "- text" / "+ text" / "text"
std::string render_diff_line(const DiffLine& line);

std::vector<MatchSpan> find_matches(const re2::RE2& re, std::string_view text);

class SubstitutionEngine {
public:
    SubstitutionEngine(ContentCache& contents, RegexCache& regexes, FilterEngine& filter);

    SubstitutionEngine(const SubstitutionEngine&) = delete;
    SubstitutionEngine& operator=(const SubstitutionEngine&) = delete;

    // Identity when from_pattern does not compile.
    std::string apply(std::string_view content, const std::string& from_pattern,
                      const std::string& to_template, std::size_t* count = nullptr);

    Preview preview(std::string_view content, const std::string& from_pattern,
                    const std::string& to_template);

    // Read-substitute-overwrite of one file, then drop its cache entry and
    // the filter memo.
    FileResult commit(const std::string& path, const std::string& from_pattern,
                      const std::string& to_template);

    // Independent commit of every path; one failure does not stop the rest.
    std::vector<FileResult> commit_all(const std::vector<std::string>& paths,
                                       const std::string& from_pattern,
                                       const std::string& to_template);

    // Empty when pattern does not compile.
    std::vector<MatchSpan> matches(std::string_view text, const std::string& pattern);

private:
    ContentCache& contents_;
    RegexCache& regexes_;
    FilterEngine& filter_;
};

} // namespace core
