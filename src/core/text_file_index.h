#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace core {

// Snapshot of eligible text files under one root.
// Paths are `root / relative` strings, sorted.
struct FileIndex {
    std::string root;
    std::vector<std::string> paths;
};

using FileIndexPtr = std::shared_ptr<const FileIndex>;
using TextPredicate = std::function<bool(const std::filesystem::path&)>;

struct BuildStats {
    std::size_t scanned_files = 0;   // regular files seen
    std::size_t accepted_files = 0;  // passed the text predicate
    std::size_t skipped_files = 0;   // rejected by the predicate
    std::size_t errors = 0;          // entries that could not be visited
    long long elapsed_ms = 0;
};

struct IndexConfig {
    std::size_t threads = 0;   // 0 = hardware concurrency
    TextPredicate is_text;     // empty = looks_like_text
};

class TextFileIndex {
public:
    explicit TextFileIndex(IndexConfig cfg = {});

    // Walk root recursively and collect regular files accepted by the
    // predicate. Never throws for per-entry failures; a missing root
    // yields an empty index.
    FileIndexPtr build(const std::string& root, BuildStats* stats = nullptr) const;

private:
    IndexConfig cfg_;
};

} // namespace core
