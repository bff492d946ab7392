#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace core {

// Bytes sniffed by looks_like_text().
constexpr std::size_t kTextSniffBytes = 4096;

// Default text-file predicate: reads up to kTextSniffBytes and rejects the
// file if it cannot be opened/read or the prefix contains a NUL byte.
bool looks_like_text(const std::filesystem::path& path);

// Whole-file read. Fails (returns false, sets *err) if the path is not a
// regular file, cannot be opened or read, or is not valid UTF-8.
bool read_text_file(const std::string& path, std::string& out, std::string* err = nullptr);

// Truncating overwrite of the whole file.
bool write_text_file(const std::string& path, std::string_view data, std::string* err = nullptr);

bool is_valid_utf8(std::string_view s);

// Length in bytes of the UTF-8 sequence starting at s[pos] (1 for stray bytes).
std::size_t utf8_seq_len(std::string_view s, std::size_t pos);

} // namespace core
