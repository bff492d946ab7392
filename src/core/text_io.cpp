#include "text_io.h"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

namespace core {

namespace {

void set_err(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

std::string errno_message(int e) {
    return std::generic_category().message(e);
}

} // namespace

bool looks_like_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;

    char buf[kTextSniffBytes];
    in.read(buf, sizeof(buf));
    std::streamsize n = in.gcount();
    if (in.bad()) return false;

    return std::memchr(buf, '\0', (std::size_t)n) == nullptr;
}

bool read_text_file(const std::string& path, std::string& out, std::string* err) {
    std::error_code ec;
    auto st = std::filesystem::status(path, ec);
    if (ec) {
        set_err(err, path + ": " + ec.message());
        return false;
    }
    if (!std::filesystem::is_regular_file(st)) {
        set_err(err, path + ": not a regular file");
        return false;
    }

    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        set_err(err, path + ": " + errno_message(errno ? errno : EACCES));
        return false;
    }

    std::string text;
    text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        set_err(err, path + ": read failed");
        return false;
    }

    if (!is_valid_utf8(text)) {
        set_err(err, path + ": invalid UTF-8");
        return false;
    }

    out = std::move(text);
    return true;
}

bool write_text_file(const std::string& path, std::string_view data, std::string* err) {
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        set_err(err, path + ": " + errno_message(errno ? errno : EACCES));
        return false;
    }

    out.write(data.data(), (std::streamsize)data.size());
    out.flush();
    if (!out.good()) {
        int e = errno;
        set_err(err, path + ": write failed" + (e ? ": " + errno_message(e) : std::string()));
        return false;
    }

    out.close();
    if (out.fail()) {
        set_err(err, path + ": close failed");
        return false;
    }
    return true;
}

std::size_t utf8_seq_len(std::string_view s, std::size_t pos) {
    unsigned char c = (unsigned char)s[pos];
    std::size_t len = 1;
    if (c >= 0xF0 && c <= 0xF4) len = 4;
    else if (c >= 0xE0) len = 3;
    else if (c >= 0xC2 && c <= 0xDF) len = 2;
    if (c >= 0xF5) len = 1;
    if (pos + len > s.size()) return 1;
    return len;
}

bool is_valid_utf8(std::string_view s) {
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        unsigned char c = (unsigned char)s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len;
        std::uint32_t cp;
        if (c >= 0xC2 && c <= 0xDF) { len = 2; cp = c & 0x1F; }
        else if (c >= 0xE0 && c <= 0xEF) { len = 3; cp = c & 0x0F; }
        else if (c >= 0xF0 && c <= 0xF4) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (std::size_t k = 1; k < len; ++k) {
            unsigned char cc = (unsigned char)s[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // overlong forms, surrogates, beyond U+10FFFF
        if (len == 3 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) return false;
        if (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) return false;

        i += len;
    }
    return true;
}

} // namespace core
