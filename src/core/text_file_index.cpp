#include "text_file_index.h"

#include <algorithm>
#include <future>
#include <iterator>
#include <system_error>

#include "concurrency/thread_pool.h"
#include "text_io.h"
#include "utils/logging.h"
#include "utils/stopwatch.h"

namespace core {

namespace fs = std::filesystem;

namespace {

struct WalkResult {
    std::vector<std::string> paths;
    std::size_t scanned = 0;
    std::size_t skipped = 0;
    std::size_t errors = 0;
};

void visit_file(const fs::path& p, const TextPredicate& is_text, WalkResult& r) {
    r.scanned++;
    if (is_text(p)) {
        r.paths.push_back(p.string());
    } else {
        r.skipped++;
    }
}

// Depth-first walk of one subtree. Symlinks are neither followed nor
// accepted; a failing entry is counted and the walk goes on.
WalkResult walk_subtree(const fs::path& dir, const TextPredicate& is_text) {
    WalkResult r;
    std::vector<fs::path> pending{dir};

    while (!pending.empty()) {
        fs::path cur = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(cur, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            LOG_DEBUG("index: cannot open " + cur.string() + ": " + ec.message());
            r.errors++;
            continue;
        }

        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            std::error_code sec;
            auto st = it->symlink_status(sec);
            if (sec) {
                r.errors++;
                continue;
            }
            if (fs::is_directory(st)) {
                pending.push_back(it->path());
            } else if (fs::is_regular_file(st)) {
                visit_file(it->path(), is_text, r);
            }
        }
        if (ec) {
            LOG_DEBUG("index: listing " + cur.string() + " stopped: " + ec.message());
            r.errors++;
        }
    }

    return r;
}

} // namespace

TextFileIndex::TextFileIndex(IndexConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.is_text) {
        cfg_.is_text = [](const fs::path& p) { return looks_like_text(p); };
    }
}

FileIndexPtr TextFileIndex::build(const std::string& root, BuildStats* stats) const {
    utils::Stopwatch sw;

    auto index = std::make_shared<FileIndex>();
    index->root = root;

    BuildStats st;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        LOG_WARN("index: root is not a directory: " + root);
        if (stats) *stats = st;
        return index;
    }

    // Fan out: one task per top-level subdirectory, one for the files
    // sitting directly under the root.
    std::vector<fs::path> subdirs;
    std::vector<fs::path> top_files;

    fs::directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_WARN("index: cannot list root " + root + ": " + ec.message());
        st.errors++;
    } else {
        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            std::error_code sec;
            auto s = it->symlink_status(sec);
            if (sec) {
                st.errors++;
                continue;
            }
            if (fs::is_directory(s)) subdirs.push_back(it->path());
            else if (fs::is_regular_file(s)) top_files.push_back(it->path());
        }
        if (ec) st.errors++;
    }

    const TextPredicate& is_text = cfg_.is_text;
    std::vector<WalkResult> parts;
    {
        ThreadPool pool(cfg_.threads);

        std::vector<std::future<WalkResult>> futs;
        futs.reserve(subdirs.size() + 1);

        futs.push_back(pool.submit([&is_text, &top_files]() {
            WalkResult r;
            for (const auto& p : top_files) visit_file(p, is_text, r);
            return r;
        }));
        for (const auto& d : subdirs) {
            futs.push_back(pool.submit([&is_text, d]() { return walk_subtree(d, is_text); }));
        }

        parts.reserve(futs.size());
        for (auto& f : futs) {
            try {
                parts.push_back(f.get());
            } catch (const std::exception& e) {
                LOG_WARN(std::string("index: subtree walk failed: ") + e.what());
                st.errors++;
            }
        }
    }

    std::size_t total = 0;
    for (const auto& p : parts) total += p.paths.size();
    index->paths.reserve(total);

    for (auto& p : parts) {
        st.scanned_files += p.scanned;
        st.skipped_files += p.skipped;
        st.errors += p.errors;
        std::move(p.paths.begin(), p.paths.end(), std::back_inserter(index->paths));
    }

    // stable order for reproducibility
    std::sort(index->paths.begin(), index->paths.end());

    st.accepted_files = index->paths.size();
    st.elapsed_ms = sw.elapsed_ms();

    LOG_INFO(
        "index built: root=" + root +
        " scanned=" + std::to_string(st.scanned_files) +
        " accepted=" + std::to_string(st.accepted_files) +
        " skipped=" + std::to_string(st.skipped_files) +
        " errors=" + std::to_string(st.errors) +
        " t_ms=" + std::to_string(st.elapsed_ms)
    );

    if (stats) *stats = st;
    return index;
}

} // namespace core
