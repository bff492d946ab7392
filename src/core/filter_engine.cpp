#include "filter_engine.h"

#include <mutex>

#include "concurrency/thread_pool.h"
#include "glob_set.h"
#include "utils/logging.h"
#include "utils/stopwatch.h"

namespace core {

FilterEngine::FilterEngine(ContentCache& contents, RegexCache& regexes, ThreadPool& pool)
    : contents_(contents), regexes_(regexes), pool_(pool) {}

FileListPtr FilterEngine::filter(const FileIndexPtr& index,
                                 const std::string& glob_query,
                                 const std::string& content_query) {
    if (!index) return std::make_shared<const FileList>();

    if (trim_view(glob_query).empty() && trim_view(content_query).empty()) {
        fast_path_.fetch_add(1, std::memory_order_relaxed);
        // aliasing constructor: shares ownership of the index, points at its list
        return FileListPtr(index, &index->paths);
    }

    {
        std::shared_lock<std::shared_mutex> rlock(memo_mu_);
        if (memo_.has_value() &&
            memo_->glob_query == glob_query &&
            memo_->content_query == content_query) {
            memo_hits_.fetch_add(1, std::memory_order_relaxed);
            return memo_->files;
        }
    }

    utils::Stopwatch sw;
    FileListPtr files = recompute_(*index, glob_query, content_query);

    {
        std::unique_lock<std::shared_mutex> wlock(memo_mu_);
        memo_ = Memo{glob_query, content_query, files};
    }
    recomputations_.fetch_add(1, std::memory_order_relaxed);

    LOG_DEBUG(
        "filter: glob='" + glob_query + "' content='" + content_query +
        "' matched=" + std::to_string(files->size()) + "/" + std::to_string(index->paths.size()) +
        " t_ms=" + std::to_string(sw.elapsed_ms())
    );

    return files;
}

FileListPtr FilterEngine::recompute_(const FileIndex& index,
                                     const std::string& glob_query,
                                     const std::string& content_query) {
    auto out = std::make_shared<FileList>();

    GlobQuery globs = parse_glob_query(glob_query);

    // content_query is used untrimmed: " foo" is a different regex from "foo"
    RegexPtr content_re;
    if (!content_query.empty()) {
        CompiledRegex compiled = regexes_.compile(content_query);
        if (!compiled.ok()) {
            // a malformed content regex matches no file
            return out;
        }
        content_re = compiled.matcher;
    }

    const auto& paths = index.paths;
    std::vector<char> keep(paths.size(), 0);

    parallel_for(pool_, paths.size(), [&](std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            const std::string& path = paths[i];

            if (!globs.accepts(relative_to_root(path, index.root))) continue;

            if (content_re) {
                ContentPtr text = contents_.get(path);
                if (!text) continue;
                if (!RE2::PartialMatch(*text, *content_re)) continue;
            }

            keep[i] = 1;
        }
    });

    for (std::size_t i = 0; i < paths.size(); ++i) {
        if (keep[i]) out->push_back(paths[i]);
    }
    return out;
}

void FilterEngine::invalidate_memo() {
    std::unique_lock<std::shared_mutex> wlock(memo_mu_);
    memo_.reset();
}

bool FilterEngine::has_memo() const {
    std::shared_lock<std::shared_mutex> rlock(memo_mu_);
    return memo_.has_value();
}

FilterStats FilterEngine::stats() const {
    FilterStats st;
    st.recomputations = recomputations_.load(std::memory_order_relaxed);
    st.memo_hits = memo_hits_.load(std::memory_order_relaxed);
    st.fast_path = fast_path_.load(std::memory_order_relaxed);
    return st;
}

} // namespace core
