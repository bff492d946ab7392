#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <sys/resource.h>

#include "core/glob_set.h"
#include "core/replace_session.h"
#include "test_utils.h"

using core::ReplaceSession;

namespace {

std::vector<std::string> rel(const core::FileList& files, const std::string& root) {
    std::vector<std::string> out;
    for (const auto& f : files) out.emplace_back(core::relative_to_root(f, root));
    return out;
}

class ReplaceSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_.write("src/lib.rs", "pub fn greet() -> &'static str { \"hi\" }\n");
        dir_.write("src/mod.rs", "mod util;\n");
        dir_.write("src/main.rs", "fn main() { println!(\"{}\", greet()); }\n");
        dir_.write("notes.md", "greet the team\n");
        session_.build_index(dir_.str());
    }

    std::vector<std::string> filtered() {
        return rel(*session_.filter(), dir_.str());
    }

    sift_test::TempDir dir_;
    ReplaceSession session_{core::SessionConfig{2, 8, {}}};
};

} // namespace

TEST_F(ReplaceSessionTest, BuildInstallsIndexAndRoot) {
    auto idx = session_.index();
    ASSERT_NE(idx, nullptr);
    EXPECT_EQ(idx->paths.size(), 4u);
    EXPECT_EQ(session_.root(), dir_.str());
}

TEST_F(ReplaceSessionTest, FilterAppliesGlobAndContent) {
    session_.set_query("*.rs,!mod.rs", "");
    EXPECT_EQ(filtered(), (std::vector<std::string>{"src/lib.rs", "src/main.rs"}));

    session_.set_query("", "greet");
    EXPECT_EQ(filtered(), (std::vector<std::string>{"notes.md", "src/lib.rs", "src/main.rs"}));

    session_.set_query("src/**", "greet\\(\\)\\)");
    EXPECT_EQ(filtered(), (std::vector<std::string>{"src/main.rs"}));
}

TEST_F(ReplaceSessionTest, UnchangedQueryReturnsSameListWithoutReads) {
    session_.set_query("*.rs", "fn");
    auto first = session_.filter();
    auto misses = session_.cache_stats().misses;

    auto second = session_.filter();
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(session_.cache_stats().misses, misses);
}

TEST_F(ReplaceSessionTest, StaleContentUntilChangeIsNotified) {
    session_.set_query("", "farewell");
    EXPECT_TRUE(filtered().empty());

    std::string notes = dir_.write("notes.md", "farewell the team\n");
    EXPECT_TRUE(filtered().empty());  // memo, and the cached text is the old one

    session_.notify_changed(notes);
    EXPECT_EQ(filtered(), (std::vector<std::string>{"notes.md"}));
}

TEST_F(ReplaceSessionTest, PumpReportsAppliedEvents) {
    session_.notify_changed(dir_.file("notes.md"));
    session_.notify_changed(dir_.file("src/lib.rs"));
    EXPECT_EQ(session_.pump_invalidations(), 2u);
    EXPECT_EQ(session_.pump_invalidations(), 0u);
}

TEST_F(ReplaceSessionTest, NewFilesJoinOnlyOnRefresh) {
    dir_.write("src/extra.rs", "fn extra() {}\n");
    session_.notify_changed(dir_.file("src/extra.rs"));

    session_.set_query("*.rs", "");
    EXPECT_EQ(filtered().size(), 3u);

    core::BuildStats st;
    session_.refresh(&st);
    EXPECT_EQ(st.accepted_files, 5u);
    EXPECT_EQ(filtered().size(), 4u);
}

TEST_F(ReplaceSessionTest, PreviewShowsDiff) {
    auto p = session_.preview(dir_.file("src/lib.rs"), "greet", "welcome");
    ASSERT_TRUE(p.file.ok);
    ASSERT_NE(p.original, nullptr);
    EXPECT_EQ(p.file.replacements, 1u);
    ASSERT_EQ(p.preview.diff.size(), 2u);
    EXPECT_EQ(core::render_diff_line(p.preview.diff[0]), "- pub fn greet() -> &'static str { \"hi\" }");
    EXPECT_EQ(core::render_diff_line(p.preview.diff[1]), "+ pub fn welcome() -> &'static str { \"hi\" }");
}

TEST_F(ReplaceSessionTest, PreviewOfUnreadableFileIsReadError) {
    auto p = session_.preview(dir_.file("gone.rs"), "a", "b");
    EXPECT_FALSE(p.file.ok);
    EXPECT_EQ(p.file.kind, core::FileErrorKind::Read);
    EXPECT_FALSE(p.file.error.empty());
    EXPECT_TRUE(p.preview.diff.empty());
}

TEST_F(ReplaceSessionTest, MalformedFromPatternPreviewsUnchanged) {
    auto p = session_.preview(dir_.file("src/mod.rs"), "(", "x");
    ASSERT_TRUE(p.file.ok);
    EXPECT_EQ(p.preview.replaced, "mod util;\n");
    EXPECT_EQ(p.preview.replacements, 0u);
}

TEST_F(ReplaceSessionTest, CommitOneUpdatesDiskAndNextFilter) {
    session_.set_query("", "greet");
    EXPECT_EQ(filtered().size(), 3u);

    auto r = session_.commit_one(dir_.file("notes.md"), "greet", "meet");
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_EQ(sift_test::read_all(dir_.file("notes.md")), "meet the team\n");

    EXPECT_EQ(filtered(), (std::vector<std::string>{"src/lib.rs", "src/main.rs"}));
}

TEST_F(ReplaceSessionTest, FindMatchesSpans) {
    auto spans = session_.find_matches("greet greet", "gr(e+)t");
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[1].begin, 6u);
    EXPECT_TRUE(session_.find_matches("text", "[").empty());
}

TEST_F(ReplaceSessionTest, BatchCommitIsolatesWriteFailure) {
    // same pattern everywhere; only the second file grows past the size limit
    std::string one = dir_.write("batch/1.txt", "x\n");
    std::string two = dir_.write("batch/2.txt", std::string(100, 'x'));
    std::string three = dir_.write("batch/3.txt", "x\n");
    const std::string to(100, 'y');

    struct rlimit old_limit{};
    if (getrlimit(RLIMIT_FSIZE, &old_limit) != 0) GTEST_SKIP() << "getrlimit failed";
    auto old_handler = std::signal(SIGXFSZ, SIG_IGN);

    struct rlimit small = old_limit;
    small.rlim_cur = 4096;
    if (setrlimit(RLIMIT_FSIZE, &small) != 0) {
        std::signal(SIGXFSZ, old_handler);
        GTEST_SKIP() << "setrlimit failed";
    }

    auto results = session_.commit_all({one, two, three}, "x", to);

    setrlimit(RLIMIT_FSIZE, &old_limit);
    std::signal(SIGXFSZ, old_handler);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].ok) << results[0].error;
    EXPECT_FALSE(results[1].ok);
    EXPECT_EQ(results[1].kind, core::FileErrorKind::Write);
    EXPECT_FALSE(results[1].error.empty());
    EXPECT_TRUE(results[2].ok) << results[2].error;

    EXPECT_EQ(sift_test::read_all(one), to + "\n");
    EXPECT_EQ(sift_test::read_all(three), to + "\n");
}

TEST(ReplaceSessionLoadTest, BackgroundLoadInstallsIndex) {
    sift_test::TempDir dir;
    dir.write("a.txt", "a");
    dir.write("d/b.txt", "b");

    ReplaceSession session(core::SessionConfig{2, 8, {}});
    EXPECT_FALSE(session.poll_index_load());
    ASSERT_TRUE(session.start_index_load(dir.str()));

    core::BuildStats st;
    bool installed = false;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!installed && std::chrono::steady_clock::now() < deadline) {
        installed = session.poll_index_load(&st);
        if (!installed) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    ASSERT_TRUE(installed);
    EXPECT_FALSE(session.is_loading());
    EXPECT_EQ(st.accepted_files, 2u);
    ASSERT_NE(session.index(), nullptr);
    EXPECT_EQ(session.index()->paths.size(), 2u);
    EXPECT_EQ(session.root(), dir.str());

    // result is consumed once
    EXPECT_FALSE(session.poll_index_load());
}

TEST(ReplaceSessionLoadTest, FilterBeforeAnyIndexIsEmpty) {
    ReplaceSession session;
    session.set_query("*", "x");
    auto files = session.filter();
    ASSERT_NE(files, nullptr);
    EXPECT_TRUE(files->empty());
}

TEST_F(ReplaceSessionTest, WatcherEventsInvalidateCache) {
    if (!session_.start_watch()) GTEST_SKIP() << "file watching unavailable here";
    EXPECT_TRUE(session_.is_watching());

    session_.set_query("", "brand new");
    EXPECT_TRUE(filtered().empty());

    dir_.write("src/mod.rs", "// brand new text\n");

    bool seen = false;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!seen && std::chrono::steady_clock::now() < deadline) {
        seen = filtered() == std::vector<std::string>{"src/mod.rs"};
        if (!seen) std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_TRUE(seen);

    session_.stop_watch();
    EXPECT_FALSE(session_.is_watching());
}

TEST_F(ReplaceSessionTest, RenameOverSaveInvalidatesCache) {
    if (!session_.start_watch()) GTEST_SKIP() << "file watching unavailable here";

    session_.set_query("", "renamed in");
    EXPECT_TRUE(filtered().empty());

    sift_test::TempDir staging;
    std::string tmp = staging.write("notes.md.tmp", "renamed in place\n");
    std::filesystem::rename(tmp, dir_.file("notes.md"));

    bool seen = false;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!seen && std::chrono::steady_clock::now() < deadline) {
        seen = filtered() == std::vector<std::string>{"notes.md"};
        if (!seen) std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_TRUE(seen);
}

TEST(ReplaceSessionLoadTest, FailedLoaderStartDoesNotBlockLaterLoads) {
    sift_test::TempDir dir;
    dir.write("a.txt", "a");
    ReplaceSession session(core::SessionConfig{1, 8, {}});

    rlimit old_limit{};
    if (getrlimit(RLIMIT_NPROC, &old_limit) != 0) GTEST_SKIP() << "getrlimit failed";
    rlimit none = old_limit;
    none.rlim_cur = 1;
    if (setrlimit(RLIMIT_NPROC, &none) != 0) GTEST_SKIP() << "setrlimit failed";
    bool started = session.start_index_load(dir.str());
    setrlimit(RLIMIT_NPROC, &old_limit);
    if (started) GTEST_SKIP() << "process limit not enforced for this user";

    EXPECT_FALSE(session.is_loading());
    ASSERT_TRUE(session.start_index_load(dir.str()));

    bool installed = false;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!installed && std::chrono::steady_clock::now() < deadline) {
        installed = session.poll_index_load();
        if (!installed) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_TRUE(installed);
}
