#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <re2/re2.h>

#include "concurrency/thread_pool.h"
#include "core/content_cache.h"
#include "core/filter_engine.h"
#include "core/regex_cache.h"
#include "core/substitution.h"
#include "test_utils.h"

using core::DiffLine;
using core::DiffTag;

namespace {

std::string sub(const std::string& pattern, const std::string& content, const std::string& tmpl,
                std::size_t* count = nullptr) {
    re2::RE2 re(pattern);
    EXPECT_TRUE(re.ok()) << pattern;
    return core::substitute(re, content, tmpl, count);
}

DiffLine same(const std::string& s) { return DiffLine{DiffTag::Unchanged, s}; }
DiffLine removed(const std::string& s) { return DiffLine{DiffTag::Removed, s}; }
DiffLine added(const std::string& s) { return DiffLine{DiffTag::Added, s}; }

struct Engines {
    ThreadPool pool{2};
    core::ContentCache contents;
    core::RegexCache regexes;
    core::FilterEngine filter{contents, regexes, pool};
    core::SubstitutionEngine subst{contents, regexes, filter};
};

} // namespace

TEST(SubstituteTest, BackreferencesAreExpandedInGroupOrder) {
    EXPECT_EQ(sub("(\\w+)@(\\w+)", "alice@example", "$2-$1"), "example-alice");
}

TEST(SubstituteTest, ReplacesEveryMatchAndCounts) {
    std::size_t n = 0;
    EXPECT_EQ(sub("o", "foo boo", "0", &n), "f00 b00");
    EXPECT_EQ(n, 4u);
}

TEST(SubstituteTest, NoMatchLeavesContentUntouched) {
    std::size_t n = 7;
    EXPECT_EQ(sub("zzz", "hello", "x", &n), "hello");
    EXPECT_EQ(n, 0u);
}

TEST(SubstituteTest, DollarZeroIsLiteral) {
    EXPECT_EQ(sub("a", "a", "[$0]"), "[$0]");
}

TEST(SubstituteTest, MultiDigitReferenceUsesSingleDigitGroup) {
    // only one group: "$10" is "$1" followed by "0"
    EXPECT_EQ(sub("(a)", "a", "$10"), "a0");
}

TEST(SubstituteTest, NonParticipatingGroupIsEmpty) {
    EXPECT_EQ(sub("(a)|(b)", "b", "<$1|$2>"), "<|b>");
}

TEST(SubstituteTest, GroupTextIsSubstitutedProgressively) {
    // group 1 captures "$2", which the later $2 step then replaces
    EXPECT_EQ(sub("(\\$2)(x)", "$2x", "$1"), "x");
}

TEST(SubstituteTest, EmptyMatchesAdvanceOneCodePoint) {
    EXPECT_EQ(sub("x*", "abc", "-"), "-a-b-c-");
    EXPECT_EQ(sub("a*", "baaac", "-"), "-b-c-");
    EXPECT_EQ(sub("x*", "\xC3\xA9", "-"), "-\xC3\xA9-");
}

TEST(SplitLinesTest, FollowsLineTerminators) {
    using V = std::vector<std::string_view>;
    EXPECT_EQ(core::split_lines(""), V{});
    EXPECT_EQ(core::split_lines("a"), V{"a"});
    EXPECT_EQ(core::split_lines("a\n"), V{"a"});
    EXPECT_EQ(core::split_lines("a\r\nb"), (V{"a", "b"}));
    EXPECT_EQ(core::split_lines("\n"), V{""});
    EXPECT_EQ(core::split_lines("a\n\nb"), (V{"a", "", "b"}));
}

TEST(DiffLinesTest, PairsLinesPositionally) {
    std::vector<DiffLine> expected{same("a"), removed("b"), added("x"), same("c")};
    EXPECT_EQ(core::diff_lines("a\nb\nc", "a\nx\nc"), expected);
}

TEST(DiffLinesTest, ExtraLinesOnEitherSide) {
    EXPECT_EQ(core::diff_lines("a", "a\nb"), (std::vector<DiffLine>{same("a"), added("b")}));
    EXPECT_EQ(core::diff_lines("a\nb", "a"), (std::vector<DiffLine>{same("a"), removed("b")}));
}

TEST(DiffLinesTest, InsertedLineShowsAsPositionalChurn) {
    std::vector<DiffLine> expected{removed("b"), added("a"), removed("c"), added("b"), added("c")};
    EXPECT_EQ(core::diff_lines("b\nc", "a\nb\nc"), expected);
}

TEST(DiffLinesTest, RenderedWithPrefixes) {
    EXPECT_EQ(core::render_diff_line(removed("x")), "- x");
    EXPECT_EQ(core::render_diff_line(added("y")), "+ y");
    EXPECT_EQ(core::render_diff_line(same("z")), "z");
}

TEST(FindMatchesTest, ReportsByteSpans) {
    re2::RE2 re("b+");
    auto spans = core::find_matches(re, "abbcb");
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].begin, 1u);
    EXPECT_EQ(spans[0].end, 3u);
    EXPECT_EQ(spans[1].begin, 4u);
    EXPECT_EQ(spans[1].end, 5u);
}

TEST(SubstitutionEngineTest, MalformedPatternIsIdentity) {
    Engines e;
    std::size_t n = 3;
    EXPECT_EQ(e.subst.apply("some (text)", "(", "x", &n), "some (text)");
    EXPECT_EQ(n, 0u);
    EXPECT_TRUE(e.subst.matches("some (text)", "(").empty());
}

TEST(SubstitutionEngineTest, PreviewCarriesDiffAndCount) {
    Engines e;
    auto p = e.subst.preview("let a = 1;\nlet b = 2;\n", "let (\\w)", "const $1");
    EXPECT_EQ(p.replaced, "const a = 1;\nconst b = 2;\n");
    EXPECT_EQ(p.replacements, 2u);
    ASSERT_EQ(p.diff.size(), 4u);
    EXPECT_EQ(p.diff[0], removed("let a = 1;"));
    EXPECT_EQ(p.diff[1], added("const a = 1;"));
}

TEST(SubstitutionEngineTest, CommitRewritesFileAndDropsCacheEntry) {
    sift_test::TempDir dir;
    std::string path = dir.write("a.txt", "hello world\n");

    Engines e;
    ASSERT_NE(e.contents.get(path), nullptr);

    auto r = e.subst.commit(path, "world", "there");
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.kind, core::FileErrorKind::None);
    EXPECT_EQ(r.replacements, 1u);
    EXPECT_EQ(sift_test::read_all(path), "hello there\n");
    EXPECT_EQ(e.contents.peek(path), nullptr);
}

TEST(SubstitutionEngineTest, CommitReadsDiskNotCache) {
    sift_test::TempDir dir;
    std::string path = dir.write("a.txt", "old\n");

    Engines e;
    ASSERT_NE(e.contents.get(path), nullptr);
    dir.write("a.txt", "new old\n");

    auto r = e.subst.commit(path, "old", "X");
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(sift_test::read_all(path), "new X\n");
}

TEST(SubstitutionEngineTest, CommitWithoutMatchesSucceeds) {
    sift_test::TempDir dir;
    std::string path = dir.write("a.txt", "unchanged\n");

    Engines e;
    auto r = e.subst.commit(path, "zzz", "y");
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.replacements, 0u);
    EXPECT_EQ(sift_test::read_all(path), "unchanged\n");
}

TEST(SubstitutionEngineTest, MissingFileIsAReadError) {
    sift_test::TempDir dir;
    Engines e;
    auto r = e.subst.commit(dir.file("nope.txt"), "a", "b");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.kind, core::FileErrorKind::Read);
    EXPECT_FALSE(r.error.empty());
}

TEST(SubstitutionEngineTest, CommitAllKeepsGoingAfterFailure) {
    sift_test::TempDir dir;
    std::string a = dir.write("a.txt", "x\n");
    std::string c = dir.write("c.txt", "x\n");

    Engines e;
    auto results = e.subst.commit_all({a, dir.file("missing.txt"), c}, "x", "y");
    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].ok);
    EXPECT_FALSE(results[1].ok);
    EXPECT_EQ(results[1].kind, core::FileErrorKind::Read);
    EXPECT_TRUE(results[2].ok);
    EXPECT_EQ(sift_test::read_all(a), "y\n");
    EXPECT_EQ(sift_test::read_all(c), "y\n");
}
