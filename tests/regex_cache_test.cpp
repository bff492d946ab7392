#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "core/regex_cache.h"

using core::RegexCache;

TEST(RegexCacheTest, SameTextReusesMatcher) {
    RegexCache cache;
    auto a = cache.compile("fo+");
    auto b = cache.compile("fo+");
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(a.matcher.get(), b.matcher.get());
    EXPECT_EQ(cache.size(), 1u);
}

TEST(RegexCacheTest, DifferentTextNeverShares) {
    RegexCache cache;
    auto a = cache.compile("foo");
    auto b = cache.compile("foo ");
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NE(a.matcher.get(), b.matcher.get());
    EXPECT_EQ(cache.size(), 2u);
}

TEST(RegexCacheTest, MalformedPatternIsReportedAndNotCached) {
    RegexCache cache;
    auto r = cache.compile("(");
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.matcher, nullptr);
    EXPECT_FALSE(r.error.empty());
    EXPECT_EQ(cache.size(), 0u);

    EXPECT_FALSE(cache.compile("a[").ok());
    EXPECT_EQ(cache.size(), 0u);
}

TEST(RegexCacheTest, CompiledMatcherWorks) {
    RegexCache cache;
    auto r = cache.compile("(\\w+)@(\\w+)");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.matcher->NumberOfCapturingGroups(), 2);
    EXPECT_TRUE(RE2::PartialMatch("mail alice@example now", *r.matcher));
}

TEST(RegexCacheTest, ConcurrentCompilesConvergeOnOneMatcher) {
    RegexCache cache(4);
    std::vector<const re2::RE2*> seen(8, nullptr);
    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < seen.size(); ++t) {
        threads.emplace_back([&cache, &seen, t]() {
            auto r = cache.compile("shared\\s+pattern");
            seen[t] = r.matcher.get();
        });
    }
    for (auto& t : threads) t.join();

    for (const auto* p : seen) {
        ASSERT_NE(p, nullptr);
        EXPECT_EQ(p, cache.compile("shared\\s+pattern").matcher.get());
    }
}

TEST(RegexCacheTest, EveryPartialPatternStaysResident) {
    RegexCache cache(4);
    const std::string typed = "fn\\s+greet";
    for (std::size_t n = 1; n <= typed.size(); ++n) {
        cache.compile(typed.substr(0, n));
    }
    // "fn\" is a dangling escape and is not kept
    EXPECT_EQ(cache.size(), typed.size() - 1);

    auto again = cache.compile("fn");
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(cache.size(), typed.size() - 1);
}
