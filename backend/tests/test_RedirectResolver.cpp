#include "StoreFixture.hpp"
#include "shortener/ExpirationSweeper.hpp"
#include "shortener/RedirectResolver.hpp"

#include <thread>
#include <vector>

using namespace shortener;
using namespace std::chrono;

class RedirectResolverTest : public StoreFixture {
protected:
    Timestamp now_ = Clock::now();
    std::unique_ptr<ExpirationSweeper> sweeper_;
    std::unique_ptr<RedirectResolver> resolver_;

    void SetUp() override {
        StoreFixture::SetUp();
        sweeper_ = std::make_unique<ExpirationSweeper>(*store_);
        resolver_ = std::make_unique<RedirectResolver>(*store_, *sweeper_, [this] { return now_; });
    }
};

TEST(RedirectResolverParseTest, PlainCode) {
    const auto target = RedirectResolver::parseTarget("abc123");
    EXPECT_EQ(target.short_code, "abc123");
    EXPECT_FALSE(target.preview);
}

TEST(RedirectResolverParseTest, TrailingPlusMeansPreview) {
    const auto target = RedirectResolver::parseTarget("abc123+");
    EXPECT_EQ(target.short_code, "abc123");
    EXPECT_TRUE(target.preview);
}

TEST(RedirectResolverParseTest, OnlyOneMarkerStripped) {
    const auto target = RedirectResolver::parseTarget("abc++");
    EXPECT_EQ(target.short_code, "abc+");
    EXPECT_TRUE(target.preview);
}

TEST(RedirectResolverParseTest, InnerPlusIsPartOfCode) {
    const auto target = RedirectResolver::parseTarget("a+b");
    EXPECT_EQ(target.short_code, "a+b");
    EXPECT_FALSE(target.preview);
}

TEST_F(RedirectResolverTest, UnknownCodeIsNotFound) {
    EXPECT_EQ(resolver_->resolve("missing", false).outcome, Resolution::Outcome::NotFound);
    EXPECT_EQ(resolver_->resolve("missing", true).outcome, Resolution::Outcome::NotFound);
}

TEST_F(RedirectResolverTest, RedirectIncrementsClicks) {
    store_->create("https://example.com", "go");

    const auto first = resolver_->resolve("go", false);
    ASSERT_EQ(first.outcome, Resolution::Outcome::Redirect);
    EXPECT_EQ(first.link.long_url, "https://example.com");
    EXPECT_EQ(first.link.clicks, 1);

    const auto second = resolver_->resolve("go", false);
    EXPECT_EQ(second.link.clicks, 2);
    EXPECT_EQ(store_->getByCode("go")->clicks, 2);
}

TEST_F(RedirectResolverTest, PreviewNeverCounts) {
    store_->create("https://example.com", "peek");
    resolver_->resolve("peek", false);

    for (int i = 0; i < 5; ++i) {
        const auto res = resolver_->resolve("peek", true);
        ASSERT_EQ(res.outcome, Resolution::Outcome::Preview);
        EXPECT_EQ(res.link.short_code, "peek");
        EXPECT_EQ(res.link.long_url, "https://example.com");
        EXPECT_EQ(res.link.clicks, 1);
    }
    EXPECT_EQ(store_->getByCode("peek")->clicks, 1);
}

TEST_F(RedirectResolverTest, ResolveParsedTarget) {
    store_->create("https://example.com", "tgt");
    EXPECT_EQ(resolver_->resolve(RedirectResolver::parseTarget("tgt+")).outcome, Resolution::Outcome::Preview);
    EXPECT_EQ(resolver_->resolve(RedirectResolver::parseTarget("tgt")).outcome, Resolution::Outcome::Redirect);
}

TEST_F(RedirectResolverTest, ExpiredLinkIsSweptBeforeLookup) {
    store_->create("https://example.com", "old", now_ - hours(24));

    EXPECT_EQ(resolver_->resolve("old", false).outcome, Resolution::Outcome::NotFound);
    EXPECT_EQ(store_->count(), 0u);
}

TEST_F(RedirectResolverTest, ExpiredLinkHiddenFromPreviewToo) {
    store_->create("https://example.com", "oldp", now_ - seconds(1));
    EXPECT_EQ(resolver_->resolve("oldp", true).outcome, Resolution::Outcome::NotFound);
}

TEST_F(RedirectResolverTest, LinkExpiresWhenClockPassesIt) {
    store_->create("https://example.com", "soon", now_ + hours(1));
    EXPECT_EQ(resolver_->resolve("soon", false).outcome, Resolution::Outcome::Redirect);

    now_ += hours(2);
    EXPECT_EQ(resolver_->resolve("soon", false).outcome, Resolution::Outcome::NotFound);
}

TEST_F(RedirectResolverTest, ConcurrentRedirectsCountEachOnce) {
    store_->create("https://example.com", "busy");

    constexpr int threads = 6;
    constexpr int perThread = 20;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t)
        workers.emplace_back([this] {
            for (int i = 0; i < perThread; ++i) resolver_->resolve("busy", false);
        });
    for (auto& w : workers) w.join();

    EXPECT_EQ(store_->getByCode("busy")->clicks, threads * perThread);
}
