#include <gtest/gtest.h>
#include "shortener/errors.hpp"
#include "shortener/http/Pages.hpp"
#include "shortener/util/parse.hpp"
#include "shortener/util/time.hpp"

using namespace shortener;
using namespace shortener::util;

TEST(ParseTest, UrlDecodeBasics) {
    EXPECT_EQ(url_decode("https%3A%2F%2Fexample.com%2Fa%20b"), "https://example.com/a b");
    EXPECT_EQ(url_decode("a+b"), "a b");
    EXPECT_EQ(url_decode("a+b", /*plus_as_space=*/false), "a+b");
    EXPECT_EQ(url_decode("%e2%82%AC"), "\xE2\x82\xAC");
}

TEST(ParseTest, UrlDecodeRejectsBadEscapes) {
    EXPECT_THROW(url_decode("%"), ValidationError);
    EXPECT_THROW(url_decode("abc%4"), ValidationError);
    EXPECT_THROW(url_decode("%G1"), ValidationError);
    EXPECT_THROW(url_decode("%1z"), ValidationError);
}

TEST(ParseTest, UrlEncodeKeepsUnreserved) {
    EXPECT_EQ(url_encode("Az09-_.~"), "Az09-_.~");
    EXPECT_EQ(url_encode("a b/c+d"), "a%20b%2Fc%2Bd");
}

TEST(ParseTest, TargetPath) {
    EXPECT_EQ(target_path("/abc?x=1"), "/abc");
    EXPECT_EQ(target_path("/abc"), "/abc");
    EXPECT_EQ(target_path("/?created=x"), "/");
}

TEST(ParseTest, QueryParams) {
    const auto params = parse_query_params("/?created=abc123&flag&name=a+b");
    EXPECT_EQ(params.at("created"), "abc123");
    EXPECT_EQ(params.at("flag"), "");
    EXPECT_EQ(params.at("name"), "a b");
    EXPECT_TRUE(parse_query_params("/plain").empty());
}

TEST(ParseTest, FormBody) {
    const auto form = parse_form("long_url=https%3A%2F%2Fexample.com%3Fa%3D1%26b%3D2&custom_code=&expiration_date=2030-01-01");
    EXPECT_EQ(form.at("long_url"), "https://example.com?a=1&b=2");
    EXPECT_EQ(form.at("custom_code"), "");
    EXPECT_EQ(form.at("expiration_date"), "2030-01-01");
    EXPECT_TRUE(parse_form("").empty());
}

TEST(ParseTest, Trim) {
    EXPECT_EQ(trim("  a b \t\n"), "a b");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(TimeTest, ParseIsoDateIsMidnightUtc) {
    const auto epoch = parseIsoDate("1970-01-01");
    ASSERT_TRUE(epoch.has_value());
    EXPECT_EQ(toUnixSeconds(*epoch), 0);

    const auto day = parseIsoDate("2024-02-29");
    ASSERT_TRUE(day.has_value());
    EXPECT_EQ(toUnixSeconds(*day), 1709164800);
}

TEST(TimeTest, ParseIsoDateRejectsGarbage) {
    EXPECT_FALSE(parseIsoDate("").has_value());
    EXPECT_FALSE(parseIsoDate("2024-2-1").has_value());
    EXPECT_FALSE(parseIsoDate("2024/02/01").has_value());
    EXPECT_FALSE(parseIsoDate("2023-02-29").has_value());
    EXPECT_FALSE(parseIsoDate("2024-13-01").has_value());
    EXPECT_FALSE(parseIsoDate("2024-00-10").has_value());
    EXPECT_FALSE(parseIsoDate("2024-01-1x").has_value());
}

TEST(TimeTest, FormatIsoDate) {
    EXPECT_EQ(formatIsoDate(fromUnixSeconds(1709164800 + 3600 * 23)), "2024-02-29");
    EXPECT_EQ(formatIsoDate(*parseIsoDate("2031-12-31")), "2031-12-31");
}

TEST(PagesTest, HtmlEscape) {
    EXPECT_EQ(http::html_escape("<a href=\"x\">'&'</a>"), "&lt;a href=&quot;x&quot;&gt;&#39;&amp;&#39;&lt;/a&gt;");
}

TEST(PagesTest, PreviewLinksToRedirect) {
    ShortLink link;
    link.short_code = "abc";
    link.long_url = "https://example.com";
    link.clicks = 7;

    const auto page = http::renderPreview(link);
    EXPECT_NE(page.find("action=\"/abc\""), std::string::npos);
    EXPECT_NE(page.find("Clicks: 7"), std::string::npos);
    EXPECT_NE(page.find("https://example.com"), std::string::npos);
}

TEST(PagesTest, IndexShowsErrorAndKeepsInput) {
    http::IndexView view;
    view.error = "Custom code already exists.";
    view.long_url = "https://example.com";
    view.custom_code = "promo";

    const auto page = http::renderIndex(view);
    EXPECT_NE(page.find("Custom code already exists."), std::string::npos);
    EXPECT_NE(page.find("value=\"promo\""), std::string::npos);
    EXPECT_EQ(page.find("<table>"), std::string::npos);
}
