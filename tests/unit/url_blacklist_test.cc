#include "core/ink_url_blacklist.h"
#include <gtest/gtest.h>

namespace ink {
namespace {

TEST(UrlBlacklistTest, WildcardMatchIsAnchored) {
  EXPECT_TRUE(WildcardMatch("a.png", "*.png"));
  EXPECT_FALSE(WildcardMatch("a.png.txt", "*.png"));
  EXPECT_FALSE(WildcardMatch("xhttp://a", "http://*"));
  EXPECT_TRUE(WildcardMatch("", "*"));
  EXPECT_TRUE(WildcardMatch("", ""));
  EXPECT_FALSE(WildcardMatch("a", ""));
  EXPECT_TRUE(WildcardMatch("abcabd", "*ab*d"));
  EXPECT_FALSE(WildcardMatch("http://ab", "http://a?b"));
  EXPECT_TRUE(WildcardMatch("http://a?b", "http://a?b"));
}

TEST(UrlBlacklistTest, MatchesWholeUrlOnly) {
  UrlBlacklist blacklist({"*.google-analytics.com/*"});
  EXPECT_TRUE(blacklist.Matches("https://www.google-analytics.com/analytics.js"));
  EXPECT_FALSE(blacklist.Matches("https://example.com/page"));
  EXPECT_FALSE(blacklist.Matches("https://www.google-analytics.com"));
}

TEST(UrlBlacklistTest, RegexCharactersAreLiteral) {
  UrlBlacklist blacklist({"http://example.com/a+b(1).js"});
  EXPECT_TRUE(blacklist.Matches("http://example.com/a+b(1).js"));
  EXPECT_FALSE(blacklist.Matches("http://example.com/aab1.js"));
}

TEST(UrlBlacklistTest, MatchIsCaseSensitive) {
  UrlBlacklist blacklist({"*/Banner*"});
  EXPECT_TRUE(blacklist.Matches("http://ads.example.com/Banner.gif"));
  EXPECT_FALSE(blacklist.Matches("http://ads.example.com/banner.gif"));
}

TEST(UrlBlacklistTest, AllowedUrlsAreNeverBlocked) {
  UrlBlacklist blacklist({"file://*"});
  std::set<std::string> allowed = {"file:///tmp/work/page.html"};
  EXPECT_FALSE(blacklist.ShouldBlock("file:///tmp/work/page.html", allowed));
  EXPECT_TRUE(blacklist.ShouldBlock("file:///etc/passwd", allowed));
}

TEST(UrlBlacklistTest, MegabyteUrlsAreMatched) {
  UrlBlacklist blacklist({"*.example*"});
  std::string query(2 * 1024 * 1024, 'a');

  EXPECT_FALSE(blacklist.ShouldBlock("http://cdn.site.com/x?q=" + query, {}));
  EXPECT_TRUE(blacklist.ShouldBlock("http://cdn.example.com/x?q=" + query, {}));
  EXPECT_TRUE(blacklist.ShouldBlock("http://cdn.site.com/x?q=" + query + ".example", {}));
}

TEST(UrlBlacklistTest, ManyWildcardsOnLongUrlStayFast) {
  UrlBlacklist blacklist({"*a*a*a*a*a*b"});
  std::string url = "http://site.com/" + std::string(1024 * 1024, 'a');
  EXPECT_FALSE(blacklist.Matches(url));
  EXPECT_TRUE(blacklist.Matches(url + "b"));
}

TEST(UrlBlacklistTest, EmptyBlacklistBlocksNothing) {
  UrlBlacklist blacklist;
  EXPECT_TRUE(blacklist.empty());
  EXPECT_FALSE(blacklist.ShouldBlock("http://anything", {}));

  blacklist.SetPatterns({"*"});
  EXPECT_FALSE(blacklist.empty());
  EXPECT_TRUE(blacklist.ShouldBlock("http://anything", {}));
}

}  // namespace
}  // namespace ink
