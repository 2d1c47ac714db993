#include <gtest/gtest.h>

#include "http_fetcher.hpp"
#include "search_tools.hpp"
#include "test_support.hpp"

using namespace chatgen;
using chatgen::fakes::FakeFetcher;

class SearchToolsTest : public ::testing::Test {
 protected:
  FakeFetcher fetcher;
  ToolRegistry registry;

  void SetUp() override {
    RegisterBraveTools(&registry, "brave-key", &fetcher);
    RegisterYouTubeTools(&registry, "yt-key", &fetcher);
  }

  ToolResult Call(const std::string& name, nlohmann::json args) {
    return registry.Execute(ToolCall{"call-1", name, std::move(args)});
  }
};

TEST_F(SearchToolsTest, WebSearchMapsResults) {
  nlohmann::json body = {
      {"web",
       {{"results", nlohmann::json::array({{{"title", "Rust 2.0"}, {"url", "https://a.example"},
                                            {"description", "news"}, {"age", "2 days ago"}},
                                           {{"title", "Other"}, {"url", "https://b.example"}}})}}}};
  fetcher.Set("https://api.search.brave.com/res/v1/web/search?q=rust%20release&count=2", 200, body.dump());

  auto r = Call("brave_web_search", {{"query", "rust release"}, {"count", 2}});
  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.result["query"], "rust release");
  EXPECT_EQ(r.result["resultCount"], 2);
  EXPECT_EQ(r.result["results"][0]["age"], "2 days ago");
  EXPECT_EQ(r.result["results"][1]["description"], "");

  bool saw_token = false;
  for (const auto& [k, v] : fetcher.last_headers()) {
    if (k == "X-Subscription-Token" && v == "brave-key") saw_token = true;
  }
  EXPECT_TRUE(saw_token);
}

TEST_F(SearchToolsTest, NewsSearchAddsSource) {
  nlohmann::json body = {
      {"results", nlohmann::json::array({{{"title", "Launch"}, {"url", "https://n.example/x"},
                                          {"meta_url", {{"hostname", "n.example"}}}}})}};
  fetcher.Set("https://api.search.brave.com/res/v1/news/search?q=launch&count=10", 200, body.dump());

  auto r = Call("brave_news_search", {{"query", "launch"}});
  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.result["results"][0]["source"], "n.example");
}

TEST_F(SearchToolsTest, CountIsClamped) {
  fetcher.Set("https://api.search.brave.com/res/v1/web/search?q=x&count=20", 200, "{}");
  auto r = Call("brave_web_search", {{"query", "x"}, {"count", 500}});
  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.result["resultCount"], 0);
}

TEST_F(SearchToolsTest, ErrorsBecomeToolResults) {
  auto missing = Call("brave_web_search", nlohmann::json::object());
  EXPECT_FALSE(missing.ok);
  EXPECT_EQ(missing.result["error"], "missing required field: query");

  fetcher.Set("https://api.search.brave.com/res/v1/web/search?q=limited&count=10", 429, "");
  auto limited = Call("brave_web_search", {{"query", "limited"}});
  EXPECT_FALSE(limited.ok);
  EXPECT_EQ(limited.result["error"], "Brave Search API error: 429");

  auto offline = Call("brave_web_search", {{"query", "offline"}});
  EXPECT_FALSE(offline.ok);
  EXPECT_EQ(offline.result["error"], "Search failed: connection refused");
}

TEST_F(SearchToolsTest, ThrowingFetcherIsContained) {
  fetcher.SetThrow(true);
  auto r = Call("brave_web_search", {{"query", "boom"}});
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.result["error"], "Search failed: fetcher exploded");
}

TEST_F(SearchToolsTest, YouTubeSearchMergesStatistics) {
  nlohmann::json search = {
      {"items", nlohmann::json::array({{{"id", {{"videoId", "v1"}}},
                                        {"snippet", {{"title", "Intro"}, {"channelTitle", "Chan"}}}}})}};
  nlohmann::json stats = {
      {"items", nlohmann::json::array({{{"id", "v1"},
                                        {"statistics", {{"viewCount", "42"}}},
                                        {"contentDetails", {{"duration", "PT3M"}}}}})}};
  fetcher.Set("https://www.googleapis.com/youtube/v3/search?part=snippet&q=cats&type=video&maxResults=10&key=yt-key",
              200, search.dump());
  fetcher.Set("https://www.googleapis.com/youtube/v3/videos?part=statistics%2CcontentDetails&id=v1&key=yt-key", 200,
              stats.dump());

  auto r = Call("youtube_search", {{"query", "cats"}});
  ASSERT_TRUE(r.ok) << r.error;
  ASSERT_EQ(r.result["resultCount"], 1);
  EXPECT_EQ(r.result["results"][0]["videoId"], "v1");
  EXPECT_EQ(r.result["results"][0]["viewCount"], "42");
  EXPECT_EQ(r.result["results"][0]["duration"], "PT3M");
}

TEST_F(SearchToolsTest, YouTubeStatsFailureKeepsResults) {
  nlohmann::json search = {{"items", nlohmann::json::array({{{"id", {{"videoId", "v2"}}}}})}};
  fetcher.Set("https://www.googleapis.com/youtube/v3/search?part=snippet&q=dogs&type=video&maxResults=10&key=yt-key",
              200, search.dump());

  auto r = Call("youtube_search", {{"query", "dogs"}});
  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.result["results"][0]["videoId"], "v2");
  EXPECT_FALSE(r.result["results"][0].contains("viewCount"));
}

TEST_F(SearchToolsTest, TruncateUtf8CountsCodePoints) {
  EXPECT_EQ(TruncateUtf8("héllo", 2), "hé");
  EXPECT_EQ(TruncateUtf8("abc", 10), "abc");
}

TEST(HttpFetcherTest, BuildsEncodedQuery) {
  EXPECT_EQ(UrlEncode("a b&c"), "a%20b%26c");
  EXPECT_EQ(BuildQuery({{"q", "x y"}, {"n", "1"}}), "q=x%20y&n=1");
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
