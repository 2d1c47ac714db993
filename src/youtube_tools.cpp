#include "search_tools.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chatgen {
namespace {

constexpr const char* kYouTubeApiBase = "https://www.googleapis.com/youtube/v3";
constexpr const char* kTimedTextUrl = "https://www.youtube.com/api/timedtext";

static std::string JsonString(const nlohmann::json& j, const char* key) {
  if (!j.is_object() || !j.contains(key) || !j[key].is_string()) return {};
  return j[key].get<std::string>();
}

static std::string JoinIds(const std::vector<std::string>& ids) {
  std::string out;
  for (const auto& id : ids) {
    if (!out.empty()) out += ",";
    out += id;
  }
  return out;
}

static std::string Thumbnail(const nlohmann::json& snippet) {
  if (!snippet.contains("thumbnails") || !snippet["thumbnails"].is_object()) return {};
  const auto& t = snippet["thumbnails"];
  for (const char* size : {"medium", "default"}) {
    if (t.contains(size) && t[size].is_object()) {
      auto url = JsonString(t[size], "url");
      if (!url.empty()) return url;
    }
  }
  return {};
}

static nlohmann::json VideoFromSnippet(const std::string& video_id, const nlohmann::json& snippet) {
  return {{"videoId", video_id},
          {"title", JsonString(snippet, "title")},
          {"description", JsonString(snippet, "description")},
          {"channelTitle", JsonString(snippet, "channelTitle")},
          {"channelId", JsonString(snippet, "channelId")},
          {"publishedAt", JsonString(snippet, "publishedAt")},
          {"thumbnailUrl", Thumbnail(snippet)}};
}

static void MergeStats(const nlohmann::json& item, nlohmann::json* video) {
  if (item.contains("statistics") && item["statistics"].is_object()) {
    if (auto v = JsonString(item["statistics"], "viewCount"); !v.empty()) (*video)["viewCount"] = v;
    if (auto v = JsonString(item["statistics"], "likeCount"); !v.empty()) (*video)["likeCount"] = v;
  }
  if (item.contains("contentDetails") && item["contentDetails"].is_object()) {
    if (auto v = JsonString(item["contentDetails"], "duration"); !v.empty()) (*video)["duration"] = v;
  }
}

static std::optional<nlohmann::json> FetchJson(IHttpFetcher* fetcher,
                                               const std::string& url,
                                               const char* label,
                                               std::string* err) {
  std::string ferr;
  auto res = fetcher->Get(url, {{"Accept", "application/json"}}, &ferr);
  if (!res) {
    *err = std::string(label) + " failed: " + ferr;
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    *err = "YouTube API error: " + std::to_string(res->status);
    return std::nullopt;
  }
  auto j = nlohmann::json::parse(res->body, nullptr, false);
  if (j.is_discarded()) {
    *err = std::string(label) + " failed: invalid json response";
    return std::nullopt;
  }
  return j;
}

static ToolResult Search(const std::string& api_key,
                         IHttpFetcher* fetcher,
                         const std::string& id,
                         const nlohmann::json& args) {
  constexpr const char* kName = "youtube_search";
  const auto query = JsonString(args, "query");
  if (query.empty()) return MakeToolError(id, kName, "missing required field: query");
  int max_results = 10;
  if (args.contains("maxResults") && args["maxResults"].is_number()) {
    max_results = static_cast<int>(args["maxResults"].get<double>());
  }
  max_results = std::min(std::max(max_results, 1), 50);

  std::string err;
  const auto url = std::string(kYouTubeApiBase) + "/search?" +
                   BuildQuery({{"part", "snippet"},
                               {"q", TruncateUtf8(query, 100)},
                               {"type", "video"},
                               {"maxResults", std::to_string(max_results)},
                               {"key", api_key}});
  auto data = FetchJson(fetcher, url, "YouTube search", &err);
  if (!data) return MakeToolError(id, kName, err);

  nlohmann::json results = nlohmann::json::array();
  std::vector<std::string> ids;
  if (data->contains("items") && (*data)["items"].is_array()) {
    for (const auto& item : (*data)["items"]) {
      if (!item.is_object() || !item.contains("id") || !item["id"].is_object()) continue;
      auto video_id = JsonString(item["id"], "videoId");
      if (video_id.empty()) continue;
      const auto snippet = item.contains("snippet") ? item["snippet"] : nlohmann::json::object();
      results.push_back(VideoFromSnippet(video_id, snippet));
      ids.push_back(video_id);
    }
  }

  // Statistics are best effort; a failed lookup leaves the search results as they are.
  if (!ids.empty()) {
    std::string stats_err;
    const auto stats_url = std::string(kYouTubeApiBase) + "/videos?" +
                           BuildQuery({{"part", "statistics,contentDetails"}, {"id", JoinIds(ids)}, {"key", api_key}});
    if (auto stats = FetchJson(fetcher, stats_url, "YouTube stats", &stats_err)) {
      std::map<std::string, nlohmann::json> by_id;
      if (stats->contains("items") && (*stats)["items"].is_array()) {
        for (const auto& item : (*stats)["items"]) {
          auto vid = JsonString(item, "id");
          if (!vid.empty()) by_id[vid] = item;
        }
      }
      for (auto& r : results) {
        auto it = by_id.find(r["videoId"].get<std::string>());
        if (it != by_id.end()) MergeStats(it->second, &r);
      }
    } else {
      std::cout << "[youtube] stats lookup skipped error=" << stats_err << "\n";
    }
  }

  ToolResult r;
  r.tool_call_id = id;
  r.name = kName;
  r.result = {{"query", query}, {"resultCount", results.size()}, {"results", results}};
  return r;
}

static ToolResult Details(const std::string& api_key,
                          IHttpFetcher* fetcher,
                          const std::string& id,
                          const nlohmann::json& args) {
  constexpr const char* kName = "youtube_video_details";
  std::vector<std::string> ids;
  if (args.contains("videoIds") && args["videoIds"].is_array()) {
    for (const auto& v : args["videoIds"]) {
      if (v.is_string() && !v.get<std::string>().empty()) ids.push_back(v.get<std::string>());
    }
  }
  if (ids.empty()) return MakeToolError(id, kName, "No video IDs provided");
  std::vector<std::string> requested = ids;
  if (ids.size() > 50) ids.resize(50);

  std::string err;
  const auto url = std::string(kYouTubeApiBase) + "/videos?" +
                   BuildQuery({{"part", "snippet,statistics,contentDetails"}, {"id", JoinIds(ids)}, {"key", api_key}});
  auto data = FetchJson(fetcher, url, "YouTube details", &err);
  if (!data) return MakeToolError(id, kName, err);

  nlohmann::json results = nlohmann::json::array();
  if (data->contains("items") && (*data)["items"].is_array()) {
    for (const auto& item : (*data)["items"]) {
      auto vid = JsonString(item, "id");
      if (vid.empty()) continue;
      const auto snippet = item.contains("snippet") ? item["snippet"] : nlohmann::json::object();
      auto video = VideoFromSnippet(vid, snippet);
      MergeStats(item, &video);
      results.push_back(std::move(video));
    }
  }
  ToolResult r;
  r.tool_call_id = id;
  r.name = kName;
  r.result = {{"videoIds", requested}, {"resultCount", results.size()}, {"results", results}};
  return r;
}

static std::string CollapseWhitespace(const std::string& s) {
  std::string out;
  bool in_space = false;
  for (char c : s) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      in_space = true;
      continue;
    }
    if (in_space && !out.empty()) out.push_back(' ');
    in_space = false;
    out.push_back(c);
  }
  return out;
}

static ToolResult Transcript(IHttpFetcher* fetcher, const std::string& id, const nlohmann::json& args) {
  constexpr const char* kName = "youtube_get_transcript";
  const auto video_id = JsonString(args, "videoId");
  if (video_id.empty()) return MakeToolError(id, kName, "missing required field: videoId");
  const auto lang = JsonString(args, "lang");

  auto fail = [&](const std::string& message) {
    auto r = MakeToolError(id, kName, message);
    r.result["videoId"] = video_id;
    return r;
  };

  std::string err;
  const auto url =
      std::string(kTimedTextUrl) + "?" + BuildQuery({{"v", video_id}, {"lang", lang.empty() ? "en" : lang}, {"fmt", "json3"}});
  auto res = fetcher->Get(url, {}, &err);
  if (!res) return fail("Failed to fetch transcript: " + err);
  if (res->status == 404) return fail("Video is unavailable or private.");
  if (res->status < 200 || res->status >= 300) {
    return fail("Failed to fetch transcript: http " + std::to_string(res->status));
  }
  auto data = nlohmann::json::parse(res->body, nullptr, false);
  if (res->body.empty() || data.is_discarded() || !data.contains("events") || !data["events"].is_array()) {
    return fail("No transcript available for this video. The video may not have captions enabled.");
  }

  nlohmann::json segments = nlohmann::json::array();
  std::string full;
  for (const auto& ev : data["events"]) {
    if (!ev.is_object() || !ev.contains("segs") || !ev["segs"].is_array()) continue;
    std::string text;
    for (const auto& seg : ev["segs"]) text += JsonString(seg, "utf8");
    text = CollapseWhitespace(text);
    if (text.empty()) continue;
    const int64_t start = ev.value("tStartMs", static_cast<int64_t>(0));
    const int64_t duration = ev.value("dDurationMs", static_cast<int64_t>(0));
    segments.push_back({{"text", text}, {"startMs", start}, {"endMs", start + duration}});
    if (!full.empty()) full += " ";
    full += text;
  }
  if (segments.empty()) return fail("Transcript structure not available for this video.");

  nlohmann::json head = nlohmann::json::array();
  for (size_t i = 0; i < segments.size() && i < 50; i++) head.push_back(segments[i]);

  ToolResult r;
  r.tool_call_id = id;
  r.name = kName;
  r.result = {{"videoId", video_id},
              {"language", lang.empty() ? "auto" : lang},
              {"segmentCount", segments.size()},
              {"charCount", full.size()},
              {"transcript", full},
              {"segments", head}};
  return r;
}

}  // namespace

void RegisterYouTubeTools(ToolRegistry* registry, const std::string& api_key, IHttpFetcher* fetcher) {
  ToolSchema search;
  search.name = "youtube_search";
  search.description =
      "Search YouTube for videos. Use this to find videos about a topic, tutorials, entertainment, music, or any "
      "YouTube content.";
  search.parameters = {
      {"type", "object"},
      {"properties",
       {{"query", {{"type", "string"}, {"description", "Search query for YouTube videos"}}},
        {"maxResults", {{"type", "number"}, {"description", "Number of results to return (default 10, max 50)"}}}}},
      {"required", {"query"}}};
  registry->RegisterTool(search, [api_key, fetcher](const std::string& id, const nlohmann::json& args) {
    try {
      return Search(api_key, fetcher, id, args);
    } catch (const std::exception& e) {
      return MakeToolError(id, "youtube_search", std::string("YouTube search failed: ") + e.what());
    }
  });

  ToolSchema details;
  details.name = "youtube_video_details";
  details.description =
      "Get detailed information about specific YouTube videos by ID: view counts, likes, descriptions and other "
      "metadata.";
  details.parameters = {
      {"type", "object"},
      {"properties",
       {{"videoIds",
         {{"type", "array"}, {"items", {{"type", "string"}}}, {"description", "Array of YouTube video IDs"}}}}},
      {"required", {"videoIds"}}};
  registry->RegisterTool(details, [api_key, fetcher](const std::string& id, const nlohmann::json& args) {
    try {
      return Details(api_key, fetcher, id, args);
    } catch (const std::exception& e) {
      return MakeToolError(id, "youtube_video_details", std::string("YouTube details failed: ") + e.what());
    }
  });

  ToolSchema transcript;
  transcript.name = "youtube_get_transcript";
  transcript.description =
      "Get the transcript or captions of a YouTube video. Extract the video ID from the URL first.";
  transcript.parameters = {
      {"type", "object"},
      {"properties",
       {{"videoId", {{"type", "string"}, {"description", "YouTube video ID (e.g. \"dQw4w9WgXcQ\")"}}},
        {"lang", {{"type", "string"}, {"description", "Language code for the transcript (e.g. \"en\")"}}}}},
      {"required", {"videoId"}}};
  registry->RegisterTool(transcript, [fetcher](const std::string& id, const nlohmann::json& args) {
    try {
      return Transcript(fetcher, id, args);
    } catch (const std::exception& e) {
      return MakeToolError(id, "youtube_get_transcript", std::string("Failed to fetch transcript: ") + e.what());
    }
  });
}

}  // namespace chatgen
