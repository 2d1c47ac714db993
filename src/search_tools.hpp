#pragma once

#include "http_fetcher.hpp"
#include "tooling.hpp"

#include <string>

namespace chatgen {

// brave_web_search and brave_news_search against the Brave Search API.
void RegisterBraveTools(ToolRegistry* registry, const std::string& api_key, IHttpFetcher* fetcher);

// youtube_search, youtube_video_details and youtube_get_transcript.
void RegisterYouTubeTools(ToolRegistry* registry, const std::string& api_key, IHttpFetcher* fetcher);

// Keeps at most max_code_points UTF-8 code points.
std::string TruncateUtf8(const std::string& s, size_t max_code_points);

}  // namespace chatgen
