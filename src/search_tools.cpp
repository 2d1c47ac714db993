#include "search_tools.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace chatgen {
namespace {

constexpr const char* kBraveApiBase = "https://api.search.brave.com/res/v1";

static std::string JsonString(const nlohmann::json& j, const char* key) {
  if (!j.is_object() || !j.contains(key) || !j[key].is_string()) return {};
  return j[key].get<std::string>();
}

static int ClampCount(const nlohmann::json& args, const char* key, int def, int lo, int hi) {
  int v = def;
  if (args.contains(key) && args[key].is_number()) v = static_cast<int>(args[key].get<double>());
  return std::min(std::max(v, lo), hi);
}

struct BraveEndpoint {
  const char* tool_name;
  const char* path;
  const char* label;
  const char* description;
  const char* query_description;
};

static nlohmann::json BraveParameters(const BraveEndpoint& ep) {
  return {{"type", "object"},
          {"properties",
           {{"query", {{"type", "string"}, {"description", ep.query_description}}},
            {"count", {{"type", "number"}, {"description", "Number of results to return (default 10)"}}}}},
          {"required", {"query"}}};
}

static nlohmann::json MapBraveResults(const nlohmann::json& items, bool news, int count) {
  nlohmann::json out = nlohmann::json::array();
  if (!items.is_array()) return out;
  for (const auto& r : items) {
    if (static_cast<int>(out.size()) >= count) break;
    if (!r.is_object()) continue;
    nlohmann::json item;
    item["title"] = JsonString(r, "title");
    item["url"] = JsonString(r, "url");
    item["description"] = JsonString(r, "description");
    if (auto age = JsonString(r, "age"); !age.empty()) item["age"] = age;
    if (news && r.contains("meta_url") && r["meta_url"].is_object()) {
      if (auto host = JsonString(r["meta_url"], "hostname"); !host.empty()) item["source"] = host;
    }
    out.push_back(std::move(item));
  }
  return out;
}

static ToolResult RunBraveSearch(const BraveEndpoint& ep,
                                 const std::string& api_key,
                                 IHttpFetcher* fetcher,
                                 const std::string& tool_call_id,
                                 const nlohmann::json& args) {
  const auto query = JsonString(args, "query");
  if (query.empty()) return MakeToolError(tool_call_id, ep.tool_name, "missing required field: query");
  const int count = ClampCount(args, "count", 10, 1, 20);
  try {
    const std::string url = std::string(kBraveApiBase) + ep.path + "?" +
                            BuildQuery({{"q", TruncateUtf8(query, 400)}, {"count", std::to_string(count)}});
    std::string err;
    auto res = fetcher->Get(url, {{"Accept", "application/json"}, {"X-Subscription-Token", api_key}}, &err);
    if (!res) return MakeToolError(tool_call_id, ep.tool_name, "Search failed: " + err);
    if (res->status < 200 || res->status >= 300) {
      return MakeToolError(tool_call_id, ep.tool_name,
                           std::string(ep.label) + " API error: " + std::to_string(res->status));
    }
    auto data = nlohmann::json::parse(res->body, nullptr, false);
    if (data.is_discarded()) return MakeToolError(tool_call_id, ep.tool_name, "Search failed: invalid json response");

    const bool news = std::string(ep.path) == "/news/search";
    nlohmann::json items;
    if (news) {
      if (data.contains("results")) items = data["results"];
    } else if (data.contains("web") && data["web"].is_object() && data["web"].contains("results")) {
      items = data["web"]["results"];
    }
    ToolResult r;
    r.tool_call_id = tool_call_id;
    r.name = ep.tool_name;
    auto results = MapBraveResults(items, news, count);
    r.result = {{"query", query}, {"resultCount", results.size()}, {"results", std::move(results)}};
    return r;
  } catch (const std::exception& e) {
    return MakeToolError(tool_call_id, ep.tool_name, std::string("Search failed: ") + e.what());
  }
}

}  // namespace

std::string TruncateUtf8(const std::string& s, size_t max_code_points) {
  size_t count = 0;
  for (size_t i = 0; i < s.size(); i++) {
    const auto c = static_cast<unsigned char>(s[i]);
    if ((c & 0xC0) == 0x80) continue;
    if (count == max_code_points) return s.substr(0, i);
    count++;
  }
  return s;
}

void RegisterBraveTools(ToolRegistry* registry, const std::string& api_key, IHttpFetcher* fetcher) {
  static const BraveEndpoint kEndpoints[] = {
      {"brave_web_search", "/web/search", "Brave Search",
       "Search the web for current information. Use this for up-to-date facts, news, or any web content.",
       "The search query"},
      {"brave_news_search", "/news/search", "Brave News",
       "Search for recent news articles. Use this for current news, headlines, or recent events.",
       "The news search query"},
  };
  for (const auto& ep : kEndpoints) {
    ToolSchema schema;
    schema.name = ep.tool_name;
    schema.description = ep.description;
    schema.parameters = BraveParameters(ep);
    registry->RegisterTool(schema, [&ep, api_key, fetcher](const std::string& tool_call_id,
                                                           const nlohmann::json& arguments) {
      return RunBraveSearch(ep, api_key, fetcher, tool_call_id, arguments);
    });
  }
}

}  // namespace chatgen
