#include "tool_capabilities.hpp"

#include "search_tools.hpp"

#include <cctype>
#include <iostream>
#include <set>
#include <string>
#include <utility>

namespace chatgen {
namespace {

static std::string ToLower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

// Gemini function names allow [A-Za-z0-9_.-] and must start with a letter or underscore.
static std::string ExposedToolName(const std::string& slug, const std::string& remote_name) {
  std::string out;
  for (char c : slug + "__" + remote_name) {
    const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
    out.push_back(ok ? c : '_');
  }
  if (out.size() > 64) out.resize(64);
  return out;
}

}  // namespace

std::vector<std::string> DefaultEnabledCapabilities() {
  return {"brave-search"};
}

std::string CanonicalCapability(const std::string& name) {
  const auto n = ToLower(name);
  if (n == "web-search" || n == "brave" || n == "brave_search") return "brave-search";
  if (n == "video" || n == "youtube-search") return "youtube";
  return n;
}

CapabilityToolProvider::CapabilityToolProvider(ToolCredentials credentials,
                                               IHttpFetcher* fetcher,
                                               std::vector<McpServerConfig> mcp_servers)
    : credentials_(std::move(credentials)), fetcher_(fetcher) {
  for (auto& s : mcp_servers) {
    RemoteServer rs;
    rs.client = std::make_shared<McpClient>(s.endpoint);
    remote_[s.slug] = std::move(rs);
  }
}

void CapabilityToolProvider::SetMcpTimeouts(int connect_seconds, int read_seconds) {
  std::lock_guard<std::mutex> lock(mu_);
  for (auto& [_, rs] : remote_) rs.client->SetTimeouts(connect_seconds, read_seconds, 30);
}

std::shared_ptr<const ToolRegistry> CapabilityToolProvider::LookupEnabledTools(
    const std::vector<std::string>& capabilities) {
  auto registry = std::make_shared<ToolRegistry>();
  std::set<std::string> seen;
  for (const auto& raw : capabilities) {
    const auto slug = CanonicalCapability(raw);
    if (!seen.insert(slug).second) continue;
    if (slug == "brave-search") {
      if (!credentials_.brave_api_key.empty()) RegisterBraveTools(registry.get(), credentials_.brave_api_key, fetcher_);
      continue;
    }
    if (slug == "youtube") {
      if (!credentials_.youtube_api_key.empty()) {
        RegisterYouTubeTools(registry.get(), credentials_.youtube_api_key, fetcher_);
      }
      continue;
    }
    RegisterRemoteTools(slug, registry.get());
  }
  std::cout << "[tools] capabilities=" << seen.size() << " tools=" << registry->Size() << "\n";
  return registry;
}

void CapabilityToolProvider::RegisterRemoteTools(const std::string& slug, ToolRegistry* registry) {
  std::shared_ptr<McpClient> client;
  std::vector<McpToolInfo> tools;
  bool discovered = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = remote_.find(slug);
    if (it == remote_.end()) return;
    client = it->second.client;
    discovered = it->second.discovered;
    if (discovered) tools = it->second.tools;
  }
  if (!client) return;

  // A server that listed no tools stays discovered; only failed discovery is retried.
  if (!discovered) {
    std::string err;
    if (!client->Initialize(&err)) {
      std::cout << "[mcp] slug=" << slug << " initialize failed error=" << err << "\n";
      return;
    }
    tools = client->ListTools(&err);
    if (!err.empty()) {
      std::cout << "[mcp] slug=" << slug << " tools/list failed error=" << err << "\n";
      return;
    }
    std::cout << "[mcp] slug=" << slug << " discovered=" << tools.size() << "\n";
    std::lock_guard<std::mutex> lock(mu_);
    auto& rs = remote_[slug];
    rs.tools = tools;
    rs.discovered = true;
  }

  for (const auto& info : tools) {
    ToolSchema schema;
    schema.name = ExposedToolName(slug, info.name);
    schema.description = info.description.empty() ? info.title : info.description;
    schema.parameters = info.input_schema.is_object() ? info.input_schema
                                                       : nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}};
    const auto remote_name = info.name;
    const auto exposed = schema.name;
    registry->RegisterTool(schema, [client, remote_name, exposed](const std::string& tool_call_id,
                                                                  const nlohmann::json& arguments) {
      std::string err;
      auto r = client->CallTool(remote_name, arguments, &err);
      if (!r) return MakeToolError(tool_call_id, exposed, err.empty() ? "mcp call failed" : err);
      ToolResult tr;
      tr.tool_call_id = tool_call_id;
      tr.name = exposed;
      bool is_error = false;
      tr.result = McpResultToToolOutput(*r, &is_error);
      if (is_error) {
        tr.ok = false;
        tr.error = tr.result.value("error", std::string("tool reported an error"));
      }
      return tr;
    });
  }
}

}  // namespace chatgen
