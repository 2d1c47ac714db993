#pragma once

#include "config.hpp"
#include "http_fetcher.hpp"
#include "mcp_client.hpp"
#include "tooling.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chatgen {

struct ToolCredentials {
  std::string brave_api_key;
  std::string youtube_api_key;
};

// Requests that do not name their capabilities get web search.
std::vector<std::string> DefaultEnabledCapabilities();

// Maps aliases onto the canonical slug ("web-search" -> "brave-search", "video" -> "youtube").
std::string CanonicalCapability(const std::string& name);

// Builds the concrete tool set for a list of capability slugs. A capability whose credential is missing, or
// whose remote server cannot be reached, contributes nothing; an empty registry is a normal outcome.
class CapabilityToolProvider : public IToolProvider {
 public:
  CapabilityToolProvider(ToolCredentials credentials, IHttpFetcher* fetcher, std::vector<McpServerConfig> mcp_servers = {});

  std::shared_ptr<const ToolRegistry> LookupEnabledTools(const std::vector<std::string>& capabilities) override;
  void SetMcpTimeouts(int connect_seconds, int read_seconds);

 private:
  struct RemoteServer {
    std::shared_ptr<McpClient> client;
    std::vector<McpToolInfo> tools;
    bool discovered = false;
  };

  ToolCredentials credentials_;
  IHttpFetcher* fetcher_;
  std::mutex mu_;
  std::unordered_map<std::string, RemoteServer> remote_;

  void RegisterRemoteTools(const std::string& slug, ToolRegistry* registry);
};

}  // namespace chatgen
