#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chatgen {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 8080;
};

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 80;
  std::string base_path;
};

// A remote Model Context Protocol server reachable under a capability slug.
struct McpServerConfig {
  std::string slug;
  HttpEndpoint endpoint;
};

struct RuntimeConfig {
  HttpListenConfig listen;

  std::string gemini_api_key;
  HttpEndpoint gemini_endpoint;
  std::vector<std::string> models;
  std::string default_model = "gemini-3-flash-preview";
  std::string classifier_model = "gemini-2.0-flash";
  std::string title_model = "gemini-2.5-flash-lite";

  std::string brave_api_key;
  std::string youtube_api_key;
  std::vector<McpServerConfig> mcp_servers;
  int mcp_connect_timeout_s = 5;
  int mcp_read_timeout_s = 60;

  std::string ledger_store_type = "memory";
  std::string ledger_store_path;
  std::string message_store_type = "memory";
  std::string message_store_path;

  int stale_after_s = 30;
  int reconcile_interval_s = 60;
  int max_steps = 5;
  int checkpoint_interval_ms = 1000;
  int heartbeat_interval_ms = 5000;
  int generation_timeout_s = 300;
  bool continue_on_disconnect = false;

  std::string identity_header = "X-User-Id";
  bool require_identity = true;
};

RuntimeConfig LoadConfigFromEnv();

// Accepts "http://host:port/base", "https://host", "host:port". Missing ports default per scheme.
std::optional<HttpEndpoint> ParseHttpEndpoint(const std::string& url);
std::string EndpointUrl(const HttpEndpoint& ep);

// "slug=url,slug2=url2"
std::vector<McpServerConfig> ParseMcpServers(const std::string& csv);

std::vector<std::string> SplitCsv(const std::string& s);
bool TryParseBool(const std::string& s, bool* out);

}  // namespace chatgen
