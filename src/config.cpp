#include "config.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace chatgen {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static std::string TrimSpaces(std::string v) {
  while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.erase(v.begin());
  while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
  return v;
}

static void ReadIntEnv(const char* name, int min_value, int* out) {
  auto raw = GetEnvStr(name);
  if (raw.empty()) return;
  char* end = nullptr;
  const long v = std::strtol(raw.c_str(), &end, 10);
  if (end == raw.c_str() || *end != '\0' || v < min_value) {
    std::cout << "[config] ignoring " << name << "=" << raw << "\n";
    return;
  }
  *out = static_cast<int>(v);
}

static void ReadBoolEnv(const char* name, bool* out) {
  auto raw = GetEnvStr(name);
  if (raw.empty()) return;
  if (!TryParseBool(raw, out)) std::cout << "[config] ignoring " << name << "=" << raw << "\n";
}

static const char* kDefaultModels =
    "gemini-3-flash-preview,gemini-3-pro-preview,gemini-2.5-flash,gemini-2.5-pro,gemini-2.5-flash-image,"
    "gemini-2.0-flash";

}  // namespace

std::optional<HttpEndpoint> ParseHttpEndpoint(const std::string& url) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = TrimSpaces(url);
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  } else if (s.find("://") != std::string::npos) {
    return std::nullopt;
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  if (ep.base_path == "/") ep.base_path.clear();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
    if (ep.port <= 0 || ep.port > 65535) return std::nullopt;
  } else {
    ep.host = s;
  }
  if (ep.host.empty()) return std::nullopt;
  if (ep.port == 0) ep.port = ep.scheme == "https" ? 443 : 80;
  return ep;
}

std::string EndpointUrl(const HttpEndpoint& ep) {
  return ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port) + ep.base_path;
}

std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      cur = TrimSpaces(cur);
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  cur = TrimSpaces(cur);
  if (!cur.empty()) out.push_back(cur);
  return out;
}

bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(TrimSpaces(s));
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

std::vector<McpServerConfig> ParseMcpServers(const std::string& csv) {
  std::vector<McpServerConfig> out;
  for (const auto& item : SplitCsv(csv)) {
    auto eq = item.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cout << "[config] ignoring mcp server entry=" << item << "\n";
      continue;
    }
    McpServerConfig server;
    server.slug = ToLower(TrimSpaces(item.substr(0, eq)));
    auto ep = ParseHttpEndpoint(item.substr(eq + 1));
    if (!ep || server.slug.empty()) {
      std::cout << "[config] ignoring mcp server entry=" << item << "\n";
      continue;
    }
    server.endpoint = *ep;
    out.push_back(std::move(server));
  }
  return out;
}

RuntimeConfig LoadConfigFromEnv() {
  RuntimeConfig cfg;

  if (auto host = GetEnvStr("RUNTIME_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  ReadIntEnv("RUNTIME_LISTEN_PORT", 1, &cfg.listen.port);

  cfg.gemini_api_key = GetEnvStr("GOOGLE_GENERATIVE_AI_API_KEY");
  cfg.gemini_endpoint = *ParseHttpEndpoint("https://generativelanguage.googleapis.com");
  if (auto ep = GetEnvStr("GEMINI_ENDPOINT"); !ep.empty()) {
    if (auto parsed = ParseHttpEndpoint(ep)) {
      cfg.gemini_endpoint = *parsed;
    } else {
      std::cout << "[config] ignoring GEMINI_ENDPOINT=" << ep << "\n";
    }
  }

  auto models = GetEnvStr("RUNTIME_MODELS");
  cfg.models = SplitCsv(models.empty() ? kDefaultModels : models);
  if (auto m = GetEnvStr("RUNTIME_DEFAULT_MODEL"); !m.empty()) cfg.default_model = m;
  if (auto m = GetEnvStr("RUNTIME_CLASSIFIER_MODEL"); !m.empty()) cfg.classifier_model = m;
  if (auto m = GetEnvStr("RUNTIME_TITLE_MODEL"); !m.empty()) cfg.title_model = m;

  cfg.brave_api_key = GetEnvStr("BRAVE_API_KEY");
  cfg.youtube_api_key = GetEnvStr("YOUTUBE_API_KEY");
  if (auto mcp = GetEnvStr("MCP_SERVERS"); !mcp.empty()) cfg.mcp_servers = ParseMcpServers(mcp);
  ReadIntEnv("MCP_CONNECT_TIMEOUT_S", 1, &cfg.mcp_connect_timeout_s);
  ReadIntEnv("MCP_READ_TIMEOUT_S", 1, &cfg.mcp_read_timeout_s);

  if (auto t = GetEnvStr("RUNTIME_LEDGER_STORE"); !t.empty()) cfg.ledger_store_type = ToLower(t);
  cfg.ledger_store_path = GetEnvStr("RUNTIME_LEDGER_PATH");
  if (cfg.ledger_store_type == "file" && cfg.ledger_store_path.empty()) cfg.ledger_store_path = "generation_ledger.json";
  if (auto t = GetEnvStr("RUNTIME_MESSAGE_STORE"); !t.empty()) cfg.message_store_type = ToLower(t);
  cfg.message_store_path = GetEnvStr("RUNTIME_MESSAGE_STORE_PATH");
  if (cfg.message_store_type == "file" && cfg.message_store_path.empty()) cfg.message_store_path = "messages.json";

  ReadIntEnv("RUNTIME_STALE_AFTER_S", 1, &cfg.stale_after_s);
  ReadIntEnv("RUNTIME_RECONCILE_INTERVAL_S", 0, &cfg.reconcile_interval_s);
  ReadIntEnv("RUNTIME_MAX_STEPS", 1, &cfg.max_steps);
  ReadIntEnv("RUNTIME_CHECKPOINT_INTERVAL_MS", 0, &cfg.checkpoint_interval_ms);
  ReadIntEnv("RUNTIME_HEARTBEAT_INTERVAL_MS", 0, &cfg.heartbeat_interval_ms);
  ReadIntEnv("RUNTIME_GENERATION_TIMEOUT_S", 1, &cfg.generation_timeout_s);
  ReadBoolEnv("RUNTIME_CONTINUE_ON_DISCONNECT", &cfg.continue_on_disconnect);

  if (auto h = GetEnvStr("RUNTIME_IDENTITY_HEADER"); !h.empty()) cfg.identity_header = h;
  ReadBoolEnv("RUNTIME_REQUIRE_IDENTITY", &cfg.require_identity);

  return cfg;
}

}  // namespace chatgen
