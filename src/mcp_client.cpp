#include "mcp_client.hpp"

#include <httplib.h>

#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace chatgen {
namespace {

constexpr const char* kProtocolVersion = "2025-03-26";

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep,
                                                   int connect_timeout_seconds,
                                                   int read_timeout_seconds,
                                                   int write_timeout_seconds) {
  auto cli = std::make_unique<httplib::Client>(ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port));
  cli->set_connection_timeout(connect_timeout_seconds);
  cli->set_read_timeout(read_timeout_seconds);
  cli->set_write_timeout(write_timeout_seconds);
  return cli;
}

static std::string ExtractJsonRpcError(const nlohmann::json& resp) {
  if (!resp.is_object()) return "invalid json-rpc response";
  if (!resp.contains("error") || !resp["error"].is_object()) return {};
  const auto& e = resp["error"];
  std::string msg;
  if (e.contains("message") && e["message"].is_string()) msg = e["message"].get<std::string>();
  if (msg.empty()) msg = "json-rpc error";
  return msg;
}

// Servers may answer a POST with a single-event SSE body instead of plain JSON.
static nlohmann::json ParseRpcBody(const std::string& body, const std::string& content_type) {
  if (content_type.find("text/event-stream") == std::string::npos) {
    return nlohmann::json::parse(body, nullptr, false);
  }
  size_t pos = 0;
  while (pos < body.size()) {
    auto end = body.find('\n', pos);
    if (end == std::string::npos) end = body.size();
    auto line = body.substr(pos, end - pos);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.rfind("data:", 0) == 0) {
      auto j = nlohmann::json::parse(line.substr(line.size() > 5 && line[5] == ' ' ? 6 : 5), nullptr, false);
      if (!j.is_discarded() && j.is_object() && (j.contains("result") || j.contains("error"))) return j;
    }
    pos = end + 1;
  }
  return nlohmann::json(nlohmann::json::value_t::discarded);
}

}  // namespace

McpClient::McpClient(HttpEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

void McpClient::SetTimeouts(int connect_seconds, int read_seconds, int write_seconds) {
  if (connect_seconds > 0) connect_timeout_seconds_ = connect_seconds;
  if (read_seconds > 0) read_timeout_seconds_ = read_seconds;
  if (write_seconds > 0) write_timeout_seconds_ = write_seconds;
}

void McpClient::SetMaxInFlight(int max_in_flight) {
  if (max_in_flight > 0) max_in_flight_ = max_in_flight;
}

bool McpClient::Initialize(std::string* err) {
  nlohmann::json params;
  params["protocolVersion"] = kProtocolVersion;
  params["capabilities"] = nlohmann::json::object();
  params["clientInfo"] = {{"name", "chatgen-runtime"}, {"version", "0.1.0"}};
  auto r = Rpc("initialize", params, err);
  if (!r) return false;
  Notify("notifications/initialized");
  return true;
}

std::vector<McpToolInfo> McpClient::ListTools(std::string* err) {
  std::vector<McpToolInfo> out;
  std::string cursor;
  for (int page = 0; page < 64; page++) {
    nlohmann::json params = nlohmann::json::object();
    if (!cursor.empty()) params["cursor"] = cursor;
    auto r = Rpc("tools/list", params, err);
    if (!r) return {};
    if (!r->contains("tools") || !(*r)["tools"].is_array()) return out;
    for (const auto& t : (*r)["tools"]) {
      if (!t.is_object()) continue;
      McpToolInfo info;
      if (t.contains("name") && t["name"].is_string()) info.name = t["name"].get<std::string>();
      if (t.contains("title") && t["title"].is_string()) info.title = t["title"].get<std::string>();
      if (t.contains("description") && t["description"].is_string()) info.description = t["description"].get<std::string>();
      if (t.contains("inputSchema") && t["inputSchema"].is_object()) info.input_schema = t["inputSchema"];
      if (!info.name.empty()) out.push_back(std::move(info));
    }
    if (r->contains("nextCursor") && (*r)["nextCursor"].is_string()) {
      cursor = (*r)["nextCursor"].get<std::string>();
      if (cursor.empty()) break;
    } else {
      break;
    }
  }
  return out;
}

std::optional<nlohmann::json> McpClient::CallTool(const std::string& name,
                                                  const nlohmann::json& arguments,
                                                  std::string* err) {
  nlohmann::json params;
  params["name"] = name;
  params["arguments"] = arguments.is_object() ? arguments : nlohmann::json::object();
  return Rpc("tools/call", params, err);
}

void McpClient::Notify(const std::string& method) {
  nlohmann::json req;
  req["jsonrpc"] = "2.0";
  req["method"] = method;
  httplib::Headers headers{{"Accept", "application/json, text/event-stream"}};
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!session_id_.empty()) headers.emplace("Mcp-Session-Id", session_id_);
  }
  auto cli = MakeClient(endpoint_, connect_timeout_seconds_, read_timeout_seconds_, write_timeout_seconds_);
  const std::string path = endpoint_.base_path.empty() ? "/" : endpoint_.base_path;
  auto res = cli->Post(path, headers, req.dump(), "application/json");
  if (!res) std::cout << "[mcp] notify failed method=" << method << " host=" << endpoint_.host << "\n";
}

std::optional<nlohmann::json> McpClient::Rpc(const std::string& method,
                                             const nlohmann::json& params,
                                             std::string* err) {
  nlohmann::json req;
  httplib::Headers headers{{"Accept", "application/json, text/event-stream"}};
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (in_flight_ >= max_in_flight_) {
      if (err) *err = "mcp: too many in-flight requests";
      return std::nullopt;
    }
    in_flight_++;
    req["id"] = next_id_++;
    if (!session_id_.empty()) headers.emplace("Mcp-Session-Id", session_id_);
  }

  auto dec = [&]() {
    std::lock_guard<std::mutex> lock(mu_);
    in_flight_--;
  };

  auto cli = MakeClient(endpoint_, connect_timeout_seconds_, read_timeout_seconds_, write_timeout_seconds_);
  req["jsonrpc"] = "2.0";
  req["method"] = method;
  req["params"] = params;

  const std::string path = endpoint_.base_path.empty() ? "/" : endpoint_.base_path;
  auto res = cli->Post(path, headers, req.dump(), "application/json");
  if (!res) {
    if (err) *err = "mcp: failed to connect";
    dec();
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = "mcp: http " + std::to_string(res->status);
    dec();
    return std::nullopt;
  }
  if (res->has_header("Mcp-Session-Id")) {
    std::lock_guard<std::mutex> lock(mu_);
    session_id_ = res->get_header_value("Mcp-Session-Id");
  }

  auto resp = ParseRpcBody(res->body, res->get_header_value("Content-Type"));
  if (resp.is_discarded()) {
    if (err) *err = "mcp: invalid json response";
    dec();
    return std::nullopt;
  }

  auto rpc_err = ExtractJsonRpcError(resp);
  if (!rpc_err.empty()) {
    if (err) *err = rpc_err;
    dec();
    return std::nullopt;
  }
  if (!resp.contains("result")) {
    if (err) *err = "mcp: missing result";
    dec();
    return std::nullopt;
  }
  dec();
  return resp["result"];
}

nlohmann::json McpResultToToolOutput(const nlohmann::json& result, bool* is_error) {
  bool error = false;
  if (result.is_object() && result.contains("isError") && result["isError"].is_boolean()) {
    error = result["isError"].get<bool>();
  }
  if (is_error) *is_error = error;
  if (!result.is_object()) return result;
  if (result.contains("structuredContent") && !result["structuredContent"].is_null()) {
    return result["structuredContent"];
  }
  std::string text;
  if (result.contains("content") && result["content"].is_array()) {
    for (const auto& c : result["content"]) {
      if (c.is_object() && c.value("type", "") == "text" && c.contains("text") && c["text"].is_string()) {
        if (!text.empty()) text += "\n";
        text += c["text"].get<std::string>();
      }
    }
  }
  if (error) return {{"error", text.empty() ? std::string("tool reported an error") : text}};
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (!parsed.is_discarded() && (parsed.is_object() || parsed.is_array())) return parsed;
  return {{"text", text}};
}

}  // namespace chatgen
