#include "gemini_provider.hpp"

#include "ids.hpp"
#include "log_format.hpp"

#include <httplib.h>

#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace chatgen {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep) {
  auto cli = std::make_unique<httplib::Client>(ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port));
  cli->set_connection_timeout(10);
  cli->set_read_timeout(300);
  cli->set_write_timeout(60);
  return cli;
}

static std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

static int64_t IntField(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_number_integer()) return 0;
  return j[key].get<int64_t>();
}

static std::string ApiErrorMessage(const std::string& body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (!j.is_discarded() && j.is_object() && j.contains("error") && j["error"].is_object()) {
    const auto& e = j["error"];
    if (e.contains("message") && e["message"].is_string()) return e["message"].get<std::string>();
  }
  if (!j.is_discarded() && j.is_array() && !j.empty()) return ApiErrorMessage(j[0].dump());
  return TruncateForLog(body, 300);
}

static nlohmann::json PartToJson(const ConversationPart& p) {
  switch (p.kind) {
    case ConversationPartKind::kText:
      return {{"text", p.text}};
    case ConversationPartKind::kInlineData:
      return {{"inlineData", {{"mimeType", p.media_type}, {"data", p.data_base64}}}};
    case ConversationPartKind::kFileUri:
      return {{"fileData", {{"mimeType", p.media_type}, {"fileUri", p.text}}}};
    case ConversationPartKind::kToolCall: {
      nlohmann::json j;
      j["functionCall"] = {{"name", p.tool_call.name}, {"args", p.tool_call.arguments}};
      if (!p.thought_signature.empty()) j["thoughtSignature"] = p.thought_signature;
      return j;
    }
    case ConversationPartKind::kToolResult:
      return {{"functionResponse",
               {{"name", p.tool_call.name}, {"response", {{"name", p.tool_call.name}, {"content", p.tool_result}}}}}};
  }
  return {{"text", p.text}};
}

static nlohmann::json UsageToJson(const TokenUsage& u) {
  return {{"input", u.input_tokens}, {"output", u.output_tokens}, {"reasoning", u.reasoning_tokens},
          {"total", u.total_tokens}};
}

}  // namespace

nlohmann::json SanitizeSchemaForGemini(const nlohmann::json& schema) {
  if (schema.is_array()) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& item : schema) out.push_back(SanitizeSchemaForGemini(item));
    return out;
  }
  if (!schema.is_object()) return schema;
  nlohmann::json out = nlohmann::json::object();
  for (auto it = schema.begin(); it != schema.end(); ++it) {
    const auto& key = it.key();
    if (key == "$schema" || key == "additionalProperties" || key == "$ref" || key == "$defs" || key == "default" ||
        key == "examples") {
      continue;
    }
    if (key == "properties" && it.value().is_object()) {
      nlohmann::json props = nlohmann::json::object();
      for (auto p = it.value().begin(); p != it.value().end(); ++p) props[p.key()] = SanitizeSchemaForGemini(p.value());
      out[key] = std::move(props);
      continue;
    }
    out[key] = SanitizeSchemaForGemini(it.value());
  }
  return out;
}

nlohmann::json BuildGenerateContentRequest(const StepRequest& req) {
  nlohmann::json body;
  if (!req.system_prompt.empty()) {
    body["systemInstruction"]["parts"] = nlohmann::json::array({{{"text", req.system_prompt}}});
  }

  body["contents"] = nlohmann::json::array();
  for (const auto& m : req.messages) {
    if (m.parts.empty()) continue;
    nlohmann::json content;
    content["role"] = m.role == "assistant" ? "model" : "user";
    content["parts"] = nlohmann::json::array();
    for (const auto& p : m.parts) content["parts"].push_back(PartToJson(p));
    body["contents"].push_back(std::move(content));
  }

  if (!req.tools.empty()) {
    nlohmann::json decls = nlohmann::json::array();
    for (const auto& t : req.tools) {
      nlohmann::json d;
      d["name"] = t.name;
      d["description"] = t.description;
      if (t.parameters.is_object() && !t.parameters.empty()) d["parameters"] = SanitizeSchemaForGemini(t.parameters);
      decls.push_back(std::move(d));
    }
    body["tools"] = nlohmann::json::array({{{"functionDeclarations", std::move(decls)}}});
  }

  nlohmann::json gen = nlohmann::json::object();
  if (auto thinking = ThinkingConfigFor(req.model, req.effort)) {
    nlohmann::json tc;
    tc["includeThoughts"] = thinking->include_thoughts;
    if (thinking->level) tc["thinkingLevel"] = *thinking->level;
    if (thinking->budget_tokens) tc["thinkingBudget"] = *thinking->budget_tokens;
    gen["thinkingConfig"] = std::move(tc);
  }
  if (req.model.generates_images) gen["responseModalities"] = nlohmann::json::array({"TEXT", "IMAGE"});
  if (!gen.empty()) body["generationConfig"] = std::move(gen);
  return body;
}

std::string MapFinishReason(const std::string& gemini_reason, bool has_tool_calls) {
  if (has_tool_calls) return "tool-calls";
  if (gemini_reason.empty() || gemini_reason == "STOP") return "stop";
  if (gemini_reason == "MAX_TOKENS") return "length";
  if (gemini_reason == "SAFETY" || gemini_reason == "RECITATION" || gemini_reason == "BLOCKLIST" ||
      gemini_reason == "PROHIBITED_CONTENT" || gemini_reason == "SPII" || gemini_reason == "IMAGE_SAFETY") {
    return "content-filter";
  }
  return "other";
}

bool GeminiStreamDecoder::Feed(const char* data, size_t len, const ModelEventCallback& on_event) {
  buffer_.append(data, len);
  size_t pos;
  while ((pos = buffer_.find('\n')) != std::string::npos) {
    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);
    if (!HandleLine(std::move(line), on_event)) return false;
  }
  return true;
}

bool GeminiStreamDecoder::Finish(const ModelEventCallback& on_event) {
  if (!buffer_.empty()) {
    std::string rest = std::move(buffer_);
    buffer_.clear();
    if (!HandleLine(std::move(rest), on_event)) return false;
  }
  ModelEvent ev;
  ev.kind = ModelEventKind::kFinish;
  ev.finish_reason = MapFinishReason(finish_reason_, tool_calls_ > 0);
  ev.usage = usage_;
  return on_event(ev);
}

bool GeminiStreamDecoder::HandleLine(std::string line, const ModelEventCallback& on_event) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
  if (line.empty()) return true;
  if (line.rfind("data:", 0) != 0) return true;
  std::string payload = line.substr(5);
  if (!payload.empty() && payload.front() == ' ') payload.erase(0, 1);
  if (payload.empty() || payload == "[DONE]") return true;
  auto chunk = nlohmann::json::parse(payload, nullptr, false);
  if (chunk.is_discarded()) {
    std::cout << "[provider] gemini skip_chunk reason=invalid_json data=" << TruncateForLog(payload, 200) << "\n";
    return true;
  }
  return HandleChunk(chunk, on_event);
}

bool GeminiStreamDecoder::HandleChunk(const nlohmann::json& chunk, const ModelEventCallback& on_event) {
  if (!chunk.is_object()) return true;
  if (chunk.contains("error")) {
    error_ = ApiErrorMessage(chunk.dump());
    return false;
  }
  if (chunk.contains("usageMetadata") && chunk["usageMetadata"].is_object()) {
    const auto& u = chunk["usageMetadata"];
    usage_.input_tokens = IntField(u, "promptTokenCount");
    usage_.output_tokens = IntField(u, "candidatesTokenCount");
    usage_.reasoning_tokens = IntField(u, "thoughtsTokenCount");
    usage_.total_tokens = IntField(u, "totalTokenCount");
  }
  if (!chunk.contains("candidates") || !chunk["candidates"].is_array() || chunk["candidates"].empty()) return true;
  const auto& cand = chunk["candidates"][0];
  if (!cand.is_object()) return true;
  if (cand.contains("finishReason") && cand["finishReason"].is_string()) {
    finish_reason_ = cand["finishReason"].get<std::string>();
  }
  if (!cand.contains("content") || !cand["content"].is_object()) return true;
  const auto& content = cand["content"];
  if (!content.contains("parts") || !content["parts"].is_array()) return true;

  for (const auto& part : content["parts"]) {
    if (!part.is_object()) continue;
    ModelEvent ev;
    if (part.contains("functionCall") && part["functionCall"].is_object()) {
      const auto& fc = part["functionCall"];
      ev.kind = ModelEventKind::kToolCall;
      if (fc.contains("id") && fc["id"].is_string()) ev.tool_call.id = fc["id"].get<std::string>();
      if (ev.tool_call.id.empty()) ev.tool_call.id = NewId("call");
      if (fc.contains("name") && fc["name"].is_string()) ev.tool_call.name = fc["name"].get<std::string>();
      if (fc.contains("args") && fc["args"].is_object()) ev.tool_call.arguments = fc["args"];
      if (part.contains("thoughtSignature") && part["thoughtSignature"].is_string()) {
        ev.thought_signature = part["thoughtSignature"].get<std::string>();
      }
      ++tool_calls_;
    } else if (part.contains("inlineData") && part["inlineData"].is_object()) {
      const auto& d = part["inlineData"];
      ev.kind = ModelEventKind::kFile;
      if (d.contains("mimeType") && d["mimeType"].is_string()) ev.media_type = d["mimeType"].get<std::string>();
      if (d.contains("data") && d["data"].is_string()) ev.data_base64 = d["data"].get<std::string>();
      if (ev.data_base64.empty()) continue;
    } else if (part.contains("text") && part["text"].is_string()) {
      ev.text = part["text"].get<std::string>();
      if (ev.text.empty()) continue;
      const bool thought = part.contains("thought") && part["thought"].is_boolean() && part["thought"].get<bool>();
      ev.kind = thought ? ModelEventKind::kReasoningDelta : ModelEventKind::kTextDelta;
    } else {
      continue;
    }
    if (!on_event(ev)) return false;
  }
  return true;
}

GeminiProvider::GeminiProvider(HttpEndpoint endpoint, std::string api_key)
    : endpoint_(std::move(endpoint)), api_key_(std::move(api_key)) {}

std::string GeminiProvider::Name() const {
  return "gemini";
}

std::string GeminiProvider::ModelPath(const std::string& model_id, const std::string& method) const {
  return JoinPath(endpoint_.base_path, "/v1beta/models/" + model_id + ":" + method);
}

bool GeminiProvider::StreamStep(const StepRequest& req, const ModelEventCallback& on_event, std::string* err) {
  if (api_key_.empty()) {
    if (err) *err = "gemini: api key is not configured";
    return false;
  }
  const auto body = BuildGenerateContentRequest(req).dump();
  std::cout << "[provider] gemini stream model=" << req.model.id << " messages=" << req.messages.size()
            << " tools=" << req.tools.size() << " effort=" << ReasoningEffortName(req.effort) << "\n";

  auto cli = MakeClient(endpoint_);
  GeminiStreamDecoder decoder;
  int status = 0;
  bool cancelled = false;
  bool decode_failed = false;
  std::string error_body;

  httplib::Request hreq;
  hreq.method = "POST";
  hreq.path = ModelPath(req.model.id, "streamGenerateContent") + "?alt=sse";
  hreq.set_header("Content-Type", "application/json");
  hreq.set_header("Accept", "text/event-stream");
  hreq.set_header("x-goog-api-key", api_key_);
  hreq.body = body;
  hreq.response_handler = [&](const httplib::Response& res) {
    status = res.status;
    return true;
  };
  hreq.content_receiver = [&](const char* data, size_t data_length, uint64_t, uint64_t) -> bool {
    if (status < 200 || status >= 300) {
      error_body.append(data, data_length);
      return true;
    }
    bool consumer_stopped = false;
    const bool ok = decoder.Feed(
        data, data_length,
        [&](const ModelEvent& ev) {
          if (!on_event(ev)) {
            consumer_stopped = true;
            return false;
          }
          return true;
        });
    if (!ok) {
      if (consumer_stopped) {
        cancelled = true;
      } else {
        decode_failed = true;
      }
    }
    return ok;
  };

  auto res = cli->send(hreq);
  if (cancelled) {
    if (err) *err = "cancelled";
    return false;
  }
  if (decode_failed) {
    if (err) *err = "gemini: " + decoder.error();
    return false;
  }
  if (!res) {
    if (err) *err = "gemini: request failed: " + httplib::to_string(res.error());
    return false;
  }
  if (status < 200 || status >= 300) {
    if (err) *err = "gemini: http " + std::to_string(status) + ": " + ApiErrorMessage(error_body);
    return false;
  }

  TokenUsage final_usage;
  bool stopped = false;
  const bool finished = decoder.Finish([&](const ModelEvent& ev) {
    if (ev.kind == ModelEventKind::kFinish) final_usage = ev.usage;
    if (!on_event(ev)) {
      stopped = true;
      return false;
    }
    return true;
  });
  if (!finished) {
    if (err) *err = stopped ? "cancelled" : "gemini: " + decoder.error();
    return false;
  }
  std::cout << "[provider] gemini done model=" << req.model.id << " tool_calls=" << (decoder.saw_tool_call() ? 1 : 0)
            << " usage=" << UsageToJson(final_usage).dump() << "\n";
  return true;
}

std::optional<std::string> GeminiProvider::GenerateText(const ModelProfile& model,
                                                        const std::string& system_prompt,
                                                        const std::string& prompt,
                                                        std::string* err) {
  if (api_key_.empty()) {
    if (err) *err = "gemini: api key is not configured";
    return std::nullopt;
  }
  StepRequest req;
  req.model = model;
  req.effort = ReasoningEffort::kLow;
  req.system_prompt = system_prompt;
  ConversationMessage user;
  user.role = "user";
  ConversationPart p;
  p.text = prompt;
  user.parts.push_back(std::move(p));
  req.messages.push_back(std::move(user));
  auto body = BuildGenerateContentRequest(req);
  // One-shot calls want the answer, not deliberation.
  if (body.contains("generationConfig") && body["generationConfig"].contains("thinkingConfig")) {
    body["generationConfig"]["thinkingConfig"]["includeThoughts"] = false;
  }

  auto cli = MakeClient(endpoint_);
  httplib::Headers headers{{"x-goog-api-key", api_key_}};
  auto res = cli->Post(ModelPath(model.id, "generateContent"), headers, body.dump(), "application/json");
  if (!res) {
    if (err) *err = "gemini: request failed: " + httplib::to_string(res.error());
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = "gemini: http " + std::to_string(res->status) + ": " + ApiErrorMessage(res->body);
    return std::nullopt;
  }
  auto j = nlohmann::json::parse(res->body, nullptr, false);
  if (j.is_discarded() || !j.contains("candidates") || !j["candidates"].is_array() || j["candidates"].empty()) {
    if (err) *err = "gemini: invalid json from generateContent";
    return std::nullopt;
  }
  const auto& cand = j["candidates"][0];
  std::string out;
  if (cand.contains("content") && cand["content"].contains("parts") && cand["content"]["parts"].is_array()) {
    for (const auto& part : cand["content"]["parts"]) {
      if (!part.is_object() || !part.contains("text") || !part["text"].is_string()) continue;
      if (part.contains("thought") && part["thought"].is_boolean() && part["thought"].get<bool>()) continue;
      out += part["text"].get<std::string>();
    }
  }
  return out;
}

}  // namespace chatgen
