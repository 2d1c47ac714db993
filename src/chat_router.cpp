#include "chat_router.hpp"

#include "attachments.hpp"
#include "log_format.hpp"
#include "tool_capabilities.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <memory>
#include <utility>

namespace chatgen {
namespace {

static nlohmann::json MakeError(const std::string& message, const std::string& type) {
  nlohmann::json j;
  j["error"] = {{"message", message}, {"type", type}, {"param", nullptr}, {"code", nullptr}};
  return j;
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(), "application/json");
}

static std::string SseData(const nlohmann::json& j) {
  return std::string("data: ") + j.dump() + "\n\n";
}

static std::string SseDone() {
  return "data: [DONE]\n\n";
}

static nlohmann::json ParseJsonBody(const httplib::Request& req) {
  return nlohmann::json::parse(req.body, nullptr, false);
}

static void LogRequestRaw(const httplib::Request& req) {
  std::cout << "[http] " << req.method << " " << req.path;
  for (const auto& [k, v] : req.headers) {
    if (k == "Authorization" || k == "authorization" || k == "Cookie" || k == "cookie") {
      std::cout << " " << k << "=" << RedactHeaderValue(k, v);
    }
  }
  if (!req.body.empty()) std::cout << " body=" << TruncateForLog(SanitizeBodyForLog(req.body), 2000);
  std::cout << "\n";
}

static std::string StringField(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_string()) return {};
  return j[key].get<std::string>();
}

static nlohmann::json MillisOrNull(const std::optional<int64_t>& v) {
  return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

class SseStreamSink : public IStreamSink {
 public:
  explicit SseStreamSink(httplib::DataSink& sink) : sink_(sink) {}

  bool Write(const StreamEvent& ev) override { return WriteRaw(SseData(StreamEventToJson(ev))); }

  bool WriteRaw(const std::string& s) {
    if (sink_.is_writable && !sink_.is_writable()) return false;
    if (!sink_.write) return false;
    return sink_.write(s.data(), s.size());
  }

 private:
  httplib::DataSink& sink_;
};

}  // namespace

std::optional<GenerationRequest> ParseChatRequest(const nlohmann::json& body,
                                                  const ModelCatalog& catalog,
                                                  IHttpFetcher* attachment_fetcher,
                                                  std::string* err) {
  if (body.is_discarded() || !body.is_object()) {
    if (err) *err = "invalid json";
    return std::nullopt;
  }
  if (!body.contains("messages") || !body["messages"].is_array()) {
    if (err) *err = "messages must be an array";
    return std::nullopt;
  }

  GenerationRequest out;
  out.chat_id = StringField(body, "chatId");
  if (out.chat_id.empty()) {
    if (err) *err = "chatId is required";
    return std::nullopt;
  }

  const auto model_id = StringField(body, "model");
  if (model_id.empty()) {
    out.model = catalog.Default();
  } else if (auto profile = catalog.Find(model_id)) {
    out.model = *profile;
  } else {
    if (err) *err = "unknown model: " + model_id;
    return std::nullopt;
  }

  out.effort = ParseReasoningEffort(StringField(body, "reasoningEffort")).value_or(ReasoningEffort::kMedium);

  auto& ps = out.prompt;
  if (body.contains("responseLength") && body["responseLength"].is_number()) {
    ps.response_length = std::clamp(static_cast<int>(body["responseLength"].get<double>()), 0, 100);
  }
  ps.user_name = StringField(body, "userName");
  if (auto g = StringField(body, "userGender"); !g.empty()) ps.user_gender = g;
  const bool learning = body.contains("learningMode") && body["learningMode"].is_boolean() &&
                        body["learningMode"].get<bool>();
  ps.mode = ChatModeFromRequest(learning, StringField(body, "learningSubMode"));
  if (!learning) ps.custom_instructions = StringField(body, "customInstructions");

  if (body.contains("enabledMcpServers") && body["enabledMcpServers"].is_array()) {
    for (const auto& s : body["enabledMcpServers"]) {
      if (s.is_string()) out.enabled_capabilities.push_back(s.get<std::string>());
    }
  } else {
    out.enabled_capabilities = DefaultEnabledCapabilities();
  }

  auto messages = ParseRequestMessages(body["messages"], attachment_fetcher, err);
  if (!messages) return std::nullopt;
  out.messages = std::move(*messages);
  return out;
}

nlohmann::json ActiveGenerationToJson(const LedgerRow& row) {
  nlohmann::json j;
  j["active"] = true;
  j["generationId"] = row.id;
  j["chatId"] = row.chat_id;
  j["status"] = GenerationStatusName(row.status);
  j["modelId"] = row.model_id;
  j["reasoningEffort"] = row.reasoning_effort;
  j["partialText"] = row.partial_text;
  j["partialReasoning"] = row.partial_reasoning;
  j["startedAt"] = row.started_at_ms;
  j["firstChunkAt"] = MillisOrNull(row.first_chunk_at_ms);
  j["lastUpdateAt"] = row.last_update_at_ms;
  return j;
}

ChatRouter::ChatRouter(GenerationOrchestrator* orchestrator,
                       const ModelCatalog* catalog,
                       PersistenceGateway* gateway,
                       ILedgerStore* ledger,
                       StaleReconciler* reconciler,
                       IIdentityResolver* identity,
                       EffortClassifier* classifier,
                       TitleGenerator* titles,
                       IHttpFetcher* attachment_fetcher)
    : orchestrator_(orchestrator),
      catalog_(catalog),
      gateway_(gateway),
      ledger_(ledger),
      reconciler_(reconciler),
      identity_(identity),
      classifier_(classifier),
      titles_(titles),
      attachment_fetcher_(attachment_fetcher) {}

std::optional<Identity> ChatRouter::ResolveCaller(const httplib::Request& req) const {
  if (!identity_) return Identity{"anonymous", true};
  RequestHeaders headers(req.headers.begin(), req.headers.end());
  return identity_->ResolveCaller(headers);
}

void ChatRouter::Register(httplib::Server* server) {
  server->Post("/api/chat", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequestRaw(req);
    auto caller = ResolveCaller(req);
    if (!caller) {
      SendJson(&res, 401, MakeError("unauthorized", "authentication_error"));
      return;
    }
    std::string err;
    auto request = ParseChatRequest(ParseJsonBody(req), *catalog_, attachment_fetcher_, &err);
    if (!request) {
      SendJson(&res, 400, MakeError(err, "invalid_request_error"));
      return;
    }
    request->user_id = caller->user_id;

    auto prepared = orchestrator_->Prepare(std::move(*request));
    if (prepared.status == PrepareStatus::kConflict) {
      auto body = MakeError(prepared.error, "conflict_error");
      if (prepared.conflicting) body["error"]["generationId"] = prepared.conflicting->id;
      SendJson(&res, 409, body);
      return;
    }
    if (prepared.status != PrepareStatus::kReady || !prepared.generation) {
      SendJson(&res, 500, MakeError(prepared.error.empty() ? "failed to start generation" : prepared.error,
                                    "server_error"));
      return;
    }

    auto gen = std::make_shared<PreparedGeneration>(std::move(*prepared.generation));
    auto started = std::make_shared<std::atomic<bool>>(false);
    const std::string generation_id = gen->generation_id;
    res.set_header("x-generation-id", generation_id);
    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider(
        "text/event-stream",
        [this, gen, started, generation_id](size_t, httplib::DataSink& sink) {
          started->store(true);
          SseStreamSink stream(sink);
          try {
            orchestrator_->Run(std::move(*gen), &stream);
          } catch (const std::exception& e) {
            std::cout << "[generation] id=" << generation_id << " ok=0 error=" << e.what() << "\n";
          }
          stream.WriteRaw(SseDone());
          sink.done();
          return false;
        },
        [this, generation_id, started](bool) {
          if (started->load()) return;
          // The caller left before streaming began; free the chat right away.
          std::string del_err;
          bool deleted = false;
          if (!ledger_->Delete(generation_id, &deleted, &del_err)) {
            std::cout << "[ledger] delete id=" << generation_id << " ok=0 error=" << del_err << "\n";
          }
        });
  });

  server->Get("/api/chat", [this](const httplib::Request& req, httplib::Response& res) {
    if (!ResolveCaller(req)) {
      SendJson(&res, 401, MakeError("unauthorized", "authentication_error"));
      return;
    }
    const auto chat_id = req.get_param_value("chatId");
    if (chat_id.empty()) {
      SendJson(&res, 400, MakeError("chatId is required", "invalid_request_error"));
      return;
    }
    std::string err;
    auto latest = gateway_->LatestAssistantMessage(chat_id, &err);
    if (!latest && !err.empty()) {
      std::cout << "[persist] latest chat=" << chat_id << " ok=0 error=" << err << "\n";
      SendJson(&res, 500, MakeError("failed to load messages", "server_error"));
      return;
    }
    nlohmann::json out;
    out["tokensPerSecond"] = latest && latest->tokens_per_second ? nlohmann::json(*latest->tokens_per_second)
                                                                 : nlohmann::json(nullptr);
    out["modelId"] = latest ? nlohmann::json(latest->model_id) : nlohmann::json(nullptr);
    SendJson(&res, 200, out);
  });

  server->Get("/api/generations/active", [this](const httplib::Request& req, httplib::Response& res) {
    if (!ResolveCaller(req)) {
      SendJson(&res, 401, MakeError("unauthorized", "authentication_error"));
      return;
    }
    const auto chat_id = req.get_param_value("chatId");
    if (chat_id.empty()) {
      SendJson(&res, 400, MakeError("chatId is required", "invalid_request_error"));
      return;
    }
    std::string err;
    auto row = ledger_->FindStreaming(chat_id, &err);
    if (!row && !err.empty()) {
      std::cout << "[ledger] find chat=" << chat_id << " ok=0 error=" << err << "\n";
      SendJson(&res, 500, MakeError("failed to read generation ledger", "server_error"));
      return;
    }
    SendJson(&res, 200, row ? ActiveGenerationToJson(*row) : nlohmann::json{{"active", false}});
  });

  server->Post("/api/auto-reasoning", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequestRaw(req);
    auto body = ParseJsonBody(req);
    std::string prompt;
    if (!body.is_discarded() && body.is_object()) prompt = StringField(body, "prompt");
    const auto effort = classifier_ ? classifier_->Classify(prompt) : ReasoningEffort::kMedium;
    SendJson(&res, 200, {{"effort", ReasoningEffortName(effort)}});
  });

  // The title is returned, not stored: chat metadata lives with the embedding deployment.
  server->Post("/api/generate-title", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequestRaw(req);
    auto body = ParseJsonBody(req);
    std::string prompt;
    if (!body.is_discarded() && body.is_object()) prompt = StringField(body, "prompt");
    if (prompt.empty()) {
      SendJson(&res, 400, MakeError("Prompt required", "invalid_request_error"));
      return;
    }
    std::string err;
    auto title = titles_ ? titles_->Generate(prompt, &err) : std::nullopt;
    if (!title) {
      std::cout << "[title] chat=" << StringField(body, "chatId") << " ok=0 error=" << err << "\n";
      SendJson(&res, 500, MakeError("Failed to generate title", "server_error"));
      return;
    }
    SendJson(&res, 200, {{"title", *title}});
  });

  server->Post("/internal/reconcile", [this](const httplib::Request&, httplib::Response& res) {
    if (!reconciler_) {
      SendJson(&res, 503, MakeError("reconciler is not configured", "server_error"));
      return;
    }
    SendJson(&res, 200, ReconcileStatsToJson(reconciler_->RunOnce()));
  });
}

}  // namespace chatgen
