#include "chat_router.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "effort_classifier.hpp"
#include "gemini_provider.hpp"
#include "generation_ledger.hpp"
#include "http_fetcher.hpp"
#include "identity.hpp"
#include "message_store.hpp"
#include "model_catalog.hpp"
#include "orchestrator.hpp"
#include "persistence_gateway.hpp"
#include "stale_reconciler.hpp"
#include "title_generator.hpp"
#include "tool_capabilities.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

int main() {
  std::cout.setf(std::ios::unitbuf);
  using namespace chatgen;

  const RuntimeConfig cfg = LoadConfigFromEnv();
  if (cfg.gemini_api_key.empty()) {
    std::cout << "[config] GOOGLE_GENERATIVE_AI_API_KEY is not set; generations will fail\n";
  }

  SystemClock clock;
  ModelCatalog catalog(cfg.models, cfg.default_model);
  GeminiProvider gemini(cfg.gemini_endpoint, cfg.gemini_api_key);

  HttplibFetcher tool_fetcher(5, 30);
  HttplibFetcher attachment_fetcher(10, 60);
  CapabilityToolProvider tools(ToolCredentials{cfg.brave_api_key, cfg.youtube_api_key}, &tool_fetcher, cfg.mcp_servers);
  tools.SetMcpTimeouts(cfg.mcp_connect_timeout_s, cfg.mcp_read_timeout_s);

  auto ledger = MakeLedgerStore(cfg.ledger_store_type, cfg.ledger_store_path);
  auto messages = MakeMessageStore(cfg.message_store_type, cfg.message_store_path);
  PassthroughCipher cipher;
  PersistenceGateway gateway(messages.get(), &cipher);

  StaleReconciler reconciler(ledger.get(), &gateway, &clock, std::chrono::seconds(cfg.stale_after_s));
  ReconcileScheduler scheduler(&reconciler, std::chrono::seconds(cfg.reconcile_interval_s));

  OrchestratorOptions options;
  options.max_steps = cfg.max_steps;
  options.checkpoint_interval = std::chrono::milliseconds(cfg.checkpoint_interval_ms);
  options.heartbeat_interval = std::chrono::milliseconds(cfg.heartbeat_interval_ms);
  options.generation_timeout = std::chrono::seconds(cfg.generation_timeout_s);
  options.stale_after = std::chrono::seconds(cfg.stale_after_s);
  options.continue_on_disconnect = cfg.continue_on_disconnect;
  GenerationOrchestrator orchestrator(&gemini, &tools, ledger.get(), &gateway, &reconciler, &clock, options);

  TrustedHeaderIdentityResolver identity(cfg.identity_header, cfg.require_identity);
  auto classifier_model = catalog.Find(cfg.classifier_model).value_or(ResolveModelProfile(cfg.classifier_model));
  EffortClassifier classifier(&gemini, classifier_model);
  auto title_model = catalog.Find(cfg.title_model).value_or(ResolveModelProfile(cfg.title_model));
  TitleGenerator titles(&gemini, title_model);

  httplib::Server server;
  ChatRouter router(&orchestrator, &catalog, &gateway, ledger.get(), &reconciler, &identity, &classifier,
                    &titles, &attachment_fetcher);
  router.Register(&server);

  server.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
        std::cout << "[http] non-standard exception escaped a handler\n";
      }
    }
    nlohmann::json j;
    j["error"] = {{"message", message}, {"type", "server_error"}, {"param", nullptr}, {"code", nullptr}};
    res.status = 500;
    res.set_content(j.dump(), "application/json");
  });

  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    std::string type = "invalid_request_error";
    if (res.status == 404) {
      message = "not found";
    } else if (res.status >= 500) {
      message = "upstream error";
      type = "api_error";
    } else {
      message = "bad request";
    }
    nlohmann::json j;
    j["error"] = {{"message", message}, {"type", type}, {"param", nullptr}, {"code", nullptr}};
    res.set_content(j.dump(), "application/json");
  });

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  // Streams can sit between events while tools run.
  server.set_write_timeout(cfg.generation_timeout_s);

  server.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["unix_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    j["default_model"] = catalog.Default().id;
    res.status = 200;
    res.set_content(j.dump(), "application/json");
  });

  scheduler.Start();

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  const bool ok = server.listen(cfg.listen.host, cfg.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  scheduler.Stop();
  return ok ? 0 : 1;
}
