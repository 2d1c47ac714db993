#pragma once

#include "effort_classifier.hpp"
#include "generation_ledger.hpp"
#include "http_fetcher.hpp"
#include "identity.hpp"
#include "model_catalog.hpp"
#include "orchestrator.hpp"
#include "persistence_gateway.hpp"
#include "stale_reconciler.hpp"
#include "title_generator.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace chatgen {

// Builds a generation request from a POST /api/chat body. Missing optional fields take the chat defaults;
// a malformed body, a missing chatId or an unknown model is an error.
std::optional<GenerationRequest> ParseChatRequest(const nlohmann::json& body,
                                                  const ModelCatalog& catalog,
                                                  IHttpFetcher* attachment_fetcher,
                                                  std::string* err);

nlohmann::json ActiveGenerationToJson(const LedgerRow& row);

class ChatRouter {
 public:
  ChatRouter(GenerationOrchestrator* orchestrator,
             const ModelCatalog* catalog,
             PersistenceGateway* gateway,
             ILedgerStore* ledger,
             StaleReconciler* reconciler,
             IIdentityResolver* identity,
             EffortClassifier* classifier,
             TitleGenerator* titles,
             IHttpFetcher* attachment_fetcher);

  void Register(httplib::Server* server);

 private:
  GenerationOrchestrator* orchestrator_;
  const ModelCatalog* catalog_;
  PersistenceGateway* gateway_;
  ILedgerStore* ledger_;
  StaleReconciler* reconciler_;
  IIdentityResolver* identity_;
  EffortClassifier* classifier_;
  TitleGenerator* titles_;
  IHttpFetcher* attachment_fetcher_;

  std::optional<Identity> ResolveCaller(const httplib::Request& req) const;
};

}  // namespace chatgen
