#include "clock.hpp"
#include "config.hpp"
#include "generation_ledger.hpp"
#include "message_store.hpp"
#include "persistence_gateway.hpp"
#include "stale_reconciler.hpp"

#include <chrono>
#include <iostream>

// One reconciler pass over the shared stores, for cron-style scheduling. Exits non-zero when any row failed.
int main() {
  std::cout.setf(std::ios::unitbuf);
  using namespace chatgen;

  const RuntimeConfig cfg = LoadConfigFromEnv();
  if (cfg.ledger_store_type != "file" || cfg.message_store_type != "file") {
    std::cout << "[reconcile] ledger and message stores must be file-backed to share them with the server\n";
    return 2;
  }

  SystemClock clock;
  auto ledger = MakeLedgerStore(cfg.ledger_store_type, cfg.ledger_store_path);
  auto messages = MakeMessageStore(cfg.message_store_type, cfg.message_store_path);
  PassthroughCipher cipher;
  PersistenceGateway gateway(messages.get(), &cipher);
  StaleReconciler reconciler(ledger.get(), &gateway, &clock, std::chrono::seconds(cfg.stale_after_s));

  const auto stats = reconciler.RunOnce();
  std::cout << ReconcileStatsToJson(stats).dump() << "\n";
  return stats.failed == 0 ? 0 : 1;
}
