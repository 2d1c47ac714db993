#pragma once

#include "clock.hpp"
#include "generation_ledger.hpp"
#include "persistence_gateway.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace chatgen {

struct ReconcileStats {
  int scanned = 0;
  int recovered = 0;
  int deleted = 0;
  int failed = 0;
};

nlohmann::json ReconcileStatsToJson(const ReconcileStats& stats);

// Generation ids this process is still driving. A row in the set is never abandoned, however old its
// last update.
class LiveGenerationSet {
 public:
  // Marks the id live until the returned lease is destroyed.
  std::shared_ptr<void> Acquire(const std::string& generation_id);

  bool Contains(const std::string& generation_id) const;
  size_t size() const;

 private:
  void Release(const std::string& generation_id);

  mutable std::mutex mu_;
  std::multiset<std::string> ids_;
};

// Turns abandoned ledger rows into stored messages. Deleting the row is the commit point and always follows
// the insert, so two concurrent passes over one row store one message and the second delete is a no-op.
class StaleReconciler {
 public:
  StaleReconciler(ILedgerStore* ledger, PersistenceGateway* gateway, const IClock* clock,
                  std::chrono::seconds stale_after);

  // Rows whose last update is older than the threshold: streaming and error rows are recovered from their
  // partial reasoning and text, completed rows from their content snapshot.
  ReconcileStats RunOnce();

  // Stores whatever the row holds, then deletes it. On failure the row is left for a later pass.
  bool ReconcileRow(const LedgerRow& row, bool* recovered, std::string* err);

  // False for rows this process is still generating.
  bool IsStale(const LedgerRow& row) const;

  LiveGenerationSet& live() { return live_; }

 private:
  ILedgerStore* ledger_;
  PersistenceGateway* gateway_;
  const IClock* clock_;
  std::chrono::seconds stale_after_;
  LiveGenerationSet live_;
};

// Runs RunOnce on a fixed interval until stopped.
class ReconcileScheduler {
 public:
  ReconcileScheduler(StaleReconciler* reconciler, std::chrono::seconds interval);
  ~ReconcileScheduler();

  ReconcileScheduler(const ReconcileScheduler&) = delete;
  ReconcileScheduler& operator=(const ReconcileScheduler&) = delete;

  void Start();
  void Stop();

 private:
  StaleReconciler* reconciler_;
  std::chrono::seconds interval_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_ = false;
  std::thread worker_;
};

}  // namespace chatgen
