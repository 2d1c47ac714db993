#include "stale_reconciler.hpp"

#include "content_assembler.hpp"
#include "ids.hpp"

#include <iostream>
#include <utility>

namespace chatgen {

nlohmann::json ReconcileStatsToJson(const ReconcileStats& stats) {
  return {{"scanned", stats.scanned}, {"recovered", stats.recovered}, {"deleted", stats.deleted},
          {"failed", stats.failed}};
}

std::shared_ptr<void> LiveGenerationSet::Acquire(const std::string& generation_id) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    ids_.insert(generation_id);
  }
  return std::shared_ptr<void>(nullptr, [this, generation_id](void*) { Release(generation_id); });
}

bool LiveGenerationSet::Contains(const std::string& generation_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return ids_.count(generation_id) > 0;
}

size_t LiveGenerationSet::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return ids_.size();
}

void LiveGenerationSet::Release(const std::string& generation_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = ids_.find(generation_id);
  if (it != ids_.end()) ids_.erase(it);
}

StaleReconciler::StaleReconciler(ILedgerStore* ledger, PersistenceGateway* gateway, const IClock* clock,
                                 std::chrono::seconds stale_after)
    : ledger_(ledger), gateway_(gateway), clock_(clock), stale_after_(stale_after) {}

bool StaleReconciler::IsStale(const LedgerRow& row) const {
  if (live_.Contains(row.id)) return false;
  const int64_t cutoff = ToUnixMillis(clock_->Now() - stale_after_);
  return row.last_update_at_ms < cutoff;
}

bool StaleReconciler::ReconcileRow(const LedgerRow& row, bool* recovered, std::string* err) {
  if (recovered) *recovered = false;

  std::vector<ContentPart> content;
  std::optional<double> tps;
  if (row.status == GenerationStatus::kCompleted && row.content_snapshot) {
    std::string parse_err;
    auto snapshot = ContentFromJson(*row.content_snapshot, &parse_err);
    if (snapshot) {
      content = std::move(*snapshot);
      tps = row.tokens_per_second;
    } else {
      std::cout << "[reconcile] id=" << row.id << " snapshot_invalid=1 error=" << parse_err << "\n";
      content = AssembleRecoveredContent(row.partial_reasoning, row.partial_text);
    }
  } else {
    content = AssembleRecoveredContent(row.partial_reasoning, row.partial_text);
  }

  // A completed row always stores its message, even an empty one; an abandoned row with nothing to show does not.
  const bool store = row.status == GenerationStatus::kCompleted ? row.content_snapshot.has_value() : !content.empty();
  if (store) {
    Message msg;
    msg.id = MessageIdForGeneration(row.id);
    msg.chat_id = row.chat_id;
    msg.role = "assistant";
    msg.content = std::move(content);
    msg.model_id = row.model_id;
    msg.sub_mode = row.sub_mode;
    msg.tokens_per_second = tps;
    msg.created_at_ms = row.completed_at_ms.value_or(row.last_update_at_ms);
    if (!gateway_->SaveMessage(msg, nullptr, err)) return false;
    if (recovered) *recovered = true;
  }

  bool deleted = false;
  if (!ledger_->Delete(row.id, &deleted, err)) return false;
  std::cout << "[reconcile] id=" << row.id << " chat=" << row.chat_id << " status=" << GenerationStatusName(row.status)
            << " stored=" << (store ? 1 : 0) << " deleted=" << (deleted ? 1 : 0) << "\n";
  return true;
}

ReconcileStats StaleReconciler::RunOnce() {
  ReconcileStats stats;
  std::string err;
  auto rows = ledger_->ListStale(ToUnixMillis(clock_->Now() - stale_after_), &err);
  if (!rows) {
    std::cout << "[reconcile] list ok=0 error=" << err << "\n";
    stats.failed = 1;
    return stats;
  }
  for (const auto& row : *rows) {
    if (live_.Contains(row.id)) {
      std::cout << "[reconcile] id=" << row.id << " skipped=live\n";
      continue;
    }
    ++stats.scanned;
    bool recovered = false;
    std::string row_err;
    if (!ReconcileRow(row, &recovered, &row_err)) {
      ++stats.failed;
      std::cout << "[reconcile] id=" << row.id << " ok=0 error=" << row_err << "\n";
      continue;
    }
    if (recovered) ++stats.recovered;
    ++stats.deleted;
  }
  if (stats.scanned > 0) std::cout << "[reconcile] pass " << ReconcileStatsToJson(stats).dump() << "\n";
  return stats;
}

ReconcileScheduler::ReconcileScheduler(StaleReconciler* reconciler, std::chrono::seconds interval)
    : reconciler_(reconciler), interval_(interval) {}

ReconcileScheduler::~ReconcileScheduler() {
  Stop();
}

void ReconcileScheduler::Start() {
  if (worker_.joinable() || interval_.count() <= 0) return;
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_ = false;
  }
  std::cout << "[reconcile] schedule interval_s=" << interval_.count() << "\n";
  worker_ = std::thread([this] {
    std::unique_lock<std::mutex> lock(mu_);
    while (!stop_) {
      if (cv_.wait_for(lock, interval_, [this] { return stop_; })) break;
      lock.unlock();
      reconciler_->RunOnce();
      lock.lock();
    }
  });
}

void ReconcileScheduler::Stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

}  // namespace chatgen
