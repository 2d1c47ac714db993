#pragma once

#include "clock.hpp"
#include "generation_events.hpp"
#include "generation_ledger.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace chatgen {

// Writes ledger snapshots for one generation on its own thread. Submit never waits for I/O: a snapshot that
// arrives while a write is in flight replaces any older pending one.
//
// With a heartbeat interval, a streaming row that has not been written for that long is written again with a
// fresh last_update_at, so a generation that is silent (slow first byte, long tool calls) never looks abandoned.
// Completed and error rows are never refreshed.
class CheckpointWriter {
 public:
  explicit CheckpointWriter(ILedgerStore* store,
                            const IClock* clock = nullptr,
                            std::chrono::milliseconds heartbeat = std::chrono::milliseconds(0));
  ~CheckpointWriter();

  CheckpointWriter(const CheckpointWriter&) = delete;
  CheckpointWriter& operator=(const CheckpointWriter&) = delete;

  void Submit(const LedgerRow& row);
  // Waits until everything submitted so far has been written (or failed). False on timeout.
  bool Flush(std::chrono::milliseconds timeout);

  int64_t writes() const;
  int64_t failures() const;
  int64_t heartbeats() const;

 private:
  ILedgerStore* store_;
  const IClock* clock_;
  std::chrono::milliseconds heartbeat_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::optional<LedgerRow> pending_;
  // Last row handed to the store; the heartbeat re-stamps it.
  std::optional<LedgerRow> last_written_;
  bool writing_ = false;
  bool stop_ = false;
  int64_t writes_ = 0;
  int64_t failures_ = 0;
  int64_t heartbeats_ = 0;
  std::thread worker_;

  void Loop();
};

// Folds the delta stream into the generation's ledger row and hands it to the writer on the first delta,
// then at most once per interval, and after every tool result.
class LedgerCheckpointer : public IGenerationObserver {
 public:
  LedgerCheckpointer(LedgerRow row, CheckpointWriter* writer, const IClock* clock, std::chrono::milliseconds interval);

  void OnEvent(const StreamEvent& ev) override;

  // The latest folded row, for final completed/error snapshots.
  const LedgerRow& row() const { return row_; }
  // Stamps last_update_at and submits regardless of cadence.
  void Checkpoint(const LedgerRow& row);

 private:
  LedgerRow row_;
  CheckpointWriter* writer_;
  const IClock* clock_;
  std::chrono::milliseconds interval_;
  std::optional<TimePoint> last_submit_;
};

}  // namespace chatgen
