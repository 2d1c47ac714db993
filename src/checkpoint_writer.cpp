#include "checkpoint_writer.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace chatgen {

CheckpointWriter::CheckpointWriter(ILedgerStore* store, const IClock* clock, std::chrono::milliseconds heartbeat)
    : store_(store), clock_(clock), heartbeat_(clock ? heartbeat : std::chrono::milliseconds(0)) {
  worker_ = std::thread([this] { Loop(); });
}

CheckpointWriter::~CheckpointWriter() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void CheckpointWriter::Submit(const LedgerRow& row) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    pending_ = row;
  }
  cv_.notify_one();
}

bool CheckpointWriter::Flush(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  return idle_cv_.wait_for(lock, timeout, [this] { return !pending_ && !writing_; });
}

int64_t CheckpointWriter::writes() const {
  std::lock_guard<std::mutex> lock(mu_);
  return writes_;
}

int64_t CheckpointWriter::failures() const {
  std::lock_guard<std::mutex> lock(mu_);
  return failures_;
}

int64_t CheckpointWriter::heartbeats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return heartbeats_;
}

void CheckpointWriter::Loop() {
  std::unique_lock<std::mutex> lock(mu_);
  const auto ready = [this] { return stop_ || pending_.has_value(); };
  for (;;) {
    bool idle_timeout = false;
    if (heartbeat_.count() > 0) {
      idle_timeout = !cv_.wait_for(lock, heartbeat_, ready);
    } else {
      cv_.wait(lock, ready);
    }

    // Pending work is drained before honoring stop so a final snapshot is never dropped.
    LedgerRow row;
    bool heartbeat = false;
    if (pending_) {
      row = std::move(*pending_);
      pending_.reset();
    } else if (stop_) {
      break;
    } else if (idle_timeout && last_written_ && last_written_->status == GenerationStatus::kStreaming) {
      row = *last_written_;
      row.last_update_at_ms = ToUnixMillis(clock_->Now());
      heartbeat = true;
    } else {
      continue;
    }
    last_written_ = row;
    writing_ = true;
    lock.unlock();

    std::string err;
    bool found = false;
    const bool ok = store_->Update(row, &found, &err);
    if (!ok) {
      std::cout << "[ledger] checkpoint id=" << row.id << " ok=0 error=" << err << "\n";
    } else if (!found) {
      std::cout << "[ledger] checkpoint id=" << row.id << " skipped=row_gone\n";
    }

    lock.lock();
    writing_ = false;
    if (ok && !found) {
      // Nothing left to keep alive.
      last_written_.reset();
    }
    if (ok) {
      ++writes_;
      if (heartbeat) ++heartbeats_;
    } else {
      ++failures_;
    }
    if (!pending_) idle_cv_.notify_all();
  }
  writing_ = false;
  idle_cv_.notify_all();
}

LedgerCheckpointer::LedgerCheckpointer(LedgerRow row, CheckpointWriter* writer, const IClock* clock,
                                       std::chrono::milliseconds interval)
    : row_(std::move(row)), writer_(writer), clock_(clock), interval_(interval) {}

void LedgerCheckpointer::OnEvent(const StreamEvent& ev) {
  if (!IsOutputDelta(ev.kind)) return;
  const auto now = clock_->Now();
  bool due = false;
  if (!row_.first_chunk_at_ms) {
    row_.first_chunk_at_ms = ToUnixMillis(now);
    due = true;
  }
  if (ev.kind == StreamEventKind::kTextDelta) row_.partial_text += ev.text;
  if (ev.kind == StreamEventKind::kReasoningDelta) row_.partial_reasoning += ev.text;
  if (ev.kind == StreamEventKind::kToolResult) due = true;
  if (last_submit_ && now - *last_submit_ >= interval_) due = true;
  if (!due) return;

  row_.last_update_at_ms = ToUnixMillis(now);
  last_submit_ = now;
  writer_->Submit(row_);
}

void LedgerCheckpointer::Checkpoint(const LedgerRow& row) {
  row_ = row;
  const auto now = clock_->Now();
  row_.last_update_at_ms = ToUnixMillis(now);
  last_submit_ = now;
  writer_->Submit(row_);
}

}  // namespace chatgen
