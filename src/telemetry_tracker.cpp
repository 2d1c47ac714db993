#include "telemetry_tracker.hpp"

#include <chrono>
#include <cmath>

namespace chatgen {

int64_t GeneratedTokenCount(const TokenUsage& usage) {
  if (usage.reasoning_tokens > 0) return usage.output_tokens + usage.reasoning_tokens;
  if (usage.total_tokens > 0) return usage.total_tokens - usage.input_tokens;
  return usage.output_tokens;
}

std::optional<double> ComputeTokensPerSecond(const GenerationTimings& timings, const TokenUsage& usage) {
  const auto start = timings.first_reasoning ? timings.first_reasoning : timings.first_chunk;
  if (!start || !timings.end) return std::nullopt;
  const double seconds = std::chrono::duration<double>(*timings.end - *start).count();
  const int64_t tokens = GeneratedTokenCount(usage);
  if (tokens <= 0 || seconds <= 0.0) return std::nullopt;
  return static_cast<double>(tokens) / seconds;
}

std::optional<double> RoundTokensPerSecond(std::optional<double> tps) {
  if (!tps || !std::isfinite(*tps)) return std::nullopt;
  const double rounded = std::round(*tps * 10.0) / 10.0;
  if (rounded <= 0.0) return std::nullopt;
  return rounded;
}

TelemetryTracker::TelemetryTracker(const IClock* clock) : clock_(clock) {}

void TelemetryTracker::MarkRequestStart() {
  timings_.request_start = clock_->Now();
}

void TelemetryTracker::MarkEnd() {
  timings_.end = clock_->Now();
}

void TelemetryTracker::OnEvent(const StreamEvent& ev) {
  if (!IsOutputDelta(ev.kind)) return;
  const auto now = clock_->Now();
  if (!timings_.first_chunk) timings_.first_chunk = now;
  if (ev.kind == StreamEventKind::kReasoningDelta && !timings_.first_reasoning) timings_.first_reasoning = now;
}

std::optional<double> TelemetryTracker::TokensPerSecond(const TokenUsage& usage) const {
  return ComputeTokensPerSecond(timings_, usage);
}

}  // namespace chatgen
