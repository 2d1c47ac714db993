#pragma once

#include "clock.hpp"
#include "generation_events.hpp"

#include <cstdint>
#include <optional>

namespace chatgen {

struct GenerationTimings {
  std::optional<TimePoint> request_start;
  std::optional<TimePoint> first_chunk;
  std::optional<TimePoint> first_reasoning;
  std::optional<TimePoint> end;
};

// reasoning + output when reasoning is reported separately, else total - input, else output.
int64_t GeneratedTokenCount(const TokenUsage& usage);

// Measured from the first reasoning delta when there was one, else from the first delta of any kind, up to
// the end. Absent unless both the token count and the duration are strictly positive.
std::optional<double> ComputeTokensPerSecond(const GenerationTimings& timings, const TokenUsage& usage);

// One decimal place; a value that rounds to zero is reported as absent.
std::optional<double> RoundTokensPerSecond(std::optional<double> tps);

class TelemetryTracker : public IGenerationObserver {
 public:
  explicit TelemetryTracker(const IClock* clock);

  void MarkRequestStart();
  void MarkEnd();
  void OnEvent(const StreamEvent& ev) override;

  const GenerationTimings& timings() const { return timings_; }
  std::optional<double> TokensPerSecond(const TokenUsage& usage) const;

 private:
  const IClock* clock_;
  GenerationTimings timings_;
};

}  // namespace chatgen
