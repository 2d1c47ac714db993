#pragma once

#include "providers/provider.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace chatgen {

enum class StreamEventKind {
  kTextDelta,
  kReasoningDelta,
  kToolCall,
  kToolResult,
  kFile,
  kFinish,
  kError,
};

struct StreamEvent {
  StreamEventKind kind = StreamEventKind::kTextDelta;
  // Delta text for text/reasoning, message for error.
  std::string text;

  std::string tool_call_id;
  std::string tool_name;
  // Arguments for tool-call, result for tool-result.
  nlohmann::json payload;

  std::string media_type;
  std::string data_base64;

  std::string finish_reason;
  std::string message_id;
  int steps = 0;
  TokenUsage usage;
  std::optional<double> tokens_per_second;
};

const char* StreamEventKindName(StreamEventKind kind);

// Delta events are the ones that count as generated output for timing and checkpoints.
bool IsOutputDelta(StreamEventKind kind);

// Wire form: {"type": "<kind>", ...kind-specific fields}.
nlohmann::json StreamEventToJson(const StreamEvent& ev);

class IGenerationObserver {
 public:
  virtual ~IGenerationObserver() = default;
  virtual void OnEvent(const StreamEvent& ev) = 0;
};

// Delivers each event to every subscriber in subscription order. Observers must not block: the relay, the
// telemetry tracker and the checkpointer all sit on the same delivery path.
class GenerationEventBus {
 public:
  void Subscribe(IGenerationObserver* observer);
  void Publish(const StreamEvent& ev) const;

 private:
  std::vector<IGenerationObserver*> observers_;
};

}  // namespace chatgen
