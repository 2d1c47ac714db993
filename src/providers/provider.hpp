#pragma once

#include "model_catalog.hpp"
#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace chatgen {

struct TokenUsage {
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;
  int64_t reasoning_tokens = 0;
  int64_t total_tokens = 0;

  TokenUsage& operator+=(const TokenUsage& other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    reasoning_tokens += other.reasoning_tokens;
    total_tokens += other.total_tokens;
    return *this;
  }
};

enum class ConversationPartKind {
  kText,
  kInlineData,
  // Remote file the model fetches itself; text holds the uri.
  kFileUri,
  kToolCall,
  kToolResult,
};

struct ConversationPart {
  ConversationPartKind kind = ConversationPartKind::kText;
  std::string text;
  std::string media_type;
  std::string data_base64;
  ToolCall tool_call;
  std::string thought_signature;
  nlohmann::json tool_result;
};

// role is "user", "assistant" or "tool".
struct ConversationMessage {
  std::string role;
  std::vector<ConversationPart> parts;
};

struct StepRequest {
  ModelProfile model;
  ReasoningEffort effort = ReasoningEffort::kMedium;
  std::string system_prompt;
  std::vector<ConversationMessage> messages;
  std::vector<ToolSchema> tools;
};

enum class ModelEventKind {
  kTextDelta,
  kReasoningDelta,
  kToolCall,
  kFile,
  kFinish,
};

struct ModelEvent {
  ModelEventKind kind = ModelEventKind::kTextDelta;
  std::string text;
  ToolCall tool_call;
  std::string thought_signature;
  std::string media_type;
  std::string data_base64;
  std::string finish_reason;
  TokenUsage usage;
};

using ModelEventCallback = std::function<bool(const ModelEvent&)>;

class IModelProvider {
 public:
  virtual ~IModelProvider() = default;

  virtual std::string Name() const = 0;

  // Runs one model call. Events arrive in stream order and end with exactly one kFinish on success.
  // Returning false from on_event stops the stream; StreamStep then returns false with err "cancelled".
  virtual bool StreamStep(const StepRequest& req, const ModelEventCallback& on_event, std::string* err) = 0;

  virtual std::optional<std::string> GenerateText(const ModelProfile& model,
                                                  const std::string& system_prompt,
                                                  const std::string& prompt,
                                                  std::string* err) = 0;
};

}  // namespace chatgen
