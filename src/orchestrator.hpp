#pragma once

#include "clock.hpp"
#include "content_assembler.hpp"
#include "generation_events.hpp"
#include "generation_ledger.hpp"
#include "persistence_gateway.hpp"
#include "prompt_composer.hpp"
#include "providers/provider.hpp"
#include "stale_reconciler.hpp"
#include "tooling.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chatgen {

struct GenerationRequest {
  std::string chat_id;
  std::string user_id;
  ModelProfile model;
  ReasoningEffort effort = ReasoningEffort::kMedium;
  PromptSettings prompt;
  std::vector<std::string> enabled_capabilities;
  std::vector<ConversationMessage> messages;
};

struct OrchestratorOptions {
  int max_steps = 5;
  std::chrono::milliseconds checkpoint_interval{1000};
  // Re-stamps a streaming row that produced nothing for this long. Zero disables.
  std::chrono::milliseconds heartbeat_interval{5000};
  std::chrono::seconds generation_timeout{300};
  std::chrono::seconds stale_after{30};
  bool continue_on_disconnect = false;
};

enum class GenerationPhase {
  kComposing,
  kStreaming,
  kFinalizing,
  kPersisted,
  kAborted,
};

const char* GenerationPhaseName(GenerationPhase phase);

// Live consumer of the event stream. Write returns false once the caller is gone.
class IStreamSink {
 public:
  virtual ~IStreamSink() = default;
  virtual bool Write(const StreamEvent& ev) = 0;
};

struct PreparedGeneration {
  std::string generation_id;
  GenerationRequest request;
  std::string system_prompt;
  std::shared_ptr<const ToolRegistry> tools;
  LedgerRow row;
  // Keeps the row out of reconciliation while this generation is held.
  std::shared_ptr<void> lease;
};

enum class PrepareStatus {
  kReady,
  // A fresh streaming row already exists for the chat.
  kConflict,
  kFailed,
};

struct PrepareResult {
  PrepareStatus status = PrepareStatus::kFailed;
  std::optional<PreparedGeneration> generation;
  std::optional<LedgerRow> conflicting;
  std::string error;
};

struct ToolCallRecord {
  ToolCall call;
  std::string thought_signature;
};

// What one model call produced. Built while the step streams, then folded into the generation state.
struct StepResult {
  std::string text;
  std::string reasoning;
  std::vector<ToolCallRecord> tool_calls;
  std::vector<ToolRecord> tools;
  std::vector<GeneratedFile> files;
  TokenUsage usage;
  std::string finish_reason;
};

struct GenerationState {
  std::string text;
  std::string reasoning;
  std::vector<ToolRecord> tools;
  std::vector<GeneratedFile> files;
  TokenUsage usage;
  int steps = 0;
  std::string finish_reason;
};

GenerationState FoldStep(GenerationState state, const StepResult& step);

struct GenerationOutcome {
  GenerationPhase phase = GenerationPhase::kComposing;
  std::string generation_id;
  std::string message_id;
  std::vector<ContentPart> content;
  TokenUsage usage;
  std::optional<double> tokens_per_second;
  int steps = 0;
  std::string finish_reason;
  std::string error;
  bool persisted = false;
};

class GenerationOrchestrator {
 public:
  // tool_provider and reconciler may be null: no tools, and stale rows block new generations until the
  // scheduled reconciler clears them.
  GenerationOrchestrator(IModelProvider* provider,
                         IToolProvider* tool_provider,
                         ILedgerStore* ledger,
                         PersistenceGateway* gateway,
                         StaleReconciler* reconciler,
                         const IClock* clock,
                         OrchestratorOptions options);

  // composing: builds the system prompt, resolves the tool set and claims the chat's ledger slot.
  PrepareResult Prepare(GenerationRequest request);

  // streaming -> finalizing -> persisted, or aborted. Every event reaches sink in order; the outcome
  // summarizes what was stored.
  GenerationOutcome Run(PreparedGeneration generation, IStreamSink* sink);

  const OrchestratorOptions& options() const { return options_; }

 private:
  IModelProvider* provider_;
  IToolProvider* tool_provider_;
  ILedgerStore* ledger_;
  PersistenceGateway* gateway_;
  StaleReconciler* reconciler_;
  const IClock* clock_;
  OrchestratorOptions options_;
};

}  // namespace chatgen
