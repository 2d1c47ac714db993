#include "orchestrator.hpp"

#include "checkpoint_writer.hpp"
#include "ids.hpp"
#include "log_format.hpp"
#include "telemetry_tracker.hpp"

#include <future>
#include <iostream>
#include <utility>

namespace chatgen {
namespace {

constexpr std::chrono::milliseconds kFinalFlushTimeout{5000};

class ClientRelay : public IGenerationObserver {
 public:
  explicit ClientRelay(IStreamSink* sink) : sink_(sink) {}

  void OnEvent(const StreamEvent& ev) override {
    if (!connected_ || !sink_) return;
    if (!sink_->Write(ev)) {
      connected_ = false;
      std::cout << "[generation] relay disconnected at=" << StreamEventKindName(ev.kind) << "\n";
    }
  }

  bool connected() const { return connected_ && sink_; }

 private:
  IStreamSink* sink_;
  bool connected_ = true;
};

// Collects one provider step and forwards each event to the bus as it arrives.
class StepStream {
 public:
  StepStream(const IClock* clock, TimePoint deadline, GenerationEventBus* bus, const ClientRelay* relay,
             bool stop_on_disconnect)
      : clock_(clock), deadline_(deadline), bus_(bus), relay_(relay), stop_on_disconnect_(stop_on_disconnect) {}

  // Returns false to stop the provider.
  bool OnEvent(const ModelEvent& mev) {
    if (clock_->Now() > deadline_) {
      timed_out_ = true;
      return false;
    }
    StreamEvent ev;
    switch (mev.kind) {
      case ModelEventKind::kTextDelta:
        result_.text += mev.text;
        ev.kind = StreamEventKind::kTextDelta;
        ev.text = mev.text;
        break;
      case ModelEventKind::kReasoningDelta:
        result_.reasoning += mev.text;
        ev.kind = StreamEventKind::kReasoningDelta;
        ev.text = mev.text;
        break;
      case ModelEventKind::kToolCall:
        result_.tool_calls.push_back(ToolCallRecord{mev.tool_call, mev.thought_signature});
        ev.kind = StreamEventKind::kToolCall;
        ev.tool_call_id = mev.tool_call.id;
        ev.tool_name = mev.tool_call.name;
        ev.payload = mev.tool_call.arguments;
        break;
      case ModelEventKind::kFile:
        result_.files.push_back(GeneratedFile{mev.media_type, mev.data_base64});
        ev.kind = StreamEventKind::kFile;
        ev.media_type = mev.media_type;
        ev.data_base64 = mev.data_base64;
        break;
      case ModelEventKind::kFinish:
        result_.finish_reason = mev.finish_reason;
        result_.usage = mev.usage;
        return true;
    }
    bus_->Publish(ev);
    if (stop_on_disconnect_ && !relay_->connected()) {
      stopped_for_disconnect_ = true;
      return false;
    }
    return true;
  }

  StepResult TakeResult() { return std::move(result_); }
  bool timed_out() const { return timed_out_; }
  bool stopped_for_disconnect() const { return stopped_for_disconnect_; }

 private:
  const IClock* clock_;
  TimePoint deadline_;
  GenerationEventBus* bus_;
  const ClientRelay* relay_;
  bool stop_on_disconnect_;
  StepResult result_;
  bool timed_out_ = false;
  bool stopped_for_disconnect_ = false;
};

static StreamEvent ErrorEvent(const std::string& message) {
  StreamEvent ev;
  ev.kind = StreamEventKind::kError;
  ev.text = message;
  return ev;
}

static void AppendStepToConversation(const StepResult& step, std::vector<ConversationMessage>* convo) {
  ConversationMessage assistant;
  assistant.role = "assistant";
  if (!step.text.empty()) {
    ConversationPart p;
    p.kind = ConversationPartKind::kText;
    p.text = step.text;
    assistant.parts.push_back(std::move(p));
  }
  for (const auto& tc : step.tool_calls) {
    ConversationPart p;
    p.kind = ConversationPartKind::kToolCall;
    p.tool_call = tc.call;
    p.thought_signature = tc.thought_signature;
    assistant.parts.push_back(std::move(p));
  }
  convo->push_back(std::move(assistant));

  ConversationMessage tool;
  tool.role = "tool";
  for (const auto& rec : step.tools) {
    ConversationPart p;
    p.kind = ConversationPartKind::kToolResult;
    p.tool_call.id = rec.tool_call_id;
    p.tool_call.name = rec.tool_name;
    p.tool_call.arguments = rec.args;
    p.tool_result = rec.result ? *rec.result : nlohmann::json(nullptr);
    tool.parts.push_back(std::move(p));
  }
  convo->push_back(std::move(tool));
}

}  // namespace

const char* GenerationPhaseName(GenerationPhase phase) {
  switch (phase) {
    case GenerationPhase::kComposing:
      return "composing";
    case GenerationPhase::kStreaming:
      return "streaming";
    case GenerationPhase::kFinalizing:
      return "finalizing";
    case GenerationPhase::kPersisted:
      return "persisted";
    case GenerationPhase::kAborted:
      return "aborted";
  }
  return "aborted";
}

GenerationState FoldStep(GenerationState state, const StepResult& step) {
  state.text += step.text;
  state.reasoning += step.reasoning;
  state.tools.insert(state.tools.end(), step.tools.begin(), step.tools.end());
  // Calls that never reached execution are kept without a result.
  for (const auto& tc : step.tool_calls) {
    bool executed = false;
    for (const auto& rec : step.tools) {
      if (rec.tool_call_id == tc.call.id) {
        executed = true;
        break;
      }
    }
    if (!executed) state.tools.push_back(ToolRecord{tc.call.id, tc.call.name, tc.call.arguments, std::nullopt});
  }
  state.files.insert(state.files.end(), step.files.begin(), step.files.end());
  state.usage += step.usage;
  state.steps += 1;
  if (!step.finish_reason.empty()) state.finish_reason = step.finish_reason;
  return state;
}

GenerationOrchestrator::GenerationOrchestrator(IModelProvider* provider,
                                               IToolProvider* tool_provider,
                                               ILedgerStore* ledger,
                                               PersistenceGateway* gateway,
                                               StaleReconciler* reconciler,
                                               const IClock* clock,
                                               OrchestratorOptions options)
    : provider_(provider),
      tool_provider_(tool_provider),
      ledger_(ledger),
      gateway_(gateway),
      reconciler_(reconciler),
      clock_(clock),
      options_(options) {
  if (options_.max_steps < 1) options_.max_steps = 1;
}

PrepareResult GenerationOrchestrator::Prepare(GenerationRequest request) {
  PrepareResult out;
  PreparedGeneration gen;
  gen.generation_id = NewId("gen");

  gen.tools = tool_provider_ ? tool_provider_->LookupEnabledTools(request.enabled_capabilities) : nullptr;
  if (!gen.tools) gen.tools = std::make_shared<const ToolRegistry>();
  const auto tool_names = ExtractToolNames(gen.tools->ListSchemas());

  const auto now = clock_->Now();
  gen.system_prompt = ComposeSystemPrompt(request.prompt, now, tool_names);

  LedgerRow row;
  row.id = gen.generation_id;
  row.chat_id = request.chat_id;
  row.model_id = request.model.id;
  row.reasoning_effort = ReasoningEffortName(request.effort);
  row.sub_mode = ChatModeTag(request.prompt.mode);
  row.status = GenerationStatus::kStreaming;
  row.started_at_ms = ToUnixMillis(now);
  row.last_update_at_ms = row.started_at_ms;
  row.created_at_ms = row.started_at_ms;

  std::cout << "[generation] id=" << gen.generation_id << " phase=composing chat=" << request.chat_id
            << " model=" << request.model.id << " effort=" << row.reasoning_effort << " tools=" << tool_names.size()
            << " prompt_chars=" << gen.system_prompt.size() << "\n";

  // Held before the row exists so no pass can see it unleased.
  if (reconciler_) gen.lease = reconciler_->live().Acquire(gen.generation_id);

  // One retry after reconciling a stale row inline.
  for (int attempt = 0; attempt < 2; ++attempt) {
    LedgerRow existing;
    std::string err;
    const auto created = ledger_->CreateIfNoStreaming(row, &existing, &err);
    if (created == LedgerCreateResult::kCreated) {
      gen.row = row;
      gen.request = std::move(request);
      out.status = PrepareStatus::kReady;
      out.generation = std::move(gen);
      return out;
    }
    if (created == LedgerCreateResult::kFailed) {
      out.status = PrepareStatus::kFailed;
      out.error = err;
      std::cout << "[ledger] create id=" << row.id << " ok=0 error=" << err << "\n";
      return out;
    }
    if (attempt == 0 && reconciler_ && reconciler_->IsStale(existing)) {
      std::string rec_err;
      if (reconciler_->ReconcileRow(existing, nullptr, &rec_err)) continue;
      std::cout << "[reconcile] inline id=" << existing.id << " ok=0 error=" << rec_err << "\n";
    }
    out.status = PrepareStatus::kConflict;
    out.conflicting = existing;
    out.error = "a generation is already in progress for this chat";
    return out;
  }
  out.status = PrepareStatus::kConflict;
  out.error = "a generation is already in progress for this chat";
  return out;
}

GenerationOutcome GenerationOrchestrator::Run(PreparedGeneration gen, IStreamSink* sink) {
  GenerationOutcome outcome;
  outcome.generation_id = gen.generation_id;
  outcome.message_id = MessageIdForGeneration(gen.generation_id);

  TelemetryTracker telemetry(clock_);
  telemetry.MarkRequestStart();
  CheckpointWriter writer(ledger_, clock_, options_.heartbeat_interval);
  LedgerCheckpointer checkpointer(gen.row, &writer, clock_, options_.checkpoint_interval);
  // Gives the heartbeat a row to refresh before the first delta.
  checkpointer.Checkpoint(gen.row);
  ClientRelay relay(sink);

  // The relay is last so a slow caller never delays timestamps or checkpoint submission.
  GenerationEventBus bus;
  bus.Subscribe(&telemetry);
  bus.Subscribe(&checkpointer);
  bus.Subscribe(&relay);

  const auto deadline = clock_->Now() + options_.generation_timeout;
  const auto schemas = gen.tools->ListSchemas();
  std::vector<ConversationMessage> convo = gen.request.messages;
  GenerationState state;
  std::string failure;
  bool disconnected = false;

  outcome.phase = GenerationPhase::kStreaming;
  for (int step = 1; step <= options_.max_steps; ++step) {
    if (clock_->Now() > deadline) {
      failure = "generation timed out after " + std::to_string(options_.generation_timeout.count()) + "s";
      break;
    }
    std::cout << "[generation] id=" << gen.generation_id << " phase=streaming step=" << step << "\n";

    StepRequest sreq;
    sreq.model = gen.request.model;
    sreq.effort = gen.request.effort;
    sreq.system_prompt = gen.system_prompt;
    sreq.messages = convo;
    sreq.tools = schemas;

    StepStream stream(clock_, deadline, &bus, &relay, !options_.continue_on_disconnect);
    std::string err;
    const bool ok =
        provider_->StreamStep(sreq, [&stream](const ModelEvent& mev) { return stream.OnEvent(mev); }, &err);
    StepResult sr = stream.TakeResult();

    if (!ok) {
      state = FoldStep(std::move(state), sr);
      if (stream.stopped_for_disconnect()) {
        disconnected = true;
      } else {
        failure = stream.timed_out()
                      ? "generation timed out after " + std::to_string(options_.generation_timeout.count()) + "s"
                      : err;
      }
      break;
    }

    // Calls within a step are independent; steps are not.
    if (!sr.tool_calls.empty()) {
      // Tool calls can outlast the stale threshold without producing a delta.
      checkpointer.Checkpoint(checkpointer.row());
      std::vector<std::future<ToolResult>> pending;
      pending.reserve(sr.tool_calls.size());
      for (const auto& tc : sr.tool_calls) {
        auto tools = gen.tools;
        auto call = tc.call;
        pending.push_back(std::async(std::launch::async, [tools, call] { return tools->Execute(call); }));
      }
      for (size_t i = 0; i < pending.size(); ++i) {
        ToolResult res = pending[i].get();
        const auto& call = sr.tool_calls[i].call;
        sr.tools.push_back(ToolRecord{call.id, call.name, call.arguments, res.result});
        StreamEvent ev;
        ev.kind = StreamEventKind::kToolResult;
        ev.tool_call_id = call.id;
        ev.tool_name = call.name;
        ev.payload = res.result;
        bus.Publish(ev);
      }
    }

    state = FoldStep(std::move(state), sr);
    if (!relay.connected() && !options_.continue_on_disconnect) {
      disconnected = true;
      break;
    }
    if (sr.tool_calls.empty() || step == options_.max_steps) break;
    AppendStepToConversation(sr, &convo);
  }

  telemetry.MarkEnd();
  outcome.steps = state.steps;
  outcome.usage = state.usage;

  if (disconnected) {
    checkpointer.Checkpoint(checkpointer.row());
    if (!writer.Flush(kFinalFlushTimeout)) {
      std::cout << "[ledger] flush id=" << gen.generation_id << " ok=0 error=timeout\n";
    }
    outcome.phase = GenerationPhase::kAborted;
    outcome.error = "client disconnected";
    std::cout << "[generation] id=" << gen.generation_id << " phase=aborted reason=disconnect steps=" << state.steps
              << "\n";
    return outcome;
  }

  if (!failure.empty()) {
    LedgerRow row = checkpointer.row();
    row.status = GenerationStatus::kError;
    row.error = failure;
    checkpointer.Checkpoint(row);
    if (!writer.Flush(kFinalFlushTimeout)) {
      std::cout << "[ledger] flush id=" << gen.generation_id << " ok=0 error=timeout\n";
    }
    bus.Publish(ErrorEvent(failure));
    outcome.phase = GenerationPhase::kAborted;
    outcome.error = failure;
    std::cout << "[generation] id=" << gen.generation_id << " phase=aborted error=" << TruncateForLog(failure, 300)
              << "\n";
    return outcome;
  }

  outcome.phase = GenerationPhase::kFinalizing;
  AssemblyInput input;
  input.tools = state.tools;
  input.reasoning = state.reasoning;
  input.text = state.text;
  input.files = state.files;
  outcome.content = AssembleContent(input);
  outcome.tokens_per_second = RoundTokensPerSecond(telemetry.TokensPerSecond(state.usage));
  outcome.finish_reason = state.finish_reason.empty() ? "stop" : state.finish_reason;

  const auto now = clock_->Now();
  LedgerRow row = checkpointer.row();
  row.status = GenerationStatus::kCompleted;
  row.completed_at_ms = ToUnixMillis(now);
  row.content_snapshot = ContentToJson(outcome.content);
  row.tokens_per_second = outcome.tokens_per_second;
  row.total_tokens = state.usage.total_tokens;
  checkpointer.Checkpoint(row);
  if (!writer.Flush(kFinalFlushTimeout)) {
    std::cout << "[ledger] flush id=" << gen.generation_id << " ok=0 error=timeout\n";
  }

  Message msg;
  msg.id = outcome.message_id;
  msg.chat_id = gen.request.chat_id;
  msg.role = "assistant";
  msg.content = outcome.content;
  msg.model_id = gen.request.model.id;
  msg.sub_mode = ChatModeTag(gen.request.prompt.mode);
  msg.tokens_per_second = outcome.tokens_per_second;
  msg.created_at_ms = ToUnixMillis(now);

  std::string err;
  if (gateway_->SaveMessage(msg, nullptr, &err)) {
    outcome.persisted = true;
    bool deleted = false;
    std::string del_err;
    if (!ledger_->Delete(gen.generation_id, &deleted, &del_err)) {
      std::cout << "[ledger] delete id=" << gen.generation_id << " ok=0 error=" << del_err << "\n";
    }
    outcome.phase = GenerationPhase::kPersisted;
  } else {
    // The completed row keeps the snapshot; a reconciler pass stores it later.
    std::cout << "[persist] message id=" << msg.id << " ok=0 error=" << err << "\n";
  }

  StreamEvent finish;
  finish.kind = StreamEventKind::kFinish;
  finish.finish_reason = outcome.finish_reason;
  finish.message_id = outcome.message_id;
  finish.steps = outcome.steps;
  finish.usage = state.usage;
  finish.tokens_per_second = outcome.tokens_per_second;
  bus.Publish(finish);

  std::cout << "[generation] id=" << gen.generation_id << " phase=" << GenerationPhaseName(outcome.phase)
            << " steps=" << outcome.steps << " parts=" << outcome.content.size() << " tps="
            << (outcome.tokens_per_second ? std::to_string(*outcome.tokens_per_second) : std::string("null"))
            << " persisted=" << (outcome.persisted ? 1 : 0) << "\n";
  return outcome;
}

}  // namespace chatgen
