#include "generation_events.hpp"

namespace chatgen {

const char* StreamEventKindName(StreamEventKind kind) {
  switch (kind) {
    case StreamEventKind::kTextDelta:
      return "text-delta";
    case StreamEventKind::kReasoningDelta:
      return "reasoning-delta";
    case StreamEventKind::kToolCall:
      return "tool-call";
    case StreamEventKind::kToolResult:
      return "tool-result";
    case StreamEventKind::kFile:
      return "file";
    case StreamEventKind::kFinish:
      return "finish";
    case StreamEventKind::kError:
      return "error";
  }
  return "error";
}

bool IsOutputDelta(StreamEventKind kind) {
  return kind != StreamEventKind::kFinish && kind != StreamEventKind::kError;
}

nlohmann::json StreamEventToJson(const StreamEvent& ev) {
  nlohmann::json j;
  j["type"] = StreamEventKindName(ev.kind);
  switch (ev.kind) {
    case StreamEventKind::kTextDelta:
    case StreamEventKind::kReasoningDelta:
      j["delta"] = ev.text;
      break;
    case StreamEventKind::kToolCall:
      j["toolCallId"] = ev.tool_call_id;
      j["toolName"] = ev.tool_name;
      j["input"] = ev.payload;
      break;
    case StreamEventKind::kToolResult:
      j["toolCallId"] = ev.tool_call_id;
      j["toolName"] = ev.tool_name;
      j["output"] = ev.payload;
      break;
    case StreamEventKind::kFile:
      j["mediaType"] = ev.media_type;
      j["url"] = "data:" + ev.media_type + ";base64," + ev.data_base64;
      break;
    case StreamEventKind::kFinish:
      j["finishReason"] = ev.finish_reason;
      j["messageId"] = ev.message_id;
      j["steps"] = ev.steps;
      j["usage"] = {{"inputTokens", ev.usage.input_tokens},
                    {"outputTokens", ev.usage.output_tokens},
                    {"reasoningTokens", ev.usage.reasoning_tokens},
                    {"totalTokens", ev.usage.total_tokens}};
      if (ev.tokens_per_second) j["tokensPerSecond"] = *ev.tokens_per_second;
      break;
    case StreamEventKind::kError:
      j["errorText"] = ev.text;
      break;
  }
  return j;
}

void GenerationEventBus::Subscribe(IGenerationObserver* observer) {
  if (observer) observers_.push_back(observer);
}

void GenerationEventBus::Publish(const StreamEvent& ev) const {
  for (auto* o : observers_) o->OnEvent(ev);
}

}  // namespace chatgen
