#pragma once

#include "config.hpp"
#include "providers/provider.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace chatgen {

// Request body for generateContent / streamGenerateContent.
nlohmann::json BuildGenerateContentRequest(const StepRequest& req);

// Drops JSON-schema keywords the function-declaration schema dialect rejects.
nlohmann::json SanitizeSchemaForGemini(const nlohmann::json& schema);

// Maps a candidate finishReason to the stream's finish reason.
std::string MapFinishReason(const std::string& gemini_reason, bool has_tool_calls);

// Turns raw streamGenerateContent?alt=sse bytes into model events. Chunks may split lines anywhere.
class GeminiStreamDecoder {
 public:
  // False when on_event asked to stop or the stream carried an error payload (see error()).
  bool Feed(const char* data, size_t len, const ModelEventCallback& on_event);
  // Flushes a trailing unterminated line and emits the single kFinish event.
  bool Finish(const ModelEventCallback& on_event);

  const std::string& error() const { return error_; }
  bool saw_tool_call() const { return tool_calls_ > 0; }

 private:
  std::string buffer_;
  std::string finish_reason_;
  TokenUsage usage_;
  int tool_calls_ = 0;
  std::string error_;

  bool HandleLine(std::string line, const ModelEventCallback& on_event);
  bool HandleChunk(const nlohmann::json& chunk, const ModelEventCallback& on_event);
};

class GeminiProvider : public IModelProvider {
 public:
  GeminiProvider(HttpEndpoint endpoint, std::string api_key);

  std::string Name() const override;
  bool StreamStep(const StepRequest& req, const ModelEventCallback& on_event, std::string* err) override;
  std::optional<std::string> GenerateText(const ModelProfile& model,
                                          const std::string& system_prompt,
                                          const std::string& prompt,
                                          std::string* err) override;

 private:
  HttpEndpoint endpoint_;
  std::string api_key_;

  std::string ModelPath(const std::string& model_id, const std::string& method) const;
};

}  // namespace chatgen
