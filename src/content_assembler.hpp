#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chatgen {

struct ToolInvocationPart {
  std::string tool_call_id;
  std::string tool_name;
  nlohmann::json args = nlohmann::json::object();
  // Absent when the call never produced a result; stored as state "call" with a null result.
  std::optional<nlohmann::json> result;
};

struct ReasoningPart {
  std::string text;
};

struct TextPart {
  std::string text;
};

struct GeneratedFilePart {
  std::string media_type;
  std::string data_base64;
};

// Alternatives are declared in canonical storage order.
using ContentPart = std::variant<ToolInvocationPart, ReasoningPart, TextPart, GeneratedFilePart>;

// Stored shapes:
//   {"type":"tool-invocation","toolCallId","toolName","state":"result"|"call","args","result"}
//   {"type":"reasoning","text","reasoning"}
//   {"type":"text","text"}
//   {"type":"file","mediaType","url":"data:<mediaType>;base64,<data>"}
nlohmann::json ContentPartToJson(const ContentPart& part);
std::optional<ContentPart> ContentPartFromJson(const nlohmann::json& j, std::string* err);
nlohmann::json ContentToJson(const std::vector<ContentPart>& parts);
std::optional<std::vector<ContentPart>> ContentFromJson(const nlohmann::json& j, std::string* err);

struct ToolRecord {
  std::string tool_call_id;
  std::string tool_name;
  nlohmann::json args = nlohmann::json::object();
  std::optional<nlohmann::json> result;
};

struct GeneratedFile {
  std::string media_type;
  std::string data_base64;
};

struct AssemblyInput {
  std::vector<ToolRecord> tools;
  std::string reasoning;
  std::string text;
  std::vector<GeneratedFile> files;
};

// Emits tool-invocation*, reasoning?, text?, generated-file* in that order. Nothing at all yields an empty list.
std::vector<ContentPart> AssembleContent(const AssemblyInput& input);

// Content for a generation that never finished: reasoning?, text?.
std::vector<ContentPart> AssembleRecoveredContent(const std::string& partial_reasoning, const std::string& partial_text);

bool IsCanonicalOrder(const std::vector<ContentPart>& parts);

}  // namespace chatgen
