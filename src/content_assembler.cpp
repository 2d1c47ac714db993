#include "content_assembler.hpp"

#include <utility>

namespace chatgen {
namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

static std::string StringField(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_string()) return {};
  return j[key].get<std::string>();
}

static bool ParseDataUrl(const std::string& url, std::string* media_type, std::string* data) {
  constexpr const char* kPrefix = "data:";
  if (url.rfind(kPrefix, 0) != 0) return false;
  const auto marker = url.find(";base64,");
  if (marker == std::string::npos) return false;
  *media_type = url.substr(5, marker - 5);
  *data = url.substr(marker + 8);
  return true;
}

// Position of a part kind in the canonical sequence.
static int Rank(const ContentPart& part) {
  return static_cast<int>(part.index());
}

}  // namespace

nlohmann::json ContentPartToJson(const ContentPart& part) {
  return std::visit(
      Overloaded{
          [](const ToolInvocationPart& p) -> nlohmann::json {
            nlohmann::json j;
            j["type"] = "tool-invocation";
            j["toolCallId"] = p.tool_call_id;
            j["toolName"] = p.tool_name;
            j["state"] = p.result ? "result" : "call";
            j["args"] = p.args;
            j["result"] = p.result ? *p.result : nlohmann::json(nullptr);
            return j;
          },
          [](const ReasoningPart& p) -> nlohmann::json {
            return {{"type", "reasoning"}, {"text", p.text}, {"reasoning", p.text}};
          },
          [](const TextPart& p) -> nlohmann::json { return {{"type", "text"}, {"text", p.text}}; },
          [](const GeneratedFilePart& p) -> nlohmann::json {
            return {{"type", "file"},
                    {"mediaType", p.media_type},
                    {"url", "data:" + p.media_type + ";base64," + p.data_base64}};
          },
      },
      part);
}

std::optional<ContentPart> ContentPartFromJson(const nlohmann::json& j, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "content part is not an object";
    return std::nullopt;
  }
  const auto type = StringField(j, "type");
  if (type == "tool-invocation") {
    ToolInvocationPart p;
    p.tool_call_id = StringField(j, "toolCallId");
    p.tool_name = StringField(j, "toolName");
    if (j.contains("args")) p.args = j["args"];
    if (StringField(j, "state") == "result" && j.contains("result")) p.result = j["result"];
    return ContentPart{std::move(p)};
  }
  if (type == "reasoning") {
    auto text = StringField(j, "text");
    if (text.empty()) text = StringField(j, "reasoning");
    return ContentPart{ReasoningPart{std::move(text)}};
  }
  if (type == "text") return ContentPart{TextPart{StringField(j, "text")}};
  if (type == "file") {
    GeneratedFilePart p;
    if (!ParseDataUrl(StringField(j, "url"), &p.media_type, &p.data_base64)) {
      if (err) *err = "file part has no inline data url";
      return std::nullopt;
    }
    if (auto mt = StringField(j, "mediaType"); !mt.empty()) p.media_type = mt;
    return ContentPart{std::move(p)};
  }
  if (err) *err = "unknown content part type: " + type;
  return std::nullopt;
}

nlohmann::json ContentToJson(const std::vector<ContentPart>& parts) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& p : parts) out.push_back(ContentPartToJson(p));
  return out;
}

std::optional<std::vector<ContentPart>> ContentFromJson(const nlohmann::json& j, std::string* err) {
  if (!j.is_array()) {
    if (err) *err = "content is not an array";
    return std::nullopt;
  }
  std::vector<ContentPart> out;
  out.reserve(j.size());
  for (const auto& item : j) {
    auto p = ContentPartFromJson(item, err);
    if (!p) return std::nullopt;
    out.push_back(std::move(*p));
  }
  return out;
}

std::vector<ContentPart> AssembleContent(const AssemblyInput& input) {
  std::vector<ContentPart> out;
  out.reserve(input.tools.size() + input.files.size() + 2);
  for (const auto& t : input.tools) {
    ToolInvocationPart p;
    p.tool_call_id = t.tool_call_id;
    p.tool_name = t.tool_name;
    p.args = t.args;
    p.result = t.result;
    out.emplace_back(std::move(p));
  }
  if (!input.reasoning.empty()) out.emplace_back(ReasoningPart{input.reasoning});
  if (!input.text.empty()) out.emplace_back(TextPart{input.text});
  for (const auto& f : input.files) out.emplace_back(GeneratedFilePart{f.media_type, f.data_base64});
  return out;
}

std::vector<ContentPart> AssembleRecoveredContent(const std::string& partial_reasoning, const std::string& partial_text) {
  AssemblyInput in;
  in.reasoning = partial_reasoning;
  in.text = partial_text;
  return AssembleContent(in);
}

bool IsCanonicalOrder(const std::vector<ContentPart>& parts) {
  int last = 0;
  int reasoning = 0;
  int text = 0;
  for (const auto& p : parts) {
    const int r = Rank(p);
    if (r < last) return false;
    if (std::holds_alternative<ReasoningPart>(p) && ++reasoning > 1) return false;
    if (std::holds_alternative<TextPart>(p) && ++text > 1) return false;
    last = r;
  }
  return true;
}

}  // namespace chatgen
