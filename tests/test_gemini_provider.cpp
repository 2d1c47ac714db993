#include <gtest/gtest.h>

#include "gemini_provider.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace chatgen;

class GeminiDecoderTest : public ::testing::Test {
 protected:
  GeminiStreamDecoder decoder;
  std::vector<ModelEvent> events;

  ModelEventCallback Collect() {
    return [this](const ModelEvent& ev) {
      events.push_back(ev);
      return true;
    };
  }

  static std::string Line(const nlohmann::json& chunk) { return "data: " + chunk.dump() + "\r\n\r\n"; }

  static nlohmann::json Parts(nlohmann::json parts) {
    return {{"candidates", nlohmann::json::array({{{"content", {{"role", "model"}, {"parts", std::move(parts)}}}}})}};
  }
};

TEST_F(GeminiDecoderTest, DecodesChunksSplitMidLine) {
  const std::string stream =
      Line(Parts(nlohmann::json::array({{{"text", "Let me think"}, {"thought", true}}}))) +
      Line(Parts(nlohmann::json::array({{{"text", "Hello, "}}}))) +
      Line({{"candidates", nlohmann::json::array({{{"content", {{"parts", nlohmann::json::array({{{"text", "world"}}})}}},
                                                   {"finishReason", "STOP"}}})},
            {"usageMetadata",
             {{"promptTokenCount", 12}, {"candidatesTokenCount", 5}, {"thoughtsTokenCount", 7}, {"totalTokenCount", 24}}}});

  for (size_t i = 0; i < stream.size(); i += 7) {
    const size_t n = std::min<size_t>(7, stream.size() - i);
    ASSERT_TRUE(decoder.Feed(stream.data() + i, n, Collect()));
  }
  ASSERT_TRUE(decoder.Finish(Collect()));

  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(events[0].kind, ModelEventKind::kReasoningDelta);
  EXPECT_EQ(events[0].text, "Let me think");
  EXPECT_EQ(events[1].kind, ModelEventKind::kTextDelta);
  EXPECT_EQ(events[1].text + events[2].text, "Hello, world");
  EXPECT_EQ(events[3].kind, ModelEventKind::kFinish);
  EXPECT_EQ(events[3].finish_reason, "stop");
  EXPECT_EQ(events[3].usage.input_tokens, 12);
  EXPECT_EQ(events[3].usage.reasoning_tokens, 7);
  EXPECT_EQ(events[3].usage.total_tokens, 24);
}

TEST_F(GeminiDecoderTest, FunctionCallsCarrySignatureAndForceToolCallsReason) {
  nlohmann::json part = {{"functionCall", {{"name", "brave_web_search"}, {"args", {{"query", "weather"}}}}},
                         {"thoughtSignature", "sig-abc"}};
  auto chunk = Parts(nlohmann::json::array({part}));
  chunk["candidates"][0]["finishReason"] = "STOP";
  const auto s = Line(chunk);
  ASSERT_TRUE(decoder.Feed(s.data(), s.size(), Collect()));
  ASSERT_TRUE(decoder.Finish(Collect()));

  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].kind, ModelEventKind::kToolCall);
  EXPECT_EQ(events[0].tool_call.name, "brave_web_search");
  EXPECT_EQ(events[0].tool_call.arguments["query"], "weather");
  EXPECT_FALSE(events[0].tool_call.id.empty());
  EXPECT_EQ(events[0].thought_signature, "sig-abc");
  EXPECT_TRUE(decoder.saw_tool_call());
  EXPECT_EQ(events[1].finish_reason, "tool-calls");
}

TEST_F(GeminiDecoderTest, InlineImageBecomesFileEvent) {
  const auto s = Line(Parts(nlohmann::json::array({{{"inlineData", {{"mimeType", "image/png"}, {"data", "iVBOR"}}}}})));
  ASSERT_TRUE(decoder.Feed(s.data(), s.size(), Collect()));
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].kind, ModelEventKind::kFile);
  EXPECT_EQ(events[0].media_type, "image/png");
  EXPECT_EQ(events[0].data_base64, "iVBOR");
}

TEST_F(GeminiDecoderTest, ErrorChunkStopsTheStream) {
  const auto s = Line({{"error", {{"code", 429}, {"message", "Resource exhausted"}}}});
  EXPECT_FALSE(decoder.Feed(s.data(), s.size(), Collect()));
  EXPECT_EQ(decoder.error(), "Resource exhausted");
  EXPECT_TRUE(events.empty());
}

TEST_F(GeminiDecoderTest, ConsumerStopIsHonored) {
  const auto s = Line(Parts(nlohmann::json::array({{{"text", "a"}}, {{"text", "b"}}})));
  int seen = 0;
  EXPECT_FALSE(decoder.Feed(s.data(), s.size(), [&](const ModelEvent&) { return ++seen < 1; }));
  EXPECT_EQ(seen, 1);
  EXPECT_TRUE(decoder.error().empty());
}

TEST_F(GeminiDecoderTest, SkipsGarbageAndTrailingUnterminatedLine) {
  std::string s = "data: {not json}\n: keepalive\n";
  s += "data: " + Parts(nlohmann::json::array({{{"text", "tail"}}})).dump();
  ASSERT_TRUE(decoder.Feed(s.data(), s.size(), Collect()));
  EXPECT_TRUE(events.empty());
  ASSERT_TRUE(decoder.Finish(Collect()));
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].text, "tail");
}

TEST(GeminiMappingTest, FinishReasons) {
  EXPECT_EQ(MapFinishReason("STOP", false), "stop");
  EXPECT_EQ(MapFinishReason("", false), "stop");
  EXPECT_EQ(MapFinishReason("MAX_TOKENS", false), "length");
  EXPECT_EQ(MapFinishReason("SAFETY", false), "content-filter");
  EXPECT_EQ(MapFinishReason("MALFORMED_FUNCTION_CALL", false), "other");
  EXPECT_EQ(MapFinishReason("MAX_TOKENS", true), "tool-calls");
}

TEST(GeminiMappingTest, SanitizeDropsUnsupportedKeywords) {
  nlohmann::json schema = {{"$schema", "http://json-schema.org/draft-07/schema#"},
                           {"type", "object"},
                           {"additionalProperties", false},
                           {"properties", {{"q", {{"type", "string"}, {"default", "x"}}}}}};
  auto out = SanitizeSchemaForGemini(schema);
  EXPECT_FALSE(out.contains("$schema"));
  EXPECT_FALSE(out.contains("additionalProperties"));
  EXPECT_FALSE(out["properties"]["q"].contains("default"));
  EXPECT_EQ(out["properties"]["q"]["type"], "string");
}

TEST(GeminiRequestTest, BuildsContentsToolsAndThinking) {
  StepRequest req;
  req.model = ResolveModelProfile("gemini-2.5-flash");
  req.effort = ReasoningEffort::kHigh;
  req.system_prompt = "be nice";

  ConversationMessage user;
  user.role = "user";
  ConversationPart text;
  text.text = "hi";
  ConversationPart remote;
  remote.kind = ConversationPartKind::kFileUri;
  remote.media_type = "application/pdf";
  remote.text = "https://files.example/doc.pdf";
  user.parts = {text, remote};

  ConversationMessage assistant;
  assistant.role = "assistant";
  ConversationPart call;
  call.kind = ConversationPartKind::kToolCall;
  call.tool_call = ToolCall{"c1", "lookup", {{"q", "x"}}};
  call.thought_signature = "sig";
  assistant.parts = {call};

  ConversationMessage tool;
  tool.role = "tool";
  ConversationPart result;
  result.kind = ConversationPartKind::kToolResult;
  result.tool_call = ToolCall{"c1", "lookup", nlohmann::json::object()};
  result.tool_result = {{"answer", 42}};
  tool.parts = {result};

  req.messages = {user, assistant, tool, ConversationMessage{"user", {}}};
  req.tools = {chatgen::fakes::SimpleSchema("lookup")};

  auto body = BuildGenerateContentRequest(req);
  EXPECT_EQ(body["systemInstruction"]["parts"][0]["text"], "be nice");
  ASSERT_EQ(body["contents"].size(), 3u);
  EXPECT_EQ(body["contents"][0]["role"], "user");
  EXPECT_EQ(body["contents"][0]["parts"][1]["fileData"]["fileUri"], "https://files.example/doc.pdf");
  EXPECT_EQ(body["contents"][1]["role"], "model");
  EXPECT_EQ(body["contents"][1]["parts"][0]["functionCall"]["name"], "lookup");
  EXPECT_EQ(body["contents"][1]["parts"][0]["thoughtSignature"], "sig");
  EXPECT_EQ(body["contents"][2]["role"], "user");
  EXPECT_EQ(body["contents"][2]["parts"][0]["functionResponse"]["response"]["content"]["answer"], 42);
  EXPECT_EQ(body["tools"][0]["functionDeclarations"][0]["name"], "lookup");
  EXPECT_EQ(body["generationConfig"]["thinkingConfig"]["thinkingBudget"], 24576);
  EXPECT_EQ(body["generationConfig"]["thinkingConfig"]["includeThoughts"], true);
}

TEST(GeminiRequestTest, ImageModelsAskForImagesWithoutThinking) {
  StepRequest req;
  req.model = ResolveModelProfile("gemini-2.5-flash-image");
  auto body = BuildGenerateContentRequest(req);
  EXPECT_FALSE(body["generationConfig"].contains("thinkingConfig"));
  EXPECT_EQ(body["generationConfig"]["responseModalities"], nlohmann::json::array({"TEXT", "IMAGE"}));
  EXPECT_FALSE(body.contains("tools"));
  EXPECT_FALSE(body.contains("systemInstruction"));
}

TEST(GeminiRequestTest, Gemini3UsesThinkingLevel) {
  StepRequest req;
  req.model = ResolveModelProfile("gemini-3-pro-preview");
  req.effort = ReasoningEffort::kLow;
  auto body = BuildGenerateContentRequest(req);
  EXPECT_EQ(body["generationConfig"]["thinkingConfig"]["thinkingLevel"], "low");
  EXPECT_FALSE(body["generationConfig"]["thinkingConfig"].contains("thinkingBudget"));
}

TEST(GeminiProviderTest, MissingKeyFailsWithoutNetwork) {
  HttpEndpoint ep;
  GeminiProvider provider(ep, "");
  std::string err;
  StepRequest req;
  EXPECT_FALSE(provider.StreamStep(req, [](const ModelEvent&) { return true; }, &err));
  EXPECT_EQ(err, "gemini: api key is not configured");
  EXPECT_FALSE(provider.GenerateText(req.model, "", "hi", &err).has_value());
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
