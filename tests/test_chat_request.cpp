#include <gtest/gtest.h>

#include "attachments.hpp"
#include "chat_router.hpp"
#include "identity.hpp"
#include "test_support.hpp"

using namespace chatgen;
using chatgen::fakes::FakeFetcher;

class ChatRequestTest : public ::testing::Test {
 protected:
  ModelCatalog catalog{{"gemini-2.5-flash", "gemini-3-pro-preview"}, "gemini-2.5-flash"};
  FakeFetcher fetcher;

  static nlohmann::json Body() {
    return {{"chatId", "chat-1"}, {"messages", nlohmann::json::array({{{"role", "user"}, {"content", "hi"}}})}};
  }

  std::optional<GenerationRequest> Parse(const nlohmann::json& body, std::string* err) {
    return ParseChatRequest(body, catalog, &fetcher, err);
  }
};

TEST_F(ChatRequestTest, RejectsMalformedBodies) {
  std::string err;
  EXPECT_FALSE(Parse(nlohmann::json::parse("{", nullptr, false), &err).has_value());
  EXPECT_EQ(err, "invalid json");

  auto body = Body();
  body["messages"] = "hi";
  EXPECT_FALSE(Parse(body, &err).has_value());
  EXPECT_EQ(err, "messages must be an array");

  body = Body();
  body.erase("chatId");
  EXPECT_FALSE(Parse(body, &err).has_value());
  EXPECT_EQ(err, "chatId is required");

  body = Body();
  body["model"] = "gpt-4o";
  EXPECT_FALSE(Parse(body, &err).has_value());
  EXPECT_EQ(err, "unknown model: gpt-4o");
}

TEST_F(ChatRequestTest, AppliesDefaults) {
  std::string err;
  auto req = Parse(Body(), &err);
  ASSERT_TRUE(req.has_value()) << err;
  EXPECT_EQ(req->chat_id, "chat-1");
  EXPECT_EQ(req->model.id, "gemini-2.5-flash");
  EXPECT_EQ(req->effort, ReasoningEffort::kMedium);
  EXPECT_EQ(req->prompt.response_length, 30);
  EXPECT_EQ(req->prompt.mode, ChatMode::kStandard);
  EXPECT_EQ(req->enabled_capabilities, (std::vector<std::string>{"brave-search"}));
  ASSERT_EQ(req->messages.size(), 1u);
  EXPECT_EQ(req->messages[0].parts[0].text, "hi");
}

TEST_F(ChatRequestTest, ReadsSettings) {
  auto body = Body();
  body["model"] = "google/gemini-3-pro-preview";
  body["reasoningEffort"] = "high";
  body["responseLength"] = 250;
  body["userName"] = "Sam";
  body["customInstructions"] = "Be brief.";
  body["enabledMcpServers"] = nlohmann::json::array({"youtube", 7});
  std::string err;
  auto req = Parse(body, &err);
  ASSERT_TRUE(req.has_value()) << err;
  EXPECT_EQ(req->model.id, "gemini-3-pro-preview");
  EXPECT_EQ(req->effort, ReasoningEffort::kHigh);
  EXPECT_EQ(req->prompt.response_length, 100);
  EXPECT_EQ(req->prompt.user_name, "Sam");
  EXPECT_EQ(req->prompt.custom_instructions, "Be brief.");
  EXPECT_EQ(req->enabled_capabilities, (std::vector<std::string>{"youtube"}));
}

TEST_F(ChatRequestTest, InvalidEffortFallsBackToMedium) {
  auto body = Body();
  body["reasoningEffort"] = "extreme";
  std::string err;
  auto req = Parse(body, &err);
  ASSERT_TRUE(req.has_value()) << err;
  EXPECT_EQ(req->effort, ReasoningEffort::kMedium);
}

TEST_F(ChatRequestTest, LearningModeDropsCustomInstructions) {
  auto body = Body();
  body["learningMode"] = true;
  body["learningSubMode"] = "flashcard";
  body["customInstructions"] = "Talk like a pirate.";
  body["responseLength"] = -5;
  std::string err;
  auto req = Parse(body, &err);
  ASSERT_TRUE(req.has_value()) << err;
  EXPECT_EQ(req->prompt.mode, ChatMode::kLearningFlashcard);
  EXPECT_TRUE(req->prompt.custom_instructions.empty());
  EXPECT_EQ(req->prompt.response_length, 0);
}

TEST_F(ChatRequestTest, EmptyCapabilityListIsHonored) {
  auto body = Body();
  body["enabledMcpServers"] = nlohmann::json::array();
  std::string err;
  auto req = Parse(body, &err);
  ASSERT_TRUE(req.has_value()) << err;
  EXPECT_TRUE(req->enabled_capabilities.empty());
}

TEST(AttachmentsTest, Base64) {
  EXPECT_EQ(Base64Encode("hello"), "aGVsbG8=");
  EXPECT_EQ(Base64Encode("hi!"), "aGkh");
  EXPECT_EQ(Base64Encode(""), "");
}

TEST(AttachmentsTest, KeepsUserAndAssistantOnly) {
  auto messages = nlohmann::json::array({
      {{"role", "system"}, {"content", "ignored"}},
      {{"role", "user"}, {"content", "question"}},
      {{"role", "assistant"}, {"parts", nlohmann::json::array({{{"type", "text"}, {"text", "answer"}}})}},
      {{"role", "user"}, {"content", nlohmann::json::array()}},
  });
  std::string err;
  auto out = ParseRequestMessages(messages, nullptr, &err);
  ASSERT_TRUE(out.has_value()) << err;
  ASSERT_EQ(out->size(), 2u);
  EXPECT_EQ((*out)[0].role, "user");
  EXPECT_EQ((*out)[1].role, "assistant");
  EXPECT_EQ((*out)[1].parts[0].text, "answer");
}

TEST(AttachmentsTest, InlineDataFromDataUrlAndBase64) {
  auto messages = nlohmann::json::array({{{"role", "user"},
                                          {"content", nlohmann::json::array({
                                                          {{"type", "text"}, {"text", "what is this?"}},
                                                          {{"type", "image"}, {"image", "data:image/jpeg;base64,/9j/"}},
                                                          {{"type", "file"}, {"mediaType", "application/pdf"},
                                                           {"data", "JVBERi0="}},
                                                      })}}});
  std::string err;
  auto out = ParseRequestMessages(messages, nullptr, &err);
  ASSERT_TRUE(out.has_value()) << err;
  const auto& parts = (*out)[0].parts;
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[1].kind, ConversationPartKind::kInlineData);
  EXPECT_EQ(parts[1].media_type, "image/jpeg");
  EXPECT_EQ(parts[1].data_base64, "/9j/");
  EXPECT_EQ(parts[2].media_type, "application/pdf");
  EXPECT_EQ(parts[2].data_base64, "JVBERi0=");
}

TEST(AttachmentsTest, DownloadsUrlsAndFallsBackToFileReference) {
  FakeFetcher fetcher;
  fetcher.Set("https://cdn.example/a.txt", 200, "hello", "text/plain; charset=utf-8");
  auto messages = nlohmann::json::array({{{"role", "user"},
                                          {"content", nlohmann::json::array({
                                                          {{"type", "file"}, {"url", "https://cdn.example/a.txt"}},
                                                          {{"type", "file"}, {"mediaType", "application/pdf"},
                                                           {"url", "https://cdn.example/missing.pdf"}},
                                                      })}}});
  std::string err;
  auto out = ParseRequestMessages(messages, &fetcher, &err);
  ASSERT_TRUE(out.has_value()) << err;
  const auto& parts = (*out)[0].parts;
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0].kind, ConversationPartKind::kInlineData);
  EXPECT_EQ(parts[0].media_type, "text/plain");
  EXPECT_EQ(parts[0].data_base64, Base64Encode("hello"));
  EXPECT_EQ(parts[1].kind, ConversationPartKind::kFileUri);
  EXPECT_EQ(parts[1].media_type, "application/pdf");
  EXPECT_EQ(parts[1].text, "https://cdn.example/missing.pdf");
  EXPECT_EQ(fetcher.urls().size(), 2u);
}

TEST(AttachmentsTest, AssistantAttachmentsAreNotReplayed) {
  FakeFetcher fetcher;
  auto messages = nlohmann::json::array(
      {{{"role", "assistant"},
        {"content", nlohmann::json::array({{{"type", "file"}, {"url", "https://cdn.example/generated.png"}},
                                           {{"type", "text"}, {"text", "here you go"}}})}}});
  std::string err;
  auto out = ParseRequestMessages(messages, &fetcher, &err);
  ASSERT_TRUE(out.has_value()) << err;
  ASSERT_EQ((*out)[0].parts.size(), 1u);
  EXPECT_EQ((*out)[0].parts[0].text, "here you go");
  EXPECT_TRUE(fetcher.urls().empty());
}

TEST(AttachmentsTest, RejectsBadShapes) {
  std::string err;
  EXPECT_FALSE(ParseRequestMessages(nlohmann::json::array({"not an object"}), nullptr, &err).has_value());
  EXPECT_EQ(err, "messages[0] must be an object");

  auto messages = nlohmann::json::array({{{"role", "user"}, {"content", nlohmann::json::array({{{"type", "image"}}})}}});
  EXPECT_FALSE(ParseRequestMessages(messages, nullptr, &err).has_value());
  EXPECT_EQ(err, "messages[0] has an invalid content part");
}

TEST(ActiveGenerationTest, SerializesRow) {
  LedgerRow row;
  row.id = "gen-1";
  row.chat_id = "chat-1";
  row.model_id = "gemini-2.5-flash";
  row.reasoning_effort = "low";
  row.status = GenerationStatus::kStreaming;
  row.partial_text = "Hel";
  row.started_at_ms = 100;
  row.last_update_at_ms = 250;
  auto j = ActiveGenerationToJson(row);
  EXPECT_EQ(j["active"], true);
  EXPECT_EQ(j["generationId"], "gen-1");
  EXPECT_EQ(j["status"], "streaming");
  EXPECT_EQ(j["partialText"], "Hel");
  EXPECT_TRUE(j["firstChunkAt"].is_null());
  EXPECT_EQ(j["lastUpdateAt"], 250);

  row.first_chunk_at_ms = 180;
  EXPECT_EQ(ActiveGenerationToJson(row)["firstChunkAt"], 180);
}

TEST(IdentityTest, ReadsTrustedHeaderCaseInsensitively) {
  TrustedHeaderIdentityResolver resolver("X-User-Id", true);
  auto id = resolver.ResolveCaller({{"content-type", "application/json"}, {"x-user-id", " user-7 "}});
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(id->user_id, "user-7");
  EXPECT_FALSE(id->anonymous);
  EXPECT_FALSE(resolver.ResolveCaller({}).has_value());
  EXPECT_FALSE(resolver.ResolveCaller({{"X-User-Id", "   "}}).has_value());
}

TEST(IdentityTest, AnonymousWhenNotRequired) {
  TrustedHeaderIdentityResolver resolver("x-user-id", false);
  auto id = resolver.ResolveCaller({});
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(id->user_id, "anonymous");
  EXPECT_TRUE(id->anonymous);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
