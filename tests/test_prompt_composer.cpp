#include <gtest/gtest.h>

#include "prompt_composer.hpp"

#include <string>

using namespace chatgen;

class PromptComposerTest : public ::testing::Test {
 protected:
  // 2025-01-15 12:30:00 UTC
  TimePoint now = FromUnixMillis(1736944200000);

  static bool Has(const std::string& s, const std::string& needle) { return s.find(needle) != std::string::npos; }
};

TEST_F(PromptComposerTest, BandBoundaries) {
  EXPECT_EQ(BandForResponseLength(0), VerbosityBand::kMinimal);
  EXPECT_EQ(BandForResponseLength(15), VerbosityBand::kMinimal);
  EXPECT_EQ(BandForResponseLength(16), VerbosityBand::kBrief);
  EXPECT_EQ(BandForResponseLength(30), VerbosityBand::kBrief);
  EXPECT_EQ(BandForResponseLength(31), VerbosityBand::kBalanced);
  EXPECT_EQ(BandForResponseLength(60), VerbosityBand::kBalanced);
  EXPECT_EQ(BandForResponseLength(61), VerbosityBand::kThorough);
  EXPECT_EQ(BandForResponseLength(85), VerbosityBand::kThorough);
  EXPECT_EQ(BandForResponseLength(86), VerbosityBand::kComprehensive);
  EXPECT_EQ(BandForResponseLength(100), VerbosityBand::kComprehensive);
}

TEST_F(PromptComposerTest, StandardPromptHasDateStyleAndFormatting) {
  PromptSettings s;
  s.response_length = 50;
  auto prompt = ComposeSystemPrompt(s, now);
  EXPECT_TRUE(Has(prompt, "## Current Date & Time"));
  EXPECT_TRUE(Has(prompt, "January 15, 2025"));
  EXPECT_TRUE(Has(prompt, "## Response Style: BALANCED "));
  EXPECT_TRUE(Has(prompt, "## Formatting & Visual Richness"));
  EXPECT_FALSE(Has(prompt, "HIGHEST PRIORITY"));
  EXPECT_FALSE(Has(prompt, "## Tool Usage"));
}

TEST_F(PromptComposerTest, CustomInstructionsPrecedeMinimalStyle) {
  PromptSettings s;
  s.response_length = 10;
  s.custom_instructions = "  Always answer in haiku.  ";
  auto prompt = ComposeSystemPrompt(s, now);
  const auto custom = prompt.find("## HIGHEST PRIORITY - User's Custom Instructions");
  const auto style = prompt.find("## Response Style: MINIMAL ");
  ASSERT_NE(custom, std::string::npos);
  ASSERT_NE(style, std::string::npos);
  EXPECT_LT(custom, style);
  EXPECT_TRUE(Has(prompt, "override ALL other guidelines"));
  EXPECT_TRUE(Has(prompt, "Always answer in haiku."));
  EXPECT_FALSE(Has(prompt, "  Always answer in haiku.  "));
}

TEST_F(PromptComposerTest, WhitespaceOnlyCustomInstructionsAreIgnored) {
  PromptSettings s;
  s.custom_instructions = " \n\t ";
  EXPECT_FALSE(Has(ComposeSystemPrompt(s, now), "HIGHEST PRIORITY"));
}

TEST_F(PromptComposerTest, NameAndGenderShapeTheUserSection) {
  PromptSettings s;
  s.user_name = "Ada";
  s.user_gender = "female";
  auto prompt = ComposeSystemPrompt(s, now);
  EXPECT_TRUE(Has(prompt, "## Friendly Greeting"));
  EXPECT_TRUE(Has(prompt, "- Name: Ada"));
  EXPECT_TRUE(Has(prompt, "her name"));
  EXPECT_TRUE(Has(prompt, "`Ada`"));
}

TEST_F(PromptComposerTest, ToolSectionListsEnabledTools) {
  PromptSettings s;
  auto prompt = ComposeSystemPrompt(s, now, {"brave_web_search", "youtube_search"});
  EXPECT_TRUE(Has(prompt, "## Tool Usage"));
  EXPECT_TRUE(Has(prompt, "`brave_web_search`"));
  EXPECT_TRUE(Has(prompt, "### Web Search"));
  EXPECT_TRUE(Has(prompt, "### YouTube"));
}

TEST_F(PromptComposerTest, LearningModesReplaceStyleAndFormatting) {
  for (auto mode : {ChatMode::kLearningSummary, ChatMode::kLearningFlashcard, ChatMode::kLearningTeaching}) {
    PromptSettings s;
    s.mode = mode;
    s.response_length = 5;
    s.custom_instructions = "ignored";
    auto prompt = ComposeSystemPrompt(s, now);
    EXPECT_TRUE(Has(prompt, "## Current Date & Time"));
    EXPECT_FALSE(Has(prompt, "## Response Style: MINIMAL"));
    EXPECT_FALSE(Has(prompt, "## Formatting & Visual Richness"));
    EXPECT_FALSE(Has(prompt, "HIGHEST PRIORITY"));
  }
}

TEST_F(PromptComposerTest, TeachingModeUsesFirstPrinciplesStyle) {
  PromptSettings s;
  s.mode = ChatMode::kLearningTeaching;
  EXPECT_TRUE(Has(ComposeSystemPrompt(s, now), "## Response Style: FIRST-PRINCIPLES TEACHING"));
}

TEST_F(PromptComposerTest, SubModeMapping) {
  EXPECT_EQ(ChatModeFromRequest(false, "summary"), ChatMode::kStandard);
  EXPECT_EQ(ChatModeFromRequest(true, "summary"), ChatMode::kLearningSummary);
  EXPECT_EQ(ChatModeFromRequest(true, "flashcard"), ChatMode::kLearningFlashcard);
  EXPECT_EQ(ChatModeFromRequest(true, ""), ChatMode::kLearningTeaching);
  EXPECT_EQ(ChatModeFromRequest(true, "bogus"), ChatMode::kLearningTeaching);
  EXPECT_EQ(ChatModeTag(ChatMode::kStandard), "");
  EXPECT_EQ(ChatModeTag(ChatMode::kLearningFlashcard), "flashcard");
}

TEST_F(PromptComposerTest, SameInputsGiveSamePrompt) {
  PromptSettings s;
  s.user_name = "Lin";
  s.response_length = 70;
  EXPECT_EQ(ComposeSystemPrompt(s, now, {"a"}), ComposeSystemPrompt(s, now, {"a"}));
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
