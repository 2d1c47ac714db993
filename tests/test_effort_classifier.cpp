#include <gtest/gtest.h>

#include "effort_classifier.hpp"
#include "test_support.hpp"

using namespace chatgen;
using chatgen::fakes::ScriptedProvider;

TEST(EffortAnswerTest, ExactWordsAfterTrimAndCase) {
  EXPECT_EQ(ParseEffortAnswer("low"), ReasoningEffort::kLow);
  EXPECT_EQ(ParseEffortAnswer("  HIGH\n"), ReasoningEffort::kHigh);
  EXPECT_EQ(ParseEffortAnswer("Medium"), ReasoningEffort::kMedium);
}

TEST(EffortAnswerTest, SubstringFallbackPrefersLow) {
  EXPECT_EQ(ParseEffortAnswer("I'd say high."), ReasoningEffort::kHigh);
  EXPECT_EQ(ParseEffortAnswer("low, maybe high"), ReasoningEffort::kLow);
  EXPECT_EQ(ParseEffortAnswer("hard to tell"), ReasoningEffort::kMedium);
  EXPECT_EQ(ParseEffortAnswer(""), ReasoningEffort::kMedium);
}

class EffortClassifierTest : public ::testing::Test {
 protected:
  ScriptedProvider provider;
  EffortClassifier classifier{&provider, ResolveModelProfile("gemini-2.5-flash-lite")};
};

TEST_F(EffortClassifierTest, UsesModelAnswer) {
  provider.SetTextAnswer(std::string("High"));
  EXPECT_EQ(classifier.Classify("Prove that sqrt(2) is irrational"), ReasoningEffort::kHigh);
  EXPECT_EQ(provider.last_prompt(), "Prove that sqrt(2) is irrational");
  EXPECT_NE(provider.last_system_prompt().find("EXACTLY ONE WORD"), std::string::npos);
}

TEST_F(EffortClassifierTest, FailureFallsBackToMedium) {
  provider.SetTextAnswer(std::nullopt, "gemini: http 503: overloaded");
  EXPECT_EQ(classifier.Classify("hi"), ReasoningEffort::kMedium);
}

TEST_F(EffortClassifierTest, EmptyPromptSkipsTheModel) {
  provider.SetTextAnswer(std::string("low"));
  EXPECT_EQ(classifier.Classify(""), ReasoningEffort::kMedium);
  EXPECT_TRUE(provider.last_prompt().empty());
  EXPECT_TRUE(provider.last_system_prompt().empty());
}

TEST(EffortClassifierNoProviderTest, ReturnsMedium) {
  EffortClassifier classifier(nullptr, ResolveModelProfile("gemini-2.5-flash-lite"));
  EXPECT_EQ(classifier.Classify("anything"), ReasoningEffort::kMedium);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
