#include "effort_classifier.hpp"

#include "log_format.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace chatgen {
namespace {

constexpr const char* kClassifierPrompt = R"(You are a prompt complexity analyzer. Your ONLY job is to analyze user prompts and determine how much "thinking effort" an AI would need to answer them well.

OUTPUT RULES:
- Respond with EXACTLY ONE WORD: "low", "medium", or "high"
- No explanations, no punctuation, no other text

CLASSIFICATION GUIDE:

**LOW** - Quick, factual, simple tasks:
- Simple greetings: "hi", "hello", "thanks"
- Direct factual questions: "What is the capital of France?"
- Simple definitions: "What is photosynthesis?"
- Basic translations or formatting tasks
- Casual conversation
- Simple yes/no questions

**MEDIUM** - Requires some reasoning or creativity:
- Explanations: "Explain how X works"
- Comparisons: "What's the difference between X and Y?"
- Simple creative tasks: "Write a short poem"
- General advice: "How should I approach..."
- Multi-step questions requiring basic reasoning
- Summarization tasks

**HIGH** - Complex thinking, analysis, or problem-solving:
- Math problems (especially algebra, calculus, logic puzzles)
- Code debugging or writing complex algorithms
- Frustrated or confused users needing careful help (indicated by "!!", "ugh", excessive punctuation, emotional language)
- Multi-part questions requiring deep analysis
- Scientific reasoning or proofs
- Strategic planning or decision analysis
- Emotional support requiring empathy and care
- Ambiguous questions needing careful interpretation
- Debugging issues or troubleshooting complex problems
- Questions about "why" something doesn't work

When in doubt between two levels, choose the HIGHER one to ensure quality responses.)";

static std::string Normalize(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  size_t e = s.size();
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  std::string out = s.substr(b, e - b);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

}  // namespace

ReasoningEffort ParseEffortAnswer(const std::string& answer) {
  const auto a = Normalize(answer);
  if (auto exact = ParseReasoningEffort(a)) return *exact;
  if (a.find("low") != std::string::npos) return ReasoningEffort::kLow;
  if (a.find("high") != std::string::npos) return ReasoningEffort::kHigh;
  return ReasoningEffort::kMedium;
}

EffortClassifier::EffortClassifier(IModelProvider* provider, ModelProfile model)
    : provider_(provider), model_(std::move(model)) {}

ReasoningEffort EffortClassifier::Classify(const std::string& prompt) {
  if (prompt.empty() || !provider_) return ReasoningEffort::kMedium;
  std::string err;
  auto answer = provider_->GenerateText(model_, kClassifierPrompt, prompt, &err);
  if (!answer) {
    std::cout << "[auto-reasoning] ok=0 error=" << err << "\n";
    return ReasoningEffort::kMedium;
  }
  const auto effort = ParseEffortAnswer(*answer);
  std::cout << "[auto-reasoning] prompt=" << TruncateForLog(prompt, 200) << " raw=" << TruncateForLog(*answer, 50)
            << " effort=" << ReasoningEffortName(effort) << "\n";
  return effort;
}

}  // namespace chatgen
