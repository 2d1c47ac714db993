#pragma once

#include "clock.hpp"

#include <optional>
#include <string>
#include <vector>

namespace chatgen {

enum class ChatMode {
  kStandard,
  kLearningSummary,
  kLearningFlashcard,
  kLearningTeaching,
};

enum class VerbosityBand {
  kMinimal,
  kBrief,
  kBalanced,
  kThorough,
  kComprehensive,
};

struct PromptSettings {
  int response_length = 30;
  std::string user_name;
  std::string user_gender = "not-specified";
  ChatMode mode = ChatMode::kStandard;
  std::string custom_instructions;
};

VerbosityBand BandForResponseLength(int response_length);
const char* VerbosityBandName(VerbosityBand band);

// Unknown or empty sub-modes fall back to teaching when learning is on.
ChatMode ChatModeFromRequest(bool learning_mode, const std::string& sub_mode);
// "summary", "flashcard" or "teaching"; empty for standard chat.
std::string ChatModeTag(ChatMode mode);

// Pure: the only clock input is `now`. Learning modes replace the whole style section, so the verbosity
// bands, the formatting rulebook and custom instructions apply to standard chat only.
std::string ComposeSystemPrompt(const PromptSettings& settings,
                                TimePoint now,
                                const std::vector<std::string>& tool_names = {});

}  // namespace chatgen
