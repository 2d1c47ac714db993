#pragma once

#include <optional>
#include <string>
#include <vector>

namespace chatgen {

enum class ModelFamily {
  kGemini3,
  kGemini25,
  kGemini2,
  kOther,
};

enum class ReasoningEffort {
  kLow,
  kMedium,
  kHigh,
};

// Resolved once when the catalog is built; request handling never looks at the id string again.
struct ModelProfile {
  std::string id;
  ModelFamily family = ModelFamily::kOther;
  bool supports_thinking = true;
  bool uses_thinking_level = false;
  bool generates_images = false;
};

struct ThinkingConfig {
  bool include_thoughts = true;
  std::optional<std::string> level;
  std::optional<int> budget_tokens;
};

ModelProfile ResolveModelProfile(const std::string& model_id);

// Image generation models take no thinking configuration.
std::optional<ThinkingConfig> ThinkingConfigFor(const ModelProfile& profile, ReasoningEffort effort);

std::optional<ReasoningEffort> ParseReasoningEffort(const std::string& s);
const char* ReasoningEffortName(ReasoningEffort effort);

class ModelCatalog {
 public:
  ModelCatalog(const std::vector<std::string>& model_ids, const std::string& default_model);

  // Accepts ids with or without the "google/" provider prefix.
  std::optional<ModelProfile> Find(const std::string& model_id) const;
  const ModelProfile& Default() const { return default_; }
  const std::vector<ModelProfile>& Profiles() const { return profiles_; }

 private:
  std::vector<ModelProfile> profiles_;
  ModelProfile default_;
};

}  // namespace chatgen
