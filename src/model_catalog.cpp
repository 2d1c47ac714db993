#include "model_catalog.hpp"

#include <iostream>

namespace chatgen {
namespace {

static std::string StripProviderPrefix(const std::string& model_id) {
  constexpr const char* kPrefix = "google/";
  if (model_id.rfind(kPrefix, 0) == 0) return model_id.substr(7);
  return model_id;
}

static bool Contains(const std::string& s, const char* needle) {
  return s.find(needle) != std::string::npos;
}

}  // namespace

ModelProfile ResolveModelProfile(const std::string& model_id) {
  ModelProfile p;
  p.id = StripProviderPrefix(model_id);
  if (Contains(p.id, "gemini-3")) {
    p.family = ModelFamily::kGemini3;
    p.uses_thinking_level = true;
  } else if (Contains(p.id, "gemini-2.5")) {
    p.family = ModelFamily::kGemini25;
  } else if (Contains(p.id, "gemini-2")) {
    p.family = ModelFamily::kGemini2;
    p.supports_thinking = false;
  }
  if (Contains(p.id, "image")) {
    p.generates_images = true;
    p.supports_thinking = false;
  }
  return p;
}

std::optional<ThinkingConfig> ThinkingConfigFor(const ModelProfile& profile, ReasoningEffort effort) {
  if (!profile.supports_thinking) return std::nullopt;
  ThinkingConfig cfg;
  if (profile.uses_thinking_level) {
    cfg.level = effort == ReasoningEffort::kLow ? "low" : "high";
    return cfg;
  }
  switch (effort) {
    case ReasoningEffort::kLow:
      cfg.budget_tokens = 2048;
      break;
    case ReasoningEffort::kMedium:
      cfg.budget_tokens = 8192;
      break;
    case ReasoningEffort::kHigh:
      cfg.budget_tokens = 24576;
      break;
  }
  return cfg;
}

std::optional<ReasoningEffort> ParseReasoningEffort(const std::string& s) {
  if (s == "low") return ReasoningEffort::kLow;
  if (s == "medium") return ReasoningEffort::kMedium;
  if (s == "high") return ReasoningEffort::kHigh;
  return std::nullopt;
}

const char* ReasoningEffortName(ReasoningEffort effort) {
  switch (effort) {
    case ReasoningEffort::kLow:
      return "low";
    case ReasoningEffort::kMedium:
      return "medium";
    case ReasoningEffort::kHigh:
      return "high";
  }
  return "medium";
}

ModelCatalog::ModelCatalog(const std::vector<std::string>& model_ids, const std::string& default_model) {
  for (const auto& id : model_ids) {
    auto p = ResolveModelProfile(id);
    if (p.id.empty() || Find(p.id)) continue;
    profiles_.push_back(std::move(p));
  }
  if (auto d = Find(default_model)) {
    default_ = *d;
  } else {
    default_ = ResolveModelProfile(default_model);
    profiles_.push_back(default_);
  }
  for (const auto& p : profiles_) {
    std::cout << "[models] id=" << p.id << " thinking=" << (p.supports_thinking ? 1 : 0)
              << " thinking_level=" << (p.uses_thinking_level ? 1 : 0) << " images=" << (p.generates_images ? 1 : 0)
              << "\n";
  }
}

std::optional<ModelProfile> ModelCatalog::Find(const std::string& model_id) const {
  const auto id = StripProviderPrefix(model_id);
  for (const auto& p : profiles_) {
    if (p.id == id) return p;
  }
  return std::nullopt;
}

}  // namespace chatgen
