#pragma once

#include "model_catalog.hpp"
#include "providers/provider.hpp"

#include <string>

namespace chatgen {

// Exact "low"/"medium"/"high" after trimming and lower-casing, else the first of "low" or "high" found as a
// substring, else medium.
ReasoningEffort ParseEffortAnswer(const std::string& answer);

// Picks a reasoning effort for a prompt with one short model call. Any failure yields medium.
class EffortClassifier {
 public:
  EffortClassifier(IModelProvider* provider, ModelProfile model);

  ReasoningEffort Classify(const std::string& prompt);

 private:
  IModelProvider* provider_;
  ModelProfile model_;
};

}  // namespace chatgen
