#pragma once

#include "model_catalog.hpp"
#include "providers/provider.hpp"

#include <optional>
#include <string>

namespace chatgen {

// Trims whitespace, then drops one leading and one trailing quote character.
std::string CleanTitle(const std::string& answer);

// Names a chat from the start of its first prompt with one short model call.
class TitleGenerator {
 public:
  TitleGenerator(IModelProvider* provider, ModelProfile model);

  // Only the first 300 characters of the prompt are sent.
  std::optional<std::string> Generate(const std::string& prompt, std::string* err);

 private:
  IModelProvider* provider_;
  ModelProfile model_;
};

}  // namespace chatgen
