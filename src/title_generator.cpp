#include "title_generator.hpp"

#include "log_format.hpp"
#include "search_tools.hpp"

#include <cctype>
#include <iostream>
#include <utility>

namespace chatgen {
namespace {

constexpr size_t kPromptChars = 300;

static bool IsQuote(char c) {
  return c == '"' || c == '\'';
}

static std::string TitleRequest(const std::string& prompt) {
  return "Summarize this conversation start in 3-5 words for a title. Avoid using symbols like quotes, asterisks, "
         "plus, minus, colons, or special characters unless absolutely necessary. For example, write \"2 plus 2\" "
         "not \"2+2\". Text: \"" +
         TruncateUtf8(prompt, kPromptChars) + "...\"";
}

}  // namespace

std::string CleanTitle(const std::string& answer) {
  size_t b = 0;
  while (b < answer.size() && std::isspace(static_cast<unsigned char>(answer[b]))) ++b;
  size_t e = answer.size();
  while (e > b && std::isspace(static_cast<unsigned char>(answer[e - 1]))) --e;
  if (e > b && IsQuote(answer[b])) ++b;
  if (e > b && IsQuote(answer[e - 1])) --e;
  return answer.substr(b, e - b);
}

TitleGenerator::TitleGenerator(IModelProvider* provider, ModelProfile model)
    : provider_(provider), model_(std::move(model)) {}

std::optional<std::string> TitleGenerator::Generate(const std::string& prompt, std::string* err) {
  if (prompt.empty()) {
    if (err) *err = "prompt is empty";
    return std::nullopt;
  }
  if (!provider_) {
    if (err) *err = "no model provider";
    return std::nullopt;
  }
  std::string call_err;
  auto answer = provider_->GenerateText(model_, "", TitleRequest(prompt), &call_err);
  if (!answer) {
    std::cout << "[title] ok=0 error=" << call_err << "\n";
    if (err) *err = call_err;
    return std::nullopt;
  }
  auto title = CleanTitle(*answer);
  std::cout << "[title] prompt=" << TruncateForLog(prompt, 200) << " title=" << TruncateForLog(title, 80) << "\n";
  return title;
}

}  // namespace chatgen
