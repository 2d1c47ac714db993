#include "log_format.hpp"

#include <cstring>

namespace chatgen {
namespace {

static std::string ToLowerAscii(std::string s) {
  for (char& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

}  // namespace

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

std::string SanitizeJsonForLog(const nlohmann::json& body) {
  if (body.is_null()) return "null";
  if (!body.is_object()) return body.dump();
  auto j = body;
  for (const auto& key : {"api_key", "api-key", "authorization", "apiKey", "key"}) {
    if (j.contains(key)) j.erase(key);
  }
  if (j.contains("headers") && j["headers"].is_object()) {
    auto& h = j["headers"];
    for (const auto& key :
         {"authorization", "proxy-authorization", "api-key", "api_key", "x-api-key", "x-goog-api-key",
          "x-subscription-token"}) {
      if (h.contains(key)) h.erase(key);
    }
  }
  return j.dump();
}

std::string SanitizeBodyForLog(const std::string& body) {
  if (body.empty()) return {};
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded()) return body;
  return SanitizeJsonForLog(j);
}

std::string RedactHeaderValue(const std::string& key, const std::string& value) {
  const auto k = ToLowerAscii(key);
  if (k == "authorization" || k == "proxy-authorization" || k == "api-key" || k == "api_key" || k == "x-api-key" ||
      k == "x-goog-api-key" || k == "x-subscription-token") {
    return "<redacted>";
  }
  return value;
}

}  // namespace chatgen
