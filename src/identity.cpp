#include "identity.hpp"

#include <algorithm>
#include <cctype>

namespace chatgen {
namespace {

static std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static std::string Trim(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  size_t e = s.size();
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

}  // namespace

TrustedHeaderIdentityResolver::TrustedHeaderIdentityResolver(std::string header_name, bool require_identity)
    : header_name_(ToLower(std::move(header_name))), require_identity_(require_identity) {}

std::optional<Identity> TrustedHeaderIdentityResolver::ResolveCaller(const RequestHeaders& headers) {
  for (const auto& [key, value] : headers) {
    if (ToLower(key) != header_name_) continue;
    auto id = Trim(value);
    if (id.empty()) break;
    return Identity{std::move(id), false};
  }
  if (require_identity_) return std::nullopt;
  return Identity{"anonymous", true};
}

}  // namespace chatgen
