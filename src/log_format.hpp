#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace chatgen {

std::string TruncateForLog(std::string s, size_t max_chars);

// Drops credential-looking keys before a payload reaches the log.
std::string SanitizeJsonForLog(const nlohmann::json& body);
std::string SanitizeBodyForLog(const std::string& body);

std::string RedactHeaderValue(const std::string& key, const std::string& value);

}  // namespace chatgen
