#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace toolagent {

constexpr size_t kMaxLogPayloadChars = 2000;

std::string TruncateForLog(std::string s, size_t max_chars = kMaxLogPayloadChars);

// Drops api keys and authorization headers before a payload is printed.
std::string SanitizeJsonForLog(const nlohmann::json& body);

}  // namespace toolagent
