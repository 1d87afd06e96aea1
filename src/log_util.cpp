#include "log_util.hpp"

#include <cstring>
#include <string>

namespace toolagent {

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
  for (const auto& key : {"api_key", "api-key", "authorization", "apiKey"}) {
    if (j.contains(key)) j.erase(key);
  }
  if (j.contains("headers") && j["headers"].is_object()) {
    auto& h = j["headers"];
    for (const auto& key : {"authorization", "proxy-authorization", "api-key", "api_key", "x-api-key"}) {
      if (h.contains(key)) h.erase(key);
    }
  }
  if (j.contains("env") && j["env"].is_object()) {
    for (auto it = j["env"].begin(); it != j["env"].end(); ++it) it.value() = "***";
  }
  return j.dump();
}

}  // namespace toolagent
