#pragma once

#include "mcp_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolagent {

// "server:tool" -> "server_tool". Function names may not contain ':'.
std::string ToApiName(const std::string& server_name, const std::string& tool_name);
std::string ToApiName(const std::string& unique_id);

// Splits on the first '_' only. Best effort when the server name itself
// contains '_'; prefer ResolveApiName when the tool list is at hand.
std::string FromApiName(const std::string& api_name);

struct ResolvedTool {
  std::string server_name;
  std::string tool_name;

  std::string UniqueId() const {
    return server_name + ":" + tool_name;
  }
};

// Exact match against the encoded names of `known` first, then the
// generic decode. Returns nullopt when neither yields "server:tool".
std::optional<ResolvedTool> ResolveApiName(const std::string& api_name, const std::vector<ToolWithServer>& known);

// {"type":"function","function":{"name","description","parameters"}} per tool.
nlohmann::json ToolsToFunctions(const std::vector<ToolWithServer>& tools);
nlohmann::json ConvertInputSchema(const nlohmann::json& input_schema);

// "call_<epoch ms>_<n>"
std::string GenerateToolCallId();

struct ToolCallContext {
  std::string tool_call_id;
  std::string tool_name;  // "server:tool"
  std::string server_name;
  nlohmann::json arguments = nlohmann::json::object();
  std::chrono::system_clock::time_point created_at{};
};

// Outstanding tool invocations keyed by the id the model issued.
class ToolCallTracker {
 public:
  // `api_tool_name` may be the encoded or the "server:tool" form.
  void Register(const std::string& tool_call_id,
                const std::string& api_tool_name,
                const std::string& server_name,
                const nlohmann::json& arguments,
                std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now());
  std::optional<ToolCallContext> Get(const std::string& tool_call_id) const;
  bool Complete(const std::string& tool_call_id);
  size_t CleanupOlderThan(std::chrono::milliseconds max_age = std::chrono::hours(1));
  std::vector<ToolCallContext> Active() const;
  size_t Size() const;

 private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, ToolCallContext> calls_;
};

}  // namespace toolagent
