#include "function_bridge.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>

namespace toolagent {
namespace {

std::atomic<uint64_t> g_tool_call_counter{0};

}  // namespace

std::string ToApiName(const std::string& server_name, const std::string& tool_name) {
  return ToApiName(server_name + ":" + tool_name);
}

std::string ToApiName(const std::string& unique_id) {
  std::string out = unique_id;
  std::replace(out.begin(), out.end(), ':', '_');
  return out;
}

std::string FromApiName(const std::string& api_name) {
  auto pos = api_name.find('_');
  if (pos == std::string::npos || pos + 1 >= api_name.size()) return api_name;
  return api_name.substr(0, pos) + ":" + api_name.substr(pos + 1);
}

std::optional<ResolvedTool> ResolveApiName(const std::string& api_name, const std::vector<ToolWithServer>& known) {
  for (const auto& t : known) {
    if (ToApiName(t.server_name, t.tool.name) == api_name || t.UniqueId() == api_name) {
      return ResolvedTool{t.server_name, t.tool.name};
    }
  }
  auto decoded = FromApiName(api_name);
  auto colon = decoded.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= decoded.size()) return std::nullopt;
  return ResolvedTool{decoded.substr(0, colon), decoded.substr(colon + 1)};
}

nlohmann::json ConvertInputSchema(const nlohmann::json& input_schema) {
  nlohmann::json out;
  out["type"] = "object";
  if (!input_schema.is_object()) return out;
  if (input_schema.contains("type") && !input_schema["type"].is_null()) out["type"] = input_schema["type"];
  for (const auto& key : {"properties", "required", "description"}) {
    if (input_schema.contains(key)) out[key] = input_schema[key];
  }
  return out;
}

nlohmann::json ToolsToFunctions(const std::vector<ToolWithServer>& tools) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& t : tools) {
    nlohmann::json fn;
    fn["name"] = ToApiName(t.server_name, t.tool.name);
    fn["description"] = t.tool.description.empty() ? "MCP tool: " + t.tool.name : t.tool.description;
    fn["parameters"] = ConvertInputSchema(t.tool.input_schema);
    out.push_back({{"type", "function"}, {"function", std::move(fn)}});
  }
  return out;
}

std::string GenerateToolCallId() {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
  return "call_" + std::to_string(ms) + "_" + std::to_string(++g_tool_call_counter);
}

void ToolCallTracker::Register(const std::string& tool_call_id,
                               const std::string& api_tool_name,
                               const std::string& server_name,
                               const nlohmann::json& arguments,
                               std::chrono::system_clock::time_point created_at) {
  ToolCallContext ctx;
  ctx.tool_call_id = tool_call_id;
  ctx.server_name = server_name;
  ctx.arguments = arguments;
  ctx.created_at = created_at;
  // The server name is known here, so the encoded form is reversed exactly.
  const std::string prefix = server_name + "_";
  if (api_tool_name.compare(0, prefix.size(), prefix) == 0 && api_tool_name.size() > prefix.size()) {
    ctx.tool_name = server_name + ":" + api_tool_name.substr(prefix.size());
  } else {
    ctx.tool_name = api_tool_name;
  }
  std::lock_guard<std::mutex> lock(mu_);
  calls_[tool_call_id] = std::move(ctx);
}

std::optional<ToolCallContext> ToolCallTracker::Get(const std::string& tool_call_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = calls_.find(tool_call_id);
  if (it == calls_.end()) return std::nullopt;
  return it->second;
}

bool ToolCallTracker::Complete(const std::string& tool_call_id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (calls_.erase(tool_call_id) == 0) {
    std::cout << "[bridge] complete unknown tool_call_id=" << tool_call_id << "\n";
    return false;
  }
  return true;
}

size_t ToolCallTracker::CleanupOlderThan(std::chrono::milliseconds max_age) {
  const auto cutoff = std::chrono::system_clock::now() - max_age;
  size_t removed = 0;
  std::lock_guard<std::mutex> lock(mu_);
  for (auto it = calls_.begin(); it != calls_.end();) {
    if (it->second.created_at < cutoff) {
      it = calls_.erase(it);
      removed++;
    } else {
      ++it;
    }
  }
  if (removed) std::cout << "[bridge] cleanup removed=" << removed << "\n";
  return removed;
}

std::vector<ToolCallContext> ToolCallTracker::Active() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<ToolCallContext> out;
  out.reserve(calls_.size());
  for (const auto& [_, ctx] : calls_) out.push_back(ctx);
  return out;
}

size_t ToolCallTracker::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return calls_.size();
}

}  // namespace toolagent
