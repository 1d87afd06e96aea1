#include "agent.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace toolagent {

Agent::Agent(std::string name, IProvider* provider, CapabilityRegistry* registry, ConversationOptions options)
    : name_(std::move(name)), registry_(registry), conversation_(name_, provider, registry, std::move(options)) {}

std::vector<ToolWithServer> Agent::GetAvailableTools() const {
  if (!registry_) return {};
  return registry_->GetAllTools();
}

std::optional<McpToolResult> Agent::CallTool(const std::string& tool_id, const nlohmann::json& arguments, McpError* err) {
  if (!registry_) {
    SetMcpError(err, McpErrorKind::kClosed, "no capability registry");
    return std::nullopt;
  }
  std::string server;
  std::string tool;
  if (auto colon = tool_id.find(':'); colon != std::string::npos) {
    server = tool_id.substr(0, colon);
    tool = tool_id.substr(colon + 1);
  } else if (auto found = registry_->FindServerForTool(tool_id)) {
    server = *found;
    tool = tool_id;
  }
  if (server.empty() || tool.empty()) {
    SetMcpError(err, McpErrorKind::kProtocol, "no server provides tool " + tool_id);
    return std::nullopt;
  }
  std::cout << "[agent] name=" << name_ << " call server=" << server << " tool=" << tool << "\n";
  return registry_->CallTool(server, tool, arguments, err);
}

std::vector<ChatMessage> Agent::GetHistory() const {
  return conversation_.GetHistory();
}

std::optional<std::string> Agent::SendUserMessageAndGetResponse(const std::string& text, std::string* err) {
  return conversation_.SendUserMessageAndGetResponse(text, err);
}

}  // namespace toolagent
