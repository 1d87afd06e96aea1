#pragma once

#include "capability_registry.hpp"
#include "conversation.hpp"
#include "providers/provider.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace toolagent {

// Surface consumed by whatever drives agents: tools, direct tool calls and
// the conversation.
class Agent {
 public:
  Agent(std::string name, IProvider* provider, CapabilityRegistry* registry, ConversationOptions options = {});

  const std::string& Name() const {
    return name_;
  }

  std::vector<ToolWithServer> GetAvailableTools() const;
  // `tool_id` is "server:tool"; a bare tool name is looked up across servers.
  std::optional<McpToolResult> CallTool(const std::string& tool_id, const nlohmann::json& arguments, McpError* err);
  std::vector<ChatMessage> GetHistory() const;
  std::optional<std::string> SendUserMessageAndGetResponse(const std::string& text, std::string* err);

  ConversationManager& Conversation() {
    return conversation_;
  }

 private:
  std::string name_;
  CapabilityRegistry* registry_;
  ConversationManager conversation_;
};

}  // namespace toolagent
