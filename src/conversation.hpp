#pragma once

#include "capability_registry.hpp"
#include "function_bridge.hpp"
#include "providers/provider.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toolagent {

constexpr int kMaxToolCallRounds = 10;

struct ConversationOptions {
  std::string model = "deepseek-chat";
  float temperature = 0.7f;
  std::optional<int> max_tokens;
  int max_tool_rounds = kMaxToolCallRounds;
  // Kick off a background capability refresh before each model call.
  bool refresh_tools_before_send = true;
};

enum class ConversationState { kIdle, kAwaitingToolResults };

struct ToolCallEvent {
  std::string tool_call_id;
  std::string server_name;
  std::string tool_name;
  bool ok = false;
  std::string error;
  std::chrono::milliseconds duration{0};
};

using ToolCallListener = std::function<void(const ToolCallEvent& event)>;

// Message history plus the model -> tool calls -> model loop.
// One owner drives it; it is not safe for concurrent use.
class ConversationManager {
 public:
  ConversationManager(std::string id,
                      IProvider* provider,
                      CapabilityRegistry* registry,
                      ConversationOptions options = {});

  const std::string& Id() const {
    return id_;
  }
  const ConversationOptions& Options() const {
    return options_;
  }

  void AddUserMessage(const std::string& content);
  // Stored as a user-role message tagged "system".
  void AddSystemMessage(const std::string& content);
  void AddAssistantMessage(const std::string& content,
                           const std::string& reasoning_content = {},
                           std::vector<ToolCall> tool_calls = {});
  // Replaces the block tagged `context_id`, or inserts it before the first
  // untagged message, or appends.
  void AddSystemContext(const std::string& context_id, const std::string& content);
  bool RemoveContext(const std::string& context_id);
  // Result of a tool call executed outside ProcessToolCalls.
  void AddToolMessage(const std::string& tool_call_id, const std::string& content);

  // One model round trip. Returns the assistant text; tool calls in the reply
  // are left pending for ProcessToolCalls.
  std::optional<std::string> SendMessage(std::string* err);
  // Executes the pending tool calls in order, one tool message per call.
  bool ProcessToolCalls();
  // Tool calls and model calls alternate until the model stops asking or the
  // round limit is reached. Returns nullopt without an error when nothing was
  // pending.
  std::optional<std::string> ProcessAndContinue(std::string* err);
  std::optional<std::string> SendUserMessageAndGetResponse(const std::string& text,
                                                           std::string* err,
                                                           bool process_tool_calls_immediately = true);

  bool ValidateOrdering(std::string* err) const;

  ConversationState State() const;
  bool HasUnprocessedToolCalls() const;
  std::vector<ToolCall> LastToolCalls() const;
  std::vector<ChatMessage> GetHistory() const;
  size_t MessageCount() const {
    return messages_.size();
  }
  std::optional<std::string> GetReasoningContent(size_t message_index) const;
  std::optional<std::string> LastReasoningContent() const;
  void ClearConversation();
  nlohmann::json ToJson() const;

  void SetToolCallListener(ToolCallListener listener);
  ToolCallTracker& Tracker() {
    return tracker_;
  }

 private:
  void InsertMessage(size_t index, ChatMessage message);
  void EraseMessage(size_t index);
  std::string ExecuteToolCall(const ToolCall& call, const std::vector<ToolWithServer>& known, ToolCallEvent* event);

  std::string id_;
  IProvider* provider_;
  CapabilityRegistry* registry_;
  ConversationOptions options_;

  std::vector<ChatMessage> messages_;
  // Message index -> reasoning text. Never sent back to the model.
  std::map<size_t, std::string> reasoning_;
  ToolCallTracker tracker_;
  ToolCallListener tool_call_listener_;
};

// Fenced block tagged with the upper-cased id.
std::string FormatContextBlock(const std::string& context_id, const std::string& content);

}  // namespace toolagent
