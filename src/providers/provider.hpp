#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace toolagent {

struct ToolCall {
  std::string id;
  std::string name;  // function name as the model sent it
  std::string arguments_json;
};

struct ChatMessage {
  std::string role;  // "user" | "assistant" | "tool"
  std::string content;
  std::string name;
  std::vector<ToolCall> tool_calls;
  std::optional<std::string> tool_call_id;
  // Tags system/context blocks for replace-in-place.
  std::optional<std::string> context_id;
};

struct ChatRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  nlohmann::json tools = nlohmann::json::array();
  std::string tool_choice;
  std::optional<int> max_tokens;
  std::optional<float> temperature;
};

struct ChatResponse {
  std::string model;
  std::string id;
  std::string name;
  std::string content;
  std::vector<ToolCall> tool_calls;
  std::string reasoning_content;
  std::string finish_reason = "stop";
};

// Chat-completion collaborator.
class IProvider {
 public:
  virtual ~IProvider() = default;

  virtual std::string Name() const = 0;
  virtual std::optional<ChatResponse> ChatOnce(const ChatRequest& req, std::string* err) = 0;
};

}  // namespace toolagent
