#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace toolagent {

enum class McpErrorKind {
  kNone,
  kTransport,
  kTimeout,
  kProtocol,
  kMethodNotFound,
  kRemote,
  kClosed,
};

const char* McpErrorKindName(McpErrorKind kind);

struct McpError {
  McpErrorKind kind = McpErrorKind::kNone;
  int code = 0;
  std::string message;

  std::string ToString() const;
};

void SetMcpError(McpError* err, McpErrorKind kind, std::string message, int code = 0);

// JSON-RPC error object to McpError. -32601 or a "method not found" message
// maps to kMethodNotFound.
McpError McpErrorFromJsonRpc(const nlohmann::json& error_object);

struct McpTool {
  std::string name;
  std::string title;
  std::string description;
  nlohmann::json input_schema = nlohmann::json::object();
  nlohmann::json annotations;
};

struct McpResource {
  std::string uri;
  std::string name;
  std::string description;
  std::string mime_type;
};

struct McpPromptArgument {
  std::string name;
  std::string description;
  bool required = false;
};

struct McpPrompt {
  std::string name;
  std::string description;
  std::vector<McpPromptArgument> arguments;
};

// One item of a tools/call or resources/read result.
struct McpContent {
  std::string type;
  std::string text;
  std::string mime_type;
  std::string uri;
  std::string data;
};

struct McpToolResult {
  std::vector<McpContent> content;
  bool is_error = false;

  // Text items joined by newlines; other items rendered as "[type ...]".
  std::string JoinedText() const;
};

struct McpPromptMessage {
  std::string role;
  McpContent content;
};

struct McpPromptResult {
  std::string description;
  std::vector<McpPromptMessage> messages;
};

// A tool tagged with the server that provides it.
struct ToolWithServer {
  std::string server_name;
  McpTool tool;

  // "server:tool"
  std::string UniqueId() const {
    return server_name + ":" + tool.name;
  }
};

std::optional<McpTool> McpToolFromJson(const nlohmann::json& j);
std::optional<McpResource> McpResourceFromJson(const nlohmann::json& j);
std::optional<McpPrompt> McpPromptFromJson(const nlohmann::json& j);
McpContent McpContentFromJson(const nlohmann::json& j);
McpToolResult McpToolResultFromJson(const nlohmann::json& j);
std::vector<McpContent> McpResourceContentsFromJson(const nlohmann::json& j);
McpPromptResult McpPromptResultFromJson(const nlohmann::json& j);

}  // namespace toolagent
