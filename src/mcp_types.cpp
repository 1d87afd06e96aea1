#include "mcp_types.hpp"

#include <string>
#include <utility>

namespace toolagent {
namespace {

constexpr int kJsonRpcMethodNotFound = -32601;

static std::string GetString(const nlohmann::json& j, const char* key) {
  if (j.is_object() && j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
  return {};
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

}  // namespace

const char* McpErrorKindName(McpErrorKind kind) {
  switch (kind) {
    case McpErrorKind::kNone:
      return "none";
    case McpErrorKind::kTransport:
      return "transport";
    case McpErrorKind::kTimeout:
      return "timeout";
    case McpErrorKind::kProtocol:
      return "protocol";
    case McpErrorKind::kMethodNotFound:
      return "method_not_found";
    case McpErrorKind::kRemote:
      return "remote";
    case McpErrorKind::kClosed:
      return "closed";
  }
  return "unknown";
}

std::string McpError::ToString() const {
  std::string out = McpErrorKindName(kind);
  if (code != 0) out += " " + std::to_string(code);
  if (!message.empty()) out += ": " + message;
  return out;
}

void SetMcpError(McpError* err, McpErrorKind kind, std::string message, int code) {
  if (!err) return;
  err->kind = kind;
  err->code = code;
  err->message = std::move(message);
}

McpError McpErrorFromJsonRpc(const nlohmann::json& error_object) {
  McpError e;
  e.kind = McpErrorKind::kRemote;
  if (!error_object.is_object()) {
    e.message = "json-rpc error";
    return e;
  }
  if (error_object.contains("code") && error_object["code"].is_number_integer()) {
    e.code = error_object["code"].get<int>();
  }
  e.message = GetString(error_object, "message");
  if (e.message.empty()) e.message = "json-rpc error";
  if (e.code == kJsonRpcMethodNotFound || ToLower(e.message).find("method not found") != std::string::npos) {
    e.kind = McpErrorKind::kMethodNotFound;
  }
  return e;
}

std::string McpToolResult::JoinedText() const {
  std::string out;
  for (const auto& c : content) {
    std::string piece;
    if (c.type == "text") {
      piece = c.text;
    } else if (c.type == "resource") {
      piece = c.text.empty() ? "[resource " + c.uri + "]" : c.text;
    } else {
      piece = "[" + (c.type.empty() ? std::string("content") : c.type);
      if (!c.mime_type.empty()) piece += " " + c.mime_type;
      piece += "]";
    }
    if (!out.empty()) out += "\n";
    out += piece;
  }
  return out;
}

std::optional<McpTool> McpToolFromJson(const nlohmann::json& j) {
  if (!j.is_object()) return std::nullopt;
  McpTool t;
  t.name = GetString(j, "name");
  if (t.name.empty()) return std::nullopt;
  t.title = GetString(j, "title");
  t.description = GetString(j, "description");
  if (j.contains("inputSchema") && j["inputSchema"].is_object()) t.input_schema = j["inputSchema"];
  if (j.contains("annotations") && j["annotations"].is_object()) t.annotations = j["annotations"];
  return t;
}

std::optional<McpResource> McpResourceFromJson(const nlohmann::json& j) {
  if (!j.is_object()) return std::nullopt;
  McpResource r;
  r.uri = GetString(j, "uri");
  if (r.uri.empty()) return std::nullopt;
  r.name = GetString(j, "name");
  r.description = GetString(j, "description");
  r.mime_type = GetString(j, "mimeType");
  return r;
}

std::optional<McpPrompt> McpPromptFromJson(const nlohmann::json& j) {
  if (!j.is_object()) return std::nullopt;
  McpPrompt p;
  p.name = GetString(j, "name");
  if (p.name.empty()) return std::nullopt;
  p.description = GetString(j, "description");
  if (j.contains("arguments") && j["arguments"].is_array()) {
    for (const auto& a : j["arguments"]) {
      if (!a.is_object()) continue;
      McpPromptArgument arg;
      arg.name = GetString(a, "name");
      arg.description = GetString(a, "description");
      arg.required = a.contains("required") && a["required"].is_boolean() && a["required"].get<bool>();
      if (!arg.name.empty()) p.arguments.push_back(std::move(arg));
    }
  }
  return p;
}

McpContent McpContentFromJson(const nlohmann::json& j) {
  McpContent c;
  if (!j.is_object()) return c;
  c.type = GetString(j, "type");
  c.text = GetString(j, "text");
  c.mime_type = GetString(j, "mimeType");
  c.data = GetString(j, "data");
  c.uri = GetString(j, "uri");
  // Embedded resources nest their payload one level down.
  if (j.contains("resource") && j["resource"].is_object()) {
    const auto& r = j["resource"];
    if (c.uri.empty()) c.uri = GetString(r, "uri");
    if (c.text.empty()) c.text = GetString(r, "text");
    if (c.mime_type.empty()) c.mime_type = GetString(r, "mimeType");
  }
  return c;
}

McpToolResult McpToolResultFromJson(const nlohmann::json& j) {
  McpToolResult r;
  if (!j.is_object()) return r;
  if (j.contains("content") && j["content"].is_array()) {
    for (const auto& c : j["content"]) r.content.push_back(McpContentFromJson(c));
  }
  r.is_error = j.contains("isError") && j["isError"].is_boolean() && j["isError"].get<bool>();
  return r;
}

std::vector<McpContent> McpResourceContentsFromJson(const nlohmann::json& j) {
  std::vector<McpContent> out;
  if (!j.is_object() || !j.contains("contents") || !j["contents"].is_array()) return out;
  for (const auto& c : j["contents"]) {
    auto item = McpContentFromJson(c);
    if (item.type.empty()) item.type = item.text.empty() ? "blob" : "text";
    out.push_back(std::move(item));
  }
  return out;
}

McpPromptResult McpPromptResultFromJson(const nlohmann::json& j) {
  McpPromptResult out;
  if (!j.is_object()) return out;
  out.description = GetString(j, "description");
  if (j.contains("messages") && j["messages"].is_array()) {
    for (const auto& m : j["messages"]) {
      if (!m.is_object()) continue;
      McpPromptMessage pm;
      pm.role = GetString(m, "role");
      if (m.contains("content")) pm.content = McpContentFromJson(m["content"]);
      out.messages.push_back(std::move(pm));
    }
  }
  return out;
}

}  // namespace toolagent
