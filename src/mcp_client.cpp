#include "mcp_client.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace toolagent {
namespace {

constexpr int kMaxListPages = 64;

static nlohmann::json InitializeParams() {
  nlohmann::json params;
  params["protocolVersion"] = kMcpProtocolVersion;
  params["capabilities"] = {{"tools", nlohmann::json::object()},
                            {"resources", nlohmann::json::object()},
                            {"prompts", nlohmann::json::object()}};
  params["clientInfo"] = {{"name", "toolagent"}, {"version", "0.1.0"}};
  return params;
}

}  // namespace

McpClient::McpClient(std::string server_name, std::unique_ptr<IMcpTransport> transport)
    : server_name_(std::move(server_name)), transport_(std::move(transport)) {}

McpClient::~McpClient() {
  Close();
}

bool McpClient::Initialize(McpError* err) {
  std::lock_guard<std::mutex> lock(init_mu_);
  if (initialized_) return true;
  if (!transport_) {
    SetMcpError(err, McpErrorKind::kClosed, "no transport");
    return false;
  }
  if (!transport_->IsOpen() && !transport_->Open(err)) return false;

  auto r = transport_->Request("initialize", InitializeParams(), err);
  if (!r) {
    std::cout << "[mcp] initialize failed server=" << server_name_ << "\n";
    return false;
  }

  McpServerInfo info;
  if (r->is_object()) {
    if (r->contains("protocolVersion") && (*r)["protocolVersion"].is_string()) {
      info.protocol_version = (*r)["protocolVersion"].get<std::string>();
    }
    if (r->contains("capabilities") && (*r)["capabilities"].is_object()) info.capabilities = (*r)["capabilities"];
    if (r->contains("serverInfo") && (*r)["serverInfo"].is_object()) {
      const auto& si = (*r)["serverInfo"];
      if (si.contains("name") && si["name"].is_string()) info.name = si["name"].get<std::string>();
      if (si.contains("version") && si["version"].is_string()) info.version = si["version"].get<std::string>();
    }
  }

  McpError notify_err;
  if (!transport_->Notify("notifications/initialized", nlohmann::json::object(), &notify_err)) {
    std::cout << "[mcp] initialized notification failed server=" << server_name_ << " error=" << notify_err.ToString()
              << "\n";
  }
  server_info_ = std::move(info);
  initialized_ = true;
  std::cout << "[mcp] initialized server=" << server_name_ << " remote=" << server_info_->name
            << " protocol=" << server_info_->protocol_version << "\n";
  return true;
}

bool McpClient::IsInitialized() const {
  std::lock_guard<std::mutex> lock(init_mu_);
  return initialized_;
}

std::optional<McpServerInfo> McpClient::ServerInfo() const {
  std::lock_guard<std::mutex> lock(init_mu_);
  return server_info_;
}

std::optional<std::vector<nlohmann::json>> McpClient::ListPaged(const std::string& method,
                                                                const char* field,
                                                                McpError* err) {
  if (!Initialize(err)) return std::nullopt;
  std::vector<nlohmann::json> out;
  std::string cursor;
  for (int page = 0; page < kMaxListPages; page++) {
    nlohmann::json params = nlohmann::json::object();
    if (!cursor.empty()) params["cursor"] = cursor;
    auto r = transport_->Request(method, params, err);
    if (!r) return std::nullopt;
    if (!r->is_object() || !r->contains(field) || !(*r)[field].is_array()) return out;
    for (const auto& item : (*r)[field]) out.push_back(item);
    if (r->contains("nextCursor") && (*r)["nextCursor"].is_string()) {
      cursor = (*r)["nextCursor"].get<std::string>();
      if (cursor.empty()) break;
    } else {
      break;
    }
  }
  return out;
}

std::optional<std::vector<McpTool>> McpClient::ListTools(McpError* err) {
  McpError local;
  auto items = ListPaged("tools/list", "tools", &local);
  if (!items) {
    if (local.kind == McpErrorKind::kMethodNotFound) {
      std::cout << "[mcp] server=" << server_name_ << " does not support tools, closing\n";
      Close();
    }
    if (err) *err = local;
    return std::nullopt;
  }
  std::vector<McpTool> out;
  for (const auto& t : *items) {
    if (auto tool = McpToolFromJson(t)) out.push_back(std::move(*tool));
  }
  return out;
}

std::optional<std::vector<McpResource>> McpClient::ListResources(McpError* err) {
  McpError local;
  auto items = ListPaged("resources/list", "resources", &local);
  if (!items) {
    if (local.kind == McpErrorKind::kMethodNotFound) return std::vector<McpResource>{};
    if (err) *err = local;
    return std::nullopt;
  }
  std::vector<McpResource> out;
  for (const auto& r : *items) {
    if (auto res = McpResourceFromJson(r)) out.push_back(std::move(*res));
  }
  return out;
}

std::optional<std::vector<McpPrompt>> McpClient::ListPrompts(McpError* err) {
  McpError local;
  auto items = ListPaged("prompts/list", "prompts", &local);
  if (!items) {
    if (local.kind == McpErrorKind::kMethodNotFound) return std::vector<McpPrompt>{};
    if (err) *err = local;
    return std::nullopt;
  }
  std::vector<McpPrompt> out;
  for (const auto& p : *items) {
    if (auto prompt = McpPromptFromJson(p)) out.push_back(std::move(*prompt));
  }
  return out;
}

std::optional<McpToolResult> McpClient::CallTool(const std::string& name,
                                                 const nlohmann::json& arguments,
                                                 McpError* err) {
  if (!Initialize(err)) return std::nullopt;
  nlohmann::json params;
  params["name"] = name;
  params["arguments"] = arguments.is_null() ? nlohmann::json::object() : arguments;
  auto r = transport_->Request("tools/call", params, err);
  if (!r) return std::nullopt;
  return McpToolResultFromJson(*r);
}

std::optional<std::vector<McpContent>> McpClient::ReadResource(const std::string& uri, McpError* err) {
  if (!Initialize(err)) return std::nullopt;
  auto r = transport_->Request("resources/read", {{"uri", uri}}, err);
  if (!r) return std::nullopt;
  return McpResourceContentsFromJson(*r);
}

std::optional<McpPromptResult> McpClient::GetPrompt(const std::string& name,
                                                    const nlohmann::json& arguments,
                                                    McpError* err) {
  if (!Initialize(err)) return std::nullopt;
  nlohmann::json params;
  params["name"] = name;
  if (arguments.is_object() && !arguments.empty()) params["arguments"] = arguments;
  auto r = transport_->Request("prompts/get", params, err);
  if (!r) return std::nullopt;
  return McpPromptResultFromJson(*r);
}

void McpClient::Close() {
  if (transport_) transport_->Close();
  std::lock_guard<std::mutex> lock(init_mu_);
  initialized_ = false;
}

bool McpClient::IsOpen() const {
  return transport_ && transport_->IsOpen();
}

}  // namespace toolagent
