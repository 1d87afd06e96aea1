#pragma once

#include "mcp_transport.hpp"
#include "mcp_types.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolagent {

constexpr const char* kMcpProtocolVersion = "2024-11-05";

struct McpServerInfo {
  std::string name;
  std::string version;
  std::string protocol_version;
  nlohmann::json capabilities = nlohmann::json::object();
};

// Protocol-level connection to one server. Every method other than Close
// runs the handshake first if it has not completed yet.
class McpClient {
 public:
  McpClient(std::string server_name, std::unique_ptr<IMcpTransport> transport);
  ~McpClient();
  McpClient(const McpClient&) = delete;
  McpClient& operator=(const McpClient&) = delete;

  bool Initialize(McpError* err);
  bool IsInitialized() const;
  std::optional<McpServerInfo> ServerInfo() const;

  // "method not found" is fatal here and closes the connection.
  std::optional<std::vector<McpTool>> ListTools(McpError* err);
  // "method not found" yields an empty list.
  std::optional<std::vector<McpResource>> ListResources(McpError* err);
  std::optional<std::vector<McpPrompt>> ListPrompts(McpError* err);

  std::optional<McpToolResult> CallTool(const std::string& name, const nlohmann::json& arguments, McpError* err);
  std::optional<std::vector<McpContent>> ReadResource(const std::string& uri, McpError* err);
  std::optional<McpPromptResult> GetPrompt(const std::string& name, const nlohmann::json& arguments, McpError* err);

  void Close();
  bool IsOpen() const;

  const std::string& ServerName() const {
    return server_name_;
  }
  IMcpTransport* Transport() const {
    return transport_.get();
  }

 private:
  std::optional<std::vector<nlohmann::json>> ListPaged(const std::string& method, const char* field, McpError* err);

  std::string server_name_;
  std::unique_ptr<IMcpTransport> transport_;

  mutable std::mutex init_mu_;
  bool initialized_ = false;
  std::optional<McpServerInfo> server_info_;
};

}  // namespace toolagent
