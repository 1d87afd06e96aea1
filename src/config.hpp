#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toolagent {

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 80;
  std::string base_path;
};

enum class TransportKind { kStdio, kHttp };

const char* TransportKindName(TransportKind kind);

// Launch description of one MCP server. Immutable once loaded.
struct ServerConfig {
  std::string name;
  TransportKind transport = TransportKind::kStdio;
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
  std::string url;
  HttpEndpoint endpoint;
};

struct AgentConfig {
  HttpEndpoint chat_endpoint;
  std::string api_key;
  std::string model = "deepseek-chat";
  float temperature = 0.7f;
  std::optional<int> max_tokens;
  std::string mcp_config_path = "mcp.json";
  std::string mcp_servers_dir = "config/mcp_servers";
  int request_timeout_seconds = 30;
  bool verbose = false;
};

AgentConfig LoadConfigFromEnv();

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);

// True when cpp-httplib is built with CPPHTTPLIB_OPENSSL_SUPPORT.
bool TlsSupported();
// Fails for schemes the http client of this build cannot reach.
bool CheckEndpointScheme(const HttpEndpoint& ep, std::string* err);

std::optional<ServerConfig> ParseServerConfig(const std::string& name, const nlohmann::json& j, std::string* err);

// Reads the {"mcpServers": {...}} document. A missing file yields an empty list.
std::vector<ServerConfig> LoadMcpServerConfigs(const std::string& path, std::string* err);

// Reads one JSON file per server from `dir`. A missing directory yields an empty list.
std::vector<ServerConfig> LoadMcpServerDirectory(const std::string& dir, std::string* err);

// Directory entries first, then mcp.json; the first definition of a name wins.
std::vector<ServerConfig> MergeServerConfigs(std::vector<ServerConfig> primary, const std::vector<ServerConfig>& secondary);

bool IsVerboseLogging();
void SetVerboseLogging(bool verbose);

}  // namespace toolagent
