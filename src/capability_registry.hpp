#pragma once

#include "config.hpp"
#include "mcp_client.hpp"
#include "mcp_transport.hpp"
#include "mcp_types.hpp"
#include "process_pool.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace toolagent {

enum class ConnectionStatus { kDisconnected, kConnecting, kConnected, kError };

const char* ConnectionStatusName(ConnectionStatus status);

// Immutable snapshot; replaced wholesale on refresh.
struct ServerCapabilities {
  std::vector<McpTool> tools;
  std::vector<McpResource> resources;
  std::vector<McpPrompt> prompts;
  std::chrono::system_clock::time_point fetched_at{};
};

struct ServerSummary {
  std::string name;
  TransportKind transport = TransportKind::kStdio;
  ConnectionStatus status = ConnectionStatus::kDisconnected;
  std::string reason;
  size_t tool_count = 0;
  size_t resource_count = 0;
  size_t prompt_count = 0;
  std::optional<std::chrono::system_clock::time_point> last_connected_at;
};

struct RegistryStatistics {
  size_t total_servers = 0;
  size_t connected = 0;
  size_t connecting = 0;
  size_t disconnected = 0;
  size_t errored = 0;
  size_t total_tools = 0;
  size_t total_resources = 0;
  size_t total_prompts = 0;
};

struct StatusEvent {
  std::string server_name;
  ConnectionStatus status = ConnectionStatus::kDisconnected;
  std::string reason;
};

using StatusListener = std::function<void(const StatusEvent& event)>;
using TransportFactory = std::function<std::unique_ptr<IMcpTransport>(const ServerConfig& config)>;

struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds base_delay{1000};
  double factor = 2.0;
  std::chrono::milliseconds max_delay{8000};
  double jitter = 0.25;
};

// Delay before retry number `attempt` (1-based). `jitter_sample` is in [-1, 1].
std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, int attempt, double jitter_sample);

// Per-server connection state and capability snapshots.
class CapabilityRegistry {
 public:
  explicit CapabilityRegistry(TransportFactory factory);
  explicit CapabilityRegistry(ProcessPool* pool, std::chrono::milliseconds timeout = kDefaultRequestTimeout);
  ~CapabilityRegistry();
  CapabilityRegistry(const CapabilityRegistry&) = delete;
  CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

  // Replaces the configuration of a server that is not connected.
  void AddServer(const ServerConfig& config);
  std::vector<std::string> ServerNames() const;

  bool Connect(const std::string& server_name, std::string* err);
  // Returns the number of servers that ended up connected.
  size_t ConnectAll();
  void Disconnect(const std::string& server_name);

  // Re-fetches the server's lists with retry, reconnecting if needed.
  bool Refresh(const std::string& server_name, std::string* err);
  // Skips servers in the disconnected state.
  void RefreshAll();
  // Returns immediately; overlapping requests coalesce into one pass.
  void RefreshAllInBackground();
  void WaitForBackgroundRefresh();

  ConnectionStatus Status(const std::string& server_name) const;
  std::string StatusReason(const std::string& server_name) const;
  std::shared_ptr<const ServerCapabilities> Capabilities(const std::string& server_name) const;

  std::optional<std::string> FindServerForTool(const std::string& tool_name) const;
  // Tools of connected servers only.
  std::vector<ToolWithServer> GetAllTools() const;

  std::optional<McpToolResult> CallTool(const std::string& server_name,
                                        const std::string& tool_name,
                                        const nlohmann::json& arguments,
                                        McpError* err);
  std::optional<std::vector<McpContent>> ReadResource(const std::string& server_name,
                                                      const std::string& uri,
                                                      McpError* err);
  std::optional<McpPromptResult> GetPrompt(const std::string& server_name,
                                           const std::string& prompt_name,
                                           const nlohmann::json& arguments,
                                           McpError* err);

  std::vector<ServerSummary> ServerInfo() const;
  RegistryStatistics Statistics() const;

  void SetStatusListener(StatusListener listener);
  void SetRetryPolicy(RetryPolicy policy);

  void CloseAll();

 private:
  struct ServerEntry {
    ServerConfig config;
    std::shared_ptr<McpClient> client;
    ConnectionStatus status = ConnectionStatus::kDisconnected;
    std::string reason;
    std::optional<std::chrono::system_clock::time_point> last_connected_at;
    std::shared_ptr<const ServerCapabilities> capabilities;
    // Serializes connect, refresh and disconnect of this server.
    std::mutex op_mu;
  };

  std::shared_ptr<ServerEntry> FindEntry(const std::string& server_name) const;
  std::shared_ptr<McpClient> ConnectedClient(const std::string& server_name, McpError* err) const;
  bool ConnectLocked(const std::shared_ptr<ServerEntry>& entry, std::string* err);
  std::optional<ServerCapabilities> FetchCapabilities(McpClient* client, const std::string& server_name, std::string* err);
  void SetStatus(const std::shared_ptr<ServerEntry>& entry, ConnectionStatus status, const std::string& reason);
  bool SleepUnlessStopping(std::chrono::milliseconds delay);
  double JitterSample();
  void BackgroundLoop();

  TransportFactory factory_;

  mutable std::mutex mu_;
  std::vector<std::shared_ptr<ServerEntry>> servers_;
  StatusListener status_listener_;
  RetryPolicy retry_policy_;

  std::mutex rng_mu_;
  std::mt19937_64 rng_;

  std::mutex bg_mu_;
  std::condition_variable bg_cv_;
  std::condition_variable bg_idle_cv_;
  bool bg_pending_ = false;
  bool bg_running_ = false;
  bool stopping_ = false;
  std::thread bg_thread_;
};

}  // namespace toolagent
