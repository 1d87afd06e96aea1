#include "capability_registry.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>

namespace toolagent {

const char* ConnectionStatusName(ConnectionStatus status) {
  switch (status) {
    case ConnectionStatus::kDisconnected:
      return "disconnected";
    case ConnectionStatus::kConnecting:
      return "connecting";
    case ConnectionStatus::kConnected:
      return "connected";
    case ConnectionStatus::kError:
      return "error";
  }
  return "unknown";
}

std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, int attempt, double jitter_sample) {
  if (attempt < 1) attempt = 1;
  double ms = static_cast<double>(policy.base_delay.count()) * std::pow(policy.factor, attempt - 1);
  ms = std::min(ms, static_cast<double>(policy.max_delay.count()));
  jitter_sample = std::clamp(jitter_sample, -1.0, 1.0);
  ms *= 1.0 + policy.jitter * jitter_sample;
  if (ms < 0) ms = 0;
  return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

CapabilityRegistry::CapabilityRegistry(TransportFactory factory)
    : factory_(std::move(factory)), rng_(std::random_device{}()) {}

CapabilityRegistry::CapabilityRegistry(ProcessPool* pool, std::chrono::milliseconds timeout)
    : CapabilityRegistry([pool, timeout](const ServerConfig& config) { return MakeTransport(config, pool, timeout); }) {}

CapabilityRegistry::~CapabilityRegistry() {
  {
    std::lock_guard<std::mutex> lock(bg_mu_);
    stopping_ = true;
  }
  bg_cv_.notify_all();
  if (bg_thread_.joinable()) bg_thread_.join();
  CloseAll();
}

void CapabilityRegistry::AddServer(const ServerConfig& config) {
  std::lock_guard<std::mutex> lock(mu_);
  for (auto& e : servers_) {
    if (e->config.name != config.name) continue;
    if (e->client) {
      std::cout << "[registry] add ignored server=" << config.name << " reason=connected\n";
      return;
    }
    e->config = config;
    return;
  }
  auto entry = std::make_shared<ServerEntry>();
  entry->config = config;
  servers_.push_back(std::move(entry));
  std::cout << "[registry] add server=" << config.name << " transport=" << TransportKindName(config.transport) << "\n";
}

std::vector<std::string> CapabilityRegistry::ServerNames() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> out;
  out.reserve(servers_.size());
  for (const auto& e : servers_) out.push_back(e->config.name);
  return out;
}

std::shared_ptr<CapabilityRegistry::ServerEntry> CapabilityRegistry::FindEntry(const std::string& server_name) const {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& e : servers_) {
    if (e->config.name == server_name) return e;
  }
  return nullptr;
}

void CapabilityRegistry::SetStatus(const std::shared_ptr<ServerEntry>& entry,
                                   ConnectionStatus status,
                                   const std::string& reason) {
  StatusListener listener;
  bool changed = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    changed = entry->status != status || entry->reason != reason;
    entry->status = status;
    entry->reason = reason;
    if (status == ConnectionStatus::kConnected) entry->last_connected_at = std::chrono::system_clock::now();
    listener = status_listener_;
  }
  if (!changed) return;
  std::cout << "[registry] status server=" << entry->config.name << " status=" << ConnectionStatusName(status);
  if (!reason.empty()) std::cout << " reason=" << reason;
  std::cout << "\n";
  if (listener) listener(StatusEvent{entry->config.name, status, reason});
}

std::optional<ServerCapabilities> CapabilityRegistry::FetchCapabilities(McpClient* client,
                                                                        const std::string& server_name,
                                                                        std::string* err) {
  ServerCapabilities caps;
  McpError e;
  auto tools = client->ListTools(&e);
  if (!tools) {
    if (err) *err = "tools/list: " + e.ToString();
    return std::nullopt;
  }
  caps.tools = std::move(*tools);

  e = McpError{};
  if (auto resources = client->ListResources(&e)) {
    caps.resources = std::move(*resources);
  } else {
    std::cout << "[registry] resources unavailable server=" << server_name << " error=" << e.ToString() << "\n";
  }
  e = McpError{};
  if (auto prompts = client->ListPrompts(&e)) {
    caps.prompts = std::move(*prompts);
  } else {
    std::cout << "[registry] prompts unavailable server=" << server_name << " error=" << e.ToString() << "\n";
  }
  caps.fetched_at = std::chrono::system_clock::now();
  return caps;
}

bool CapabilityRegistry::ConnectLocked(const std::shared_ptr<ServerEntry>& entry, std::string* err) {
  const auto& name = entry->config.name;
  SetStatus(entry, ConnectionStatus::kConnecting, "");

  std::shared_ptr<McpClient> old;
  {
    std::lock_guard<std::mutex> lock(mu_);
    old = std::move(entry->client);
  }
  if (old) old->Close();

  auto transport = factory_ ? factory_(entry->config) : nullptr;
  if (!transport) {
    const std::string reason = "no transport for " + std::string(TransportKindName(entry->config.transport));
    SetStatus(entry, ConnectionStatus::kError, reason);
    if (err) *err = reason;
    return false;
  }
  auto client = std::make_shared<McpClient>(name, std::move(transport));

  McpError init_err;
  if (!client->Initialize(&init_err)) {
    client->Close();
    const std::string reason = "initialize: " + init_err.ToString();
    SetStatus(entry, ConnectionStatus::kError, reason);
    if (err) *err = reason;
    return false;
  }

  std::string fetch_err;
  auto caps = FetchCapabilities(client.get(), name, &fetch_err);
  if (!caps) {
    client->Close();
    SetStatus(entry, ConnectionStatus::kError, fetch_err);
    if (err) *err = fetch_err;
    return false;
  }

  const size_t tool_count = caps->tools.size();
  {
    std::lock_guard<std::mutex> lock(mu_);
    entry->client = std::move(client);
    entry->capabilities = std::make_shared<const ServerCapabilities>(std::move(*caps));
  }
  SetStatus(entry, ConnectionStatus::kConnected, "");
  std::cout << "[registry] connected server=" << name << " tools=" << tool_count << "\n";
  return true;
}

bool CapabilityRegistry::Connect(const std::string& server_name, std::string* err) {
  auto entry = FindEntry(server_name);
  if (!entry) {
    if (err) *err = "unknown server " + server_name;
    return false;
  }
  std::lock_guard<std::mutex> op(entry->op_mu);
  return ConnectLocked(entry, err);
}

size_t CapabilityRegistry::ConnectAll() {
  size_t connected = 0;
  for (const auto& name : ServerNames()) {
    std::string err;
    if (Connect(name, &err)) {
      connected++;
    } else {
      std::cout << "[registry] connect failed server=" << name << " error=" << err << "\n";
    }
  }
  return connected;
}

void CapabilityRegistry::Disconnect(const std::string& server_name) {
  auto entry = FindEntry(server_name);
  if (!entry) return;
  std::lock_guard<std::mutex> op(entry->op_mu);
  std::shared_ptr<McpClient> client;
  bool was_disconnected = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    client = std::move(entry->client);
    entry->capabilities.reset();
    was_disconnected = entry->status == ConnectionStatus::kDisconnected;
  }
  if (client) client->Close();
  if (client || !was_disconnected) SetStatus(entry, ConnectionStatus::kDisconnected, "disconnected");
}

bool CapabilityRegistry::Refresh(const std::string& server_name, std::string* err) {
  auto entry = FindEntry(server_name);
  if (!entry) {
    if (err) *err = "unknown server " + server_name;
    return false;
  }
  RetryPolicy policy;
  {
    std::lock_guard<std::mutex> lock(mu_);
    policy = retry_policy_;
  }

  std::lock_guard<std::mutex> op(entry->op_mu);
  std::string last_err;
  for (int attempt = 1; attempt <= std::max(1, policy.max_attempts); attempt++) {
    std::shared_ptr<McpClient> client;
    {
      std::lock_guard<std::mutex> lock(mu_);
      client = entry->client;
    }

    if (!client || !client->IsOpen()) {
      if (ConnectLocked(entry, &last_err)) return true;
    } else if (auto caps = FetchCapabilities(client.get(), server_name, &last_err)) {
      {
        std::lock_guard<std::mutex> lock(mu_);
        entry->capabilities = std::make_shared<const ServerCapabilities>(std::move(*caps));
      }
      SetStatus(entry, ConnectionStatus::kConnected, "");
      return true;
    }

    std::cout << "[registry] refresh failed server=" << server_name << " attempt=" << attempt
              << " error=" << last_err << "\n";
    if (attempt >= policy.max_attempts) break;
    auto delay = BackoffDelay(policy, attempt, JitterSample());
    if (!SleepUnlessStopping(delay)) break;
  }
  SetStatus(entry, ConnectionStatus::kError, last_err);
  if (err) *err = last_err;
  return false;
}

void CapabilityRegistry::RefreshAll() {
  for (const auto& name : ServerNames()) {
    // Disconnected servers stay down until the owner connects them again.
    if (Status(name) == ConnectionStatus::kDisconnected) continue;
    std::string err;
    Refresh(name, &err);
  }
}

void CapabilityRegistry::RefreshAllInBackground() {
  std::lock_guard<std::mutex> lock(bg_mu_);
  if (stopping_) return;
  bg_pending_ = true;
  if (!bg_thread_.joinable()) bg_thread_ = std::thread([this]() { BackgroundLoop(); });
  bg_cv_.notify_all();
}

void CapabilityRegistry::WaitForBackgroundRefresh() {
  std::unique_lock<std::mutex> lock(bg_mu_);
  bg_idle_cv_.wait(lock, [&]() { return stopping_ || (!bg_pending_ && !bg_running_); });
}

void CapabilityRegistry::BackgroundLoop() {
  std::unique_lock<std::mutex> lock(bg_mu_);
  for (;;) {
    bg_cv_.wait(lock, [&]() { return stopping_ || bg_pending_; });
    if (stopping_) break;
    bg_pending_ = false;
    bg_running_ = true;
    lock.unlock();
    RefreshAll();
    lock.lock();
    bg_running_ = false;
    bg_idle_cv_.notify_all();
  }
  bg_running_ = false;
  bg_idle_cv_.notify_all();
}

bool CapabilityRegistry::SleepUnlessStopping(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(bg_mu_);
  return !bg_cv_.wait_for(lock, delay, [&]() { return stopping_; });
}

double CapabilityRegistry::JitterSample() {
  std::lock_guard<std::mutex> lock(rng_mu_);
  return std::uniform_real_distribution<double>(-1.0, 1.0)(rng_);
}

ConnectionStatus CapabilityRegistry::Status(const std::string& server_name) const {
  auto entry = FindEntry(server_name);
  if (!entry) return ConnectionStatus::kDisconnected;
  std::lock_guard<std::mutex> lock(mu_);
  return entry->status;
}

std::string CapabilityRegistry::StatusReason(const std::string& server_name) const {
  auto entry = FindEntry(server_name);
  if (!entry) return "unknown server";
  std::lock_guard<std::mutex> lock(mu_);
  return entry->reason;
}

std::shared_ptr<const ServerCapabilities> CapabilityRegistry::Capabilities(const std::string& server_name) const {
  auto entry = FindEntry(server_name);
  if (!entry) return nullptr;
  std::lock_guard<std::mutex> lock(mu_);
  return entry->capabilities;
}

std::optional<std::string> CapabilityRegistry::FindServerForTool(const std::string& tool_name) const {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& e : servers_) {
    if (e->status != ConnectionStatus::kConnected || !e->capabilities) continue;
    for (const auto& t : e->capabilities->tools) {
      if (t.name == tool_name) return e->config.name;
    }
  }
  return std::nullopt;
}

std::vector<ToolWithServer> CapabilityRegistry::GetAllTools() const {
  std::vector<std::pair<std::string, std::shared_ptr<const ServerCapabilities>>> snapshots;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& e : servers_) {
      if (e->status == ConnectionStatus::kConnected && e->capabilities) {
        snapshots.emplace_back(e->config.name, e->capabilities);
      }
    }
  }
  std::vector<ToolWithServer> out;
  for (const auto& [name, caps] : snapshots) {
    for (const auto& t : caps->tools) out.push_back(ToolWithServer{name, t});
  }
  return out;
}

std::shared_ptr<McpClient> CapabilityRegistry::ConnectedClient(const std::string& server_name, McpError* err) const {
  auto entry = FindEntry(server_name);
  if (!entry) {
    SetMcpError(err, McpErrorKind::kClosed, "unknown server " + server_name);
    return nullptr;
  }
  std::lock_guard<std::mutex> lock(mu_);
  if (entry->status != ConnectionStatus::kConnected || !entry->client) {
    SetMcpError(err, McpErrorKind::kClosed, "server " + server_name + " is " + ConnectionStatusName(entry->status));
    return nullptr;
  }
  return entry->client;
}

std::optional<McpToolResult> CapabilityRegistry::CallTool(const std::string& server_name,
                                                          const std::string& tool_name,
                                                          const nlohmann::json& arguments,
                                                          McpError* err) {
  auto client = ConnectedClient(server_name, err);
  if (!client) return std::nullopt;
  McpError call_err;
  auto r = client->CallTool(tool_name, arguments, &call_err);
  if (!r) {
    // A dead process takes the server's tools out of the aggregate view.
    if (call_err.kind == McpErrorKind::kClosed) {
      if (auto entry = FindEntry(server_name)) {
        SetStatus(entry, ConnectionStatus::kError, "connection lost: " + call_err.message);
      }
    }
    if (err) *err = call_err;
    return std::nullopt;
  }
  return r;
}

std::optional<std::vector<McpContent>> CapabilityRegistry::ReadResource(const std::string& server_name,
                                                                        const std::string& uri,
                                                                        McpError* err) {
  auto client = ConnectedClient(server_name, err);
  if (!client) return std::nullopt;
  return client->ReadResource(uri, err);
}

std::optional<McpPromptResult> CapabilityRegistry::GetPrompt(const std::string& server_name,
                                                             const std::string& prompt_name,
                                                             const nlohmann::json& arguments,
                                                             McpError* err) {
  auto client = ConnectedClient(server_name, err);
  if (!client) return std::nullopt;
  return client->GetPrompt(prompt_name, arguments, err);
}

std::vector<ServerSummary> CapabilityRegistry::ServerInfo() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<ServerSummary> out;
  for (const auto& e : servers_) {
    ServerSummary s;
    s.name = e->config.name;
    s.transport = e->config.transport;
    s.status = e->status;
    s.reason = e->reason;
    s.last_connected_at = e->last_connected_at;
    if (e->capabilities) {
      s.tool_count = e->capabilities->tools.size();
      s.resource_count = e->capabilities->resources.size();
      s.prompt_count = e->capabilities->prompts.size();
    }
    out.push_back(std::move(s));
  }
  return out;
}

RegistryStatistics CapabilityRegistry::Statistics() const {
  RegistryStatistics st;
  for (const auto& s : ServerInfo()) {
    st.total_servers++;
    switch (s.status) {
      case ConnectionStatus::kConnected:
        st.connected++;
        st.total_tools += s.tool_count;
        st.total_resources += s.resource_count;
        st.total_prompts += s.prompt_count;
        break;
      case ConnectionStatus::kConnecting:
        st.connecting++;
        break;
      case ConnectionStatus::kDisconnected:
        st.disconnected++;
        break;
      case ConnectionStatus::kError:
        st.errored++;
        break;
    }
  }
  return st;
}

void CapabilityRegistry::SetStatusListener(StatusListener listener) {
  std::lock_guard<std::mutex> lock(mu_);
  status_listener_ = std::move(listener);
}

void CapabilityRegistry::SetRetryPolicy(RetryPolicy policy) {
  std::lock_guard<std::mutex> lock(mu_);
  retry_policy_ = policy;
}

void CapabilityRegistry::CloseAll() {
  for (const auto& name : ServerNames()) Disconnect(name);
}

}  // namespace toolagent
