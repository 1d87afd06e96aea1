#include "mcp_transport.hpp"

#include "log_util.hpp"

#include <httplib.h>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace toolagent {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep,
                                                   int connect_timeout_seconds,
                                                   int read_timeout_seconds,
                                                   int write_timeout_seconds) {
  auto cli = std::make_unique<httplib::Client>(ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port));
  cli->set_connection_timeout(connect_timeout_seconds);
  cli->set_read_timeout(read_timeout_seconds);
  cli->set_write_timeout(write_timeout_seconds);
  return cli;
}

static std::optional<std::string> ResponseId(const nlohmann::json& msg) {
  if (!msg.contains("id")) return std::nullopt;
  const auto& id = msg["id"];
  if (id.is_string()) return id.get<std::string>();
  if (id.is_number_integer()) return std::to_string(id.get<int64_t>());
  return std::nullopt;
}

static nlohmann::json MakeRequest(const nlohmann::json& id, const std::string& method, const nlohmann::json& params) {
  nlohmann::json req;
  req["jsonrpc"] = "2.0";
  req["id"] = id;
  req["method"] = method;
  req["params"] = params.is_null() ? nlohmann::json::object() : params;
  return req;
}

// Splits a JSON-RPC response envelope into result or error.
static std::optional<nlohmann::json> ExtractResult(const nlohmann::json& resp, McpError* err) {
  if (!resp.is_object()) {
    SetMcpError(err, McpErrorKind::kProtocol, "invalid json-rpc response");
    return std::nullopt;
  }
  if (resp.contains("error") && !resp["error"].is_null()) {
    if (err) *err = McpErrorFromJsonRpc(resp["error"]);
    return std::nullopt;
  }
  if (!resp.contains("result")) {
    SetMcpError(err, McpErrorKind::kProtocol, "missing result");
    return std::nullopt;
  }
  return resp["result"];
}

}  // namespace

StdioTransport::StdioTransport(ServerConfig config, ProcessPool* pool, std::chrono::milliseconds timeout)
    : config_(std::move(config)), pool_(pool), timeout_(timeout) {}

StdioTransport::~StdioTransport() {
  Close();
}

bool StdioTransport::Open(McpError* err) {
  if (open_.load()) return true;
  if (!pool_) {
    SetMcpError(err, McpErrorKind::kTransport, "no process pool");
    return false;
  }
  ProcessSpec spec{config_.command, config_.args, config_.env};
  std::string spawn_err;
  auto handle = pool_->Acquire(config_.name, spec, &spawn_err);
  if (!handle) {
    SetMcpError(err, McpErrorKind::kTransport, "spawn failed: " + spawn_err);
    return false;
  }
  std::lock_guard<std::mutex> lock(handle_mu_);
  handle_ = std::move(*handle);
  if (!handle_.SetListeners([this](const std::string& line) { return OnLine(line); },
                            [this](int code) { OnExit(code); })) {
    handle_.Dispose();
    SetMcpError(err, McpErrorKind::kTransport, "process exited during startup");
    return false;
  }
  open_.store(true);
  std::cout << "[mcp] open server=" << config_.name << " transport=stdio pid=" << handle_.Pid() << "\n";
  return true;
}

bool StdioTransport::Send(const nlohmann::json& message, McpError* err) {
  std::lock_guard<std::mutex> lock(handle_mu_);
  std::string write_err;
  if (!handle_.WriteLine(message.dump(), &write_err)) {
    SetMcpError(err, McpErrorKind::kTransport, write_err);
    return false;
  }
  return true;
}

std::optional<nlohmann::json> StdioTransport::Request(const std::string& method,
                                                      const nlohmann::json& params,
                                                      McpError* err) {
  if (!open_.load()) {
    SetMcpError(err, McpErrorKind::kClosed, "transport closed");
    return std::nullopt;
  }
  std::optional<std::string> id;
  {
    std::lock_guard<std::mutex> lock(handle_mu_);
    id = handle_.NextRequestId();
  }
  if (!id) {
    SetMcpError(err, McpErrorKind::kClosed, "process exited");
    return std::nullopt;
  }

  auto promise = std::make_shared<std::promise<Outcome>>();
  auto future = promise->get_future();
  {
    std::lock_guard<std::mutex> lock(pending_mu_);
    pending_.emplace(*id, promise);
  }
  auto evict = [&]() {
    std::lock_guard<std::mutex> lock(pending_mu_);
    pending_.erase(*id);
  };

  if (!Send(MakeRequest(std::stoll(*id), method, params), err)) {
    evict();
    return std::nullopt;
  }

  if (future.wait_for(timeout_) != std::future_status::ready) {
    evict();
    std::cout << "[mcp] timeout server=" << config_.name << " method=" << method << " id=" << *id << "\n";
    SetMcpError(err, McpErrorKind::kTimeout,
                method + " timed out after " + std::to_string(timeout_.count()) + "ms");
    return std::nullopt;
  }

  auto outcome = future.get();
  if (outcome.error.kind != McpErrorKind::kNone) {
    if (err) *err = outcome.error;
    return std::nullopt;
  }
  return ExtractResult(outcome.response, err);
}

bool StdioTransport::Notify(const std::string& method, const nlohmann::json& params, McpError* err) {
  if (!open_.load()) {
    SetMcpError(err, McpErrorKind::kClosed, "transport closed");
    return false;
  }
  nlohmann::json msg;
  msg["jsonrpc"] = "2.0";
  msg["method"] = method;
  if (!params.is_null()) msg["params"] = params;
  return Send(msg, err);
}

bool StdioTransport::OnLine(const std::string& line) {
  auto msg = nlohmann::json::parse(line, nullptr, false);
  if (msg.is_discarded() || !msg.is_object()) return false;

  if (msg.contains("method")) {
    // Server-initiated notification or request; nothing here consumes them.
    if (IsVerboseLogging()) {
      std::cout << "[mcp] server message server=" << config_.name << " method=" << msg["method"].dump() << "\n";
    }
    return !msg.contains("id");
  }

  auto id = ResponseId(msg);
  if (!id) return false;
  std::shared_ptr<std::promise<Outcome>> promise;
  {
    std::lock_guard<std::mutex> lock(pending_mu_);
    auto it = pending_.find(*id);
    if (it == pending_.end()) return false;
    promise = std::move(it->second);
    pending_.erase(it);
  }
  promise->set_value(Outcome{std::move(msg), McpError{}});
  return true;
}

void StdioTransport::OnExit(int exit_code) {
  open_.store(false);
  std::cout << "[mcp] process exited server=" << config_.name << " code=" << exit_code << "\n";
  FailAllPending(McpErrorKind::kClosed, "process exited with code " + std::to_string(exit_code));
}

void StdioTransport::FailAllPending(McpErrorKind kind, const std::string& message) {
  std::unordered_map<std::string, std::shared_ptr<std::promise<Outcome>>> pending;
  {
    std::lock_guard<std::mutex> lock(pending_mu_);
    pending.swap(pending_);
  }
  for (auto& [_, p] : pending) {
    McpError e;
    e.kind = kind;
    e.message = message;
    p->set_value(Outcome{nlohmann::json(), std::move(e)});
  }
}

void StdioTransport::Close() {
  const bool was_open = open_.exchange(false);
  {
    std::lock_guard<std::mutex> lock(handle_mu_);
    if (handle_.Valid()) handle_.Dispose();
  }
  FailAllPending(McpErrorKind::kClosed, "transport closed");
  if (was_open) std::cout << "[mcp] close server=" << config_.name << "\n";
}

size_t StdioTransport::PendingCount() const {
  std::lock_guard<std::mutex> lock(pending_mu_);
  return pending_.size();
}

int StdioTransport::Pid() const {
  std::lock_guard<std::mutex> lock(handle_mu_);
  return handle_.Pid();
}

HttpTransport::HttpTransport(ServerConfig config, int request_timeout_seconds) : config_(std::move(config)) {
  if (request_timeout_seconds > 0) read_timeout_seconds_ = request_timeout_seconds;
}

void HttpTransport::SetTimeouts(int connect_seconds, int read_seconds, int write_seconds) {
  if (connect_seconds > 0) connect_timeout_seconds_ = connect_seconds;
  if (read_seconds > 0) read_timeout_seconds_ = read_seconds;
  if (write_seconds > 0) write_timeout_seconds_ = write_seconds;
}

void HttpTransport::SetMaxInFlight(int max_in_flight) {
  if (max_in_flight > 0) max_in_flight_ = max_in_flight;
}

bool HttpTransport::Open(McpError* err) {
  if (config_.endpoint.host.empty()) {
    SetMcpError(err, McpErrorKind::kTransport, "missing host in " + config_.url);
    return false;
  }
  std::string scheme_err;
  if (!CheckEndpointScheme(config_.endpoint, &scheme_err)) {
    SetMcpError(err, McpErrorKind::kTransport, scheme_err);
    return false;
  }
  if (!open_.exchange(true)) {
    std::cout << "[mcp] open server=" << config_.name << " transport=http url=" << config_.url << "\n";
  }
  return true;
}

void HttpTransport::Close() {
  if (open_.exchange(false)) std::cout << "[mcp] close server=" << config_.name << "\n";
}

std::optional<nlohmann::json> HttpTransport::Request(const std::string& method,
                                                     const nlohmann::json& params,
                                                     McpError* err) {
  if (!open_.load()) {
    SetMcpError(err, McpErrorKind::kClosed, "transport closed");
    return std::nullopt;
  }
  auto resp = Post(MakeRequest(next_id_.fetch_add(1), method, params), true, err);
  if (!resp) return std::nullopt;
  return ExtractResult(*resp, err);
}

bool HttpTransport::Notify(const std::string& method, const nlohmann::json& params, McpError* err) {
  if (!open_.load()) {
    SetMcpError(err, McpErrorKind::kClosed, "transport closed");
    return false;
  }
  nlohmann::json msg;
  msg["jsonrpc"] = "2.0";
  msg["method"] = method;
  if (!params.is_null()) msg["params"] = params;
  return Post(msg, false, err).has_value();
}

std::optional<nlohmann::json> HttpTransport::Post(const nlohmann::json& message, bool expect_response, McpError* err) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (in_flight_ >= max_in_flight_) {
      SetMcpError(err, McpErrorKind::kTransport, "too many in-flight requests");
      return std::nullopt;
    }
    in_flight_++;
  }
  InFlightSlot slot(this);

  auto cli = MakeClient(config_.endpoint, connect_timeout_seconds_, read_timeout_seconds_, write_timeout_seconds_);
  httplib::Headers headers = {{"Accept", "application/json, text/event-stream"}};
  const std::string path = config_.endpoint.base_path.empty() ? "/" : config_.endpoint.base_path;
  const std::string body = message.dump();
  if (IsVerboseLogging()) std::cout << "[http] >> " << config_.name << " " << TruncateForLog(body) << "\n";
  auto res = cli->Post(path, headers, body, "application/json");
  slot.Release();
  if (!res) {
    SetMcpError(err, McpErrorKind::kTransport, "failed to connect: " + httplib::to_string(res.error()));
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    SetMcpError(err, McpErrorKind::kTransport, "http " + std::to_string(res->status), res->status);
    return std::nullopt;
  }
  if (!expect_response) return nlohmann::json::object();

  if (IsVerboseLogging()) std::cout << "[http] << " << config_.name << " " << TruncateForLog(res->body) << "\n";
  auto resp = nlohmann::json::parse(res->body, nullptr, false);
  if (resp.is_discarded()) {
    SetMcpError(err, McpErrorKind::kProtocol, "invalid json response");
    return std::nullopt;
  }
  return resp;
}

HttpTransport::InFlightSlot::~InFlightSlot() {
  Release();
}

void HttpTransport::InFlightSlot::Release() {
  if (!owner_) return;
  std::lock_guard<std::mutex> lock(owner_->mu_);
  owner_->in_flight_--;
  owner_ = nullptr;
}

int HttpTransport::InFlight() {
  std::lock_guard<std::mutex> lock(mu_);
  return in_flight_;
}

std::unique_ptr<IMcpTransport> MakeTransport(const ServerConfig& config,
                                             ProcessPool* pool,
                                             std::chrono::milliseconds timeout) {
  if (config.transport == TransportKind::kHttp) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
    return std::make_unique<HttpTransport>(config, static_cast<int>(seconds));
  }
  return std::make_unique<StdioTransport>(config, pool, timeout);
}

}  // namespace toolagent
