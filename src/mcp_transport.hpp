#pragma once

#include "config.hpp"
#include "mcp_types.hpp"
#include "process_pool.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace toolagent {

constexpr std::chrono::milliseconds kDefaultRequestTimeout{30000};

// One logical JSON-RPC channel to one MCP server.
class IMcpTransport {
 public:
  virtual ~IMcpTransport() = default;

  virtual TransportKind Kind() const = 0;
  virtual bool Open(McpError* err) = 0;
  // Returns the "result" member of the response.
  virtual std::optional<nlohmann::json> Request(const std::string& method,
                                                const nlohmann::json& params,
                                                McpError* err) = 0;
  virtual bool Notify(const std::string& method, const nlohmann::json& params, McpError* err) = 0;
  // Idempotent.
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;
};

// Newline-delimited JSON-RPC over a pooled child process.
class StdioTransport : public IMcpTransport {
 public:
  StdioTransport(ServerConfig config, ProcessPool* pool, std::chrono::milliseconds timeout = kDefaultRequestTimeout);
  ~StdioTransport() override;

  TransportKind Kind() const override {
    return TransportKind::kStdio;
  }
  bool Open(McpError* err) override;
  std::optional<nlohmann::json> Request(const std::string& method,
                                        const nlohmann::json& params,
                                        McpError* err) override;
  bool Notify(const std::string& method, const nlohmann::json& params, McpError* err) override;
  void Close() override;
  bool IsOpen() const override {
    return open_.load();
  }

  size_t PendingCount() const;
  int Pid() const;

 private:
  struct Outcome {
    nlohmann::json response;
    McpError error;
  };

  bool OnLine(const std::string& line);
  void OnExit(int exit_code);
  void FailAllPending(McpErrorKind kind, const std::string& message);
  bool Send(const nlohmann::json& message, McpError* err);

  ServerConfig config_;
  ProcessPool* pool_;
  std::chrono::milliseconds timeout_;

  mutable std::mutex handle_mu_;
  ProcessHandle handle_;
  std::atomic<bool> open_{false};

  mutable std::mutex pending_mu_;
  std::unordered_map<std::string, std::shared_ptr<std::promise<Outcome>>> pending_;
};

// One POST per JSON-RPC message.
class HttpTransport : public IMcpTransport {
 public:
  HttpTransport(ServerConfig config, int request_timeout_seconds = 30);

  TransportKind Kind() const override {
    return TransportKind::kHttp;
  }
  bool Open(McpError* err) override;
  std::optional<nlohmann::json> Request(const std::string& method,
                                        const nlohmann::json& params,
                                        McpError* err) override;
  bool Notify(const std::string& method, const nlohmann::json& params, McpError* err) override;
  void Close() override;
  bool IsOpen() const override {
    return open_.load();
  }

  void SetTimeouts(int connect_seconds, int read_seconds, int write_seconds);
  void SetMaxInFlight(int max_in_flight);
  int InFlight();

 private:
  // Returns the in-flight slot taken by Post on every exit path.
  class InFlightSlot {
   public:
    explicit InFlightSlot(HttpTransport* owner) : owner_(owner) {}
    ~InFlightSlot();
    InFlightSlot(const InFlightSlot&) = delete;
    InFlightSlot& operator=(const InFlightSlot&) = delete;
    void Release();

   private:
    HttpTransport* owner_;
  };

  std::optional<nlohmann::json> Post(const nlohmann::json& message, bool expect_response, McpError* err);

  ServerConfig config_;
  std::atomic<int64_t> next_id_{1};
  int connect_timeout_seconds_ = 5;
  int read_timeout_seconds_ = 30;
  int write_timeout_seconds_ = 30;
  int max_in_flight_ = 4;
  std::atomic<bool> open_{false};

  std::mutex mu_;
  int in_flight_ = 0;
};

std::unique_ptr<IMcpTransport> MakeTransport(const ServerConfig& config,
                                             ProcessPool* pool,
                                             std::chrono::milliseconds timeout = kDefaultRequestTimeout);

}  // namespace toolagent
