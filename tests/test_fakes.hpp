#pragma once

#include "child_process.hpp"
#include "mcp_transport.hpp"
#include "mcp_types.hpp"
#include "providers/provider.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace toolagent::testing {

// Polls `pred` until it holds or `timeout` elapses.
inline bool WaitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

// Scripted MCP server behaviour shared by the stdio and in-memory fakes.
struct FakeServerState {
  std::mutex mu;
  nlohmann::json tools = nlohmann::json::array();
  bool supports_resources = false;
  bool supports_prompts = false;
  // Methods that never get an answer.
  std::set<std::string> silent_methods;
  // Remaining tools/list calls that fail with a transport error.
  int failing_tools_lists = 0;
  bool tools_list_unsupported = false;
  bool fail_initialize = false;
  // tools/call fails as if the process had died.
  bool drop_on_call = false;

  int initialize_calls = 0;
  int tools_list_calls = 0;
  std::vector<std::string> notifications;
  std::vector<std::pair<std::string, nlohmann::json>> tool_calls;

  void AddTool(const std::string& name, const std::string& description = {}) {
    std::lock_guard<std::mutex> lock(mu);
    nlohmann::json t = {{"name", name},
                        {"inputSchema", {{"type", "object"}, {"properties", {{"text", {{"type", "string"}}}}}}}};
    if (!description.empty()) t["description"] = description;
    tools.push_back(std::move(t));
  }
};

inline std::optional<nlohmann::json> HandleMcpRequest(FakeServerState& s,
                                                      const std::string& method,
                                                      const nlohmann::json& params,
                                                      McpError* err) {
  std::lock_guard<std::mutex> lock(s.mu);
  if (method == "initialize") {
    s.initialize_calls++;
    if (s.fail_initialize) {
      SetMcpError(err, McpErrorKind::kRemote, "initialize rejected", -32000);
      return std::nullopt;
    }
    return nlohmann::json{{"protocolVersion", "2024-11-05"},
                          {"capabilities", {{"tools", nlohmann::json::object()}}},
                          {"serverInfo", {{"name", "fake"}, {"version", "1.0"}}}};
  }
  if (method == "tools/list") {
    s.tools_list_calls++;
    if (s.tools_list_unsupported) {
      SetMcpError(err, McpErrorKind::kMethodNotFound, "Method not found", -32601);
      return std::nullopt;
    }
    if (s.failing_tools_lists > 0) {
      s.failing_tools_lists--;
      SetMcpError(err, McpErrorKind::kTransport, "connection reset");
      return std::nullopt;
    }
    return nlohmann::json{{"tools", s.tools}};
  }
  if (method == "resources/list") {
    if (!s.supports_resources) {
      SetMcpError(err, McpErrorKind::kMethodNotFound, "Method not found", -32601);
      return std::nullopt;
    }
    return nlohmann::json{{"resources", {{{"uri", "file:///readme"}, {"name", "readme"}}}}};
  }
  if (method == "prompts/list") {
    if (!s.supports_prompts) {
      SetMcpError(err, McpErrorKind::kMethodNotFound, "Method not found", -32601);
      return std::nullopt;
    }
    return nlohmann::json{{"prompts", {{{"name", "summarize"}}}}};
  }
  if (method == "resources/read") {
    return nlohmann::json{{"contents", {{{"uri", params.value("uri", "")}, {"text", "readme body"}}}}};
  }
  if (method == "prompts/get") {
    return nlohmann::json{{"messages", {{{"role", "user"}, {"content", {{"type", "text"}, {"text", "summarize it"}}}}}}};
  }
  if (method == "tools/call") {
    const auto name = params.value("name", "");
    const auto args = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();
    s.tool_calls.emplace_back(name, args);
    if (s.drop_on_call) {
      SetMcpError(err, McpErrorKind::kClosed, "process exited with code 1");
      return std::nullopt;
    }
    if (name == "fail") {
      return nlohmann::json{{"content", {{{"type", "text"}, {"text", "boom"}}}}, {"isError", true}};
    }
    return nlohmann::json{{"content", {{{"type", "text"}, {"text", name + ":" + args.dump()}}}}};
  }
  SetMcpError(err, McpErrorKind::kMethodNotFound, "Method not found", -32601);
  return std::nullopt;
}

// In-memory transport answering from a FakeServerState.
class FakeTransport : public IMcpTransport {
 public:
  explicit FakeTransport(std::shared_ptr<FakeServerState> state) : state_(std::move(state)) {}

  TransportKind Kind() const override {
    return TransportKind::kStdio;
  }
  bool Open(McpError*) override {
    open_ = true;
    return true;
  }
  std::optional<nlohmann::json> Request(const std::string& method,
                                        const nlohmann::json& params,
                                        McpError* err) override {
    if (!open_) {
      SetMcpError(err, McpErrorKind::kClosed, "transport closed");
      return std::nullopt;
    }
    return HandleMcpRequest(*state_, method, params, err);
  }
  bool Notify(const std::string& method, const nlohmann::json&, McpError*) override {
    std::lock_guard<std::mutex> lock(state_->mu);
    state_->notifications.push_back(method);
    return true;
  }
  void Close() override {
    open_ = false;
  }
  bool IsOpen() const override {
    return open_;
  }

 private:
  std::shared_ptr<FakeServerState> state_;
  bool open_ = false;
};

// Pipe ends of one fake child, shared between the test and the pool.
struct FakeChannel {
  std::mutex mu;
  std::condition_variable cv;
  std::deque<std::string> out;
  std::vector<std::string> written;
  bool exited = false;
  int exit_code = 0;
  int terminate_calls = 0;
  int kill_calls = 0;
  bool ignore_terminate = false;
  // Maps one stdin line to the stdout lines it produces.
  std::function<std::vector<std::string>(const std::string& line)> responder;

  void Emit(const std::string& line) {
    {
      std::lock_guard<std::mutex> lock(mu);
      out.push_back(line);
    }
    cv.notify_all();
  }

  void Exit(int code) {
    {
      std::lock_guard<std::mutex> lock(mu);
      if (exited) return;
      exited = true;
      exit_code = code;
    }
    cv.notify_all();
  }

  int Terminates() {
    std::lock_guard<std::mutex> lock(mu);
    return terminate_calls;
  }

  std::vector<std::string> Written() {
    std::lock_guard<std::mutex> lock(mu);
    return written;
  }
};

class FakeChildProcess : public IChildProcess {
 public:
  FakeChildProcess(int pid, std::shared_ptr<FakeChannel> channel) : pid_(pid), channel_(std::move(channel)) {}

  int Pid() const override {
    return pid_;
  }

  bool WriteStdin(const std::string& data, std::string* err) override {
    std::string line = data;
    if (!line.empty() && line.back() == '\n') line.pop_back();
    std::function<std::vector<std::string>(const std::string&)> responder;
    {
      std::lock_guard<std::mutex> lock(channel_->mu);
      if (channel_->exited) {
        if (err) *err = "stdin closed";
        return false;
      }
      channel_->written.push_back(line);
      responder = channel_->responder;
    }
    if (responder) {
      for (const auto& reply : responder(line)) channel_->Emit(reply);
    }
    return true;
  }

  bool ReadStdoutLine(std::string* line) override {
    std::unique_lock<std::mutex> lock(channel_->mu);
    channel_->cv.wait(lock, [&]() { return !channel_->out.empty() || channel_->exited; });
    if (channel_->out.empty()) return false;
    *line = std::move(channel_->out.front());
    channel_->out.pop_front();
    return true;
  }

  bool ReadStderrLine(std::string*) override {
    std::unique_lock<std::mutex> lock(channel_->mu);
    channel_->cv.wait(lock, [&]() { return channel_->exited; });
    return false;
  }

  void Terminate() override {
    bool exit_now = false;
    {
      std::lock_guard<std::mutex> lock(channel_->mu);
      channel_->terminate_calls++;
      exit_now = !channel_->ignore_terminate;
    }
    if (exit_now) channel_->Exit(143);
  }

  void Kill() override {
    {
      std::lock_guard<std::mutex> lock(channel_->mu);
      channel_->kill_calls++;
    }
    channel_->Exit(137);
  }

  int WaitForExit() override {
    std::unique_lock<std::mutex> lock(channel_->mu);
    channel_->cv.wait(lock, [&]() { return channel_->exited; });
    return channel_->exit_code;
  }

 private:
  int pid_;
  std::shared_ptr<FakeChannel> channel_;
};

// Record of every launch a FakeLauncher performed.
struct LaunchLog {
  std::mutex mu;
  std::vector<std::shared_ptr<FakeChannel>> channels;
  std::vector<ProcessSpec> specs;
  int failures_to_inject = 0;
  std::function<std::vector<std::string>(const std::string& line)> responder;

  size_t Launches() {
    std::lock_guard<std::mutex> lock(mu);
    return channels.size();
  }
  std::shared_ptr<FakeChannel> Channel(size_t i) {
    std::lock_guard<std::mutex> lock(mu);
    return i < channels.size() ? channels[i] : nullptr;
  }
};

class FakeLauncher : public IProcessLauncher {
 public:
  explicit FakeLauncher(std::shared_ptr<LaunchLog> log) : log_(std::move(log)) {}

  std::unique_ptr<IChildProcess> Launch(const ProcessSpec& spec, std::string* err) override {
    std::lock_guard<std::mutex> lock(log_->mu);
    if (log_->failures_to_inject > 0) {
      log_->failures_to_inject--;
      if (err) *err = "exec " + spec.command + " failed: No such file or directory";
      return nullptr;
    }
    auto channel = std::make_shared<FakeChannel>();
    channel->responder = log_->responder;
    log_->channels.push_back(channel);
    log_->specs.push_back(spec);
    return std::make_unique<FakeChildProcess>(1000 + static_cast<int>(log_->channels.size()), channel);
  }

 private:
  std::shared_ptr<LaunchLog> log_;
};

// Newline-delimited JSON-RPC server over a FakeChannel.
inline std::function<std::vector<std::string>(const std::string&)> JsonRpcResponder(
    std::shared_ptr<FakeServerState> state) {
  return [state](const std::string& line) -> std::vector<std::string> {
    auto msg = nlohmann::json::parse(line, nullptr, false);
    if (msg.is_discarded() || !msg.is_object() || !msg.contains("method")) return {};
    const auto method = msg["method"].get<std::string>();
    if (!msg.contains("id")) {
      std::lock_guard<std::mutex> lock(state->mu);
      state->notifications.push_back(method);
      return {};
    }
    {
      std::lock_guard<std::mutex> lock(state->mu);
      if (state->silent_methods.count(method)) return {};
    }
    const auto params = msg.contains("params") ? msg["params"] : nlohmann::json::object();
    McpError err;
    auto result = HandleMcpRequest(*state, method, params, &err);
    nlohmann::json reply = {{"jsonrpc", "2.0"}, {"id", msg["id"]}};
    if (result) {
      reply["result"] = *result;
    } else {
      const int code = err.kind == McpErrorKind::kMethodNotFound ? -32601 : (err.code ? err.code : -32000);
      reply["error"] = {{"code", code}, {"message", err.message}};
    }
    return {reply.dump()};
  };
}

// Replays scripted chat replies and records every request.
class FakeProvider : public IProvider {
 public:
  std::string Name() const override {
    return "fake";
  }

  std::optional<ChatResponse> ChatOnce(const ChatRequest& req, std::string* err) override {
    requests.push_back(req);
    if (!fail_with.empty()) {
      if (err) *err = fail_with;
      return std::nullopt;
    }
    if (!replies.empty()) {
      auto r = replies.front();
      replies.pop_front();
      return r;
    }
    if (repeat) return *repeat;
    if (err) *err = "no scripted reply";
    return std::nullopt;
  }

  static ChatResponse Text(const std::string& content) {
    ChatResponse r;
    r.content = content;
    return r;
  }

  static ChatResponse Calls(std::vector<ToolCall> calls, const std::string& content = {}) {
    ChatResponse r;
    r.content = content;
    r.tool_calls = std::move(calls);
    r.finish_reason = "tool_calls";
    return r;
  }

  std::vector<ChatRequest> requests;
  std::deque<ChatResponse> replies;
  std::optional<ChatResponse> repeat;
  std::string fail_with;
};

}  // namespace toolagent::testing
