#include "openai_compatible_http_provider.hpp"

#include "log_util.hpp"

#include <httplib.h>

#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace toolagent {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep, int read_timeout_seconds) {
  auto cli = std::make_unique<httplib::Client>(ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port));
  cli->set_connection_timeout(5);
  cli->set_read_timeout(read_timeout_seconds);
  cli->set_write_timeout(30);
  return cli;
}

static std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

static std::string GetString(const nlohmann::json& j, const char* key) {
  if (j.is_object() && j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
  return {};
}

static nlohmann::json MessageToJson(const ChatMessage& m) {
  nlohmann::json j;
  j["role"] = m.role;
  j["content"] = m.content;
  if (!m.name.empty()) j["name"] = m.name;
  if (!m.tool_calls.empty()) {
    j["tool_calls"] = nlohmann::json::array();
    for (const auto& c : m.tool_calls) {
      j["tool_calls"].push_back(
          {{"id", c.id}, {"type", "function"}, {"function", {{"name", c.name}, {"arguments", c.arguments_json}}}});
    }
  }
  if (m.tool_call_id) j["tool_call_id"] = *m.tool_call_id;
  return j;
}

}  // namespace

nlohmann::json BuildChatCompletionBody(const ChatRequest& req) {
  nlohmann::json j;
  j["model"] = req.model;
  j["stream"] = false;
  j["messages"] = nlohmann::json::array();
  for (const auto& m : req.messages) j["messages"].push_back(MessageToJson(m));
  if (req.tools.is_array() && !req.tools.empty()) {
    j["tools"] = req.tools;
    j["tool_choice"] = req.tool_choice.empty() ? "auto" : req.tool_choice;
  }
  if (req.temperature.has_value()) j["temperature"] = req.temperature.value();
  if (req.max_tokens.has_value() && req.max_tokens.value() > 0) j["max_tokens"] = req.max_tokens.value();
  return j;
}

std::optional<ChatResponse> ParseChatCompletionResponse(const nlohmann::json& jr, std::string* err) {
  if (!jr.is_object() || !jr.contains("choices") || !jr["choices"].is_array() || jr["choices"].empty() ||
      !jr["choices"][0].is_object() || !jr["choices"][0].contains("message") ||
      !jr["choices"][0]["message"].is_object()) {
    if (err) *err = "invalid json from /v1/chat/completions";
    return std::nullopt;
  }
  const auto& choice = jr["choices"][0];
  const auto& msg = choice["message"];

  ChatResponse out;
  out.id = GetString(jr, "id");
  out.model = GetString(jr, "model");
  out.content = GetString(msg, "content");
  out.name = GetString(msg, "name");
  out.reasoning_content = GetString(msg, "reasoning_content");
  if (auto fr = GetString(choice, "finish_reason"); !fr.empty()) out.finish_reason = fr;

  if (msg.contains("tool_calls") && msg["tool_calls"].is_array()) {
    for (const auto& item : msg["tool_calls"]) {
      if (!item.is_object() || !item.contains("function") || !item["function"].is_object()) continue;
      const auto& fn = item["function"];
      ToolCall c;
      c.id = GetString(item, "id");
      c.name = GetString(fn, "name");
      if (fn.contains("arguments")) {
        const auto& a = fn["arguments"];
        if (a.is_string()) {
          c.arguments_json = a.get<std::string>();
        } else if (!a.is_null()) {
          c.arguments_json = a.dump();
        }
      }
      if (c.arguments_json.empty()) c.arguments_json = "{}";
      if (!c.name.empty()) out.tool_calls.push_back(std::move(c));
    }
  }
  return out;
}

OpenAiCompatibleHttpProvider::OpenAiCompatibleHttpProvider(std::string name, HttpEndpoint endpoint, std::string api_key)
    : name_(std::move(name)), endpoint_(std::move(endpoint)), api_key_(std::move(api_key)) {}

std::string OpenAiCompatibleHttpProvider::Name() const {
  return name_;
}

void OpenAiCompatibleHttpProvider::SetReadTimeout(int seconds) {
  if (seconds > 0) read_timeout_seconds_ = seconds;
}

std::optional<ChatResponse> OpenAiCompatibleHttpProvider::ChatOnce(const ChatRequest& req, std::string* err) {
  std::string scheme_err;
  if (!CheckEndpointScheme(endpoint_, &scheme_err)) {
    if (err) *err = name_ + ": " + scheme_err;
    return std::nullopt;
  }
  auto cli = MakeClient(endpoint_, read_timeout_seconds_);
  httplib::Headers headers;
  if (!api_key_.empty()) headers.emplace("Authorization", "Bearer " + api_key_);

  const auto body = BuildChatCompletionBody(req);
  if (IsVerboseLogging()) std::cout << "[chat] >> " << TruncateForLog(SanitizeJsonForLog(body)) << "\n";
  auto res = cli->Post(JoinPath(endpoint_.base_path, "/v1/chat/completions"), headers, body.dump(), "application/json");
  if (!res) {
    if (err) *err = name_ + ": failed to connect: " + httplib::to_string(res.error());
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = name_ + ": /v1/chat/completions http " + std::to_string(res->status) + " " + TruncateForLog(res->body, 500);
    return std::nullopt;
  }
  if (IsVerboseLogging()) std::cout << "[chat] << " << TruncateForLog(res->body) << "\n";
  auto jr = nlohmann::json::parse(res->body, nullptr, false);
  if (jr.is_discarded()) {
    if (err) *err = name_ + ": invalid json from /v1/chat/completions";
    return std::nullopt;
  }
  auto out = ParseChatCompletionResponse(jr, err);
  if (out && out->model.empty()) out->model = req.model;
  if (!out && err) *err = name_ + ": " + *err;
  return out;
}

}  // namespace toolagent
