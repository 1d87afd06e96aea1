#include "conversation.hpp"

#include "log_util.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <set>
#include <string>
#include <utility>

namespace toolagent {
namespace {

static std::string ToUpper(std::string s) {
  for (auto& c : s) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
  }
  return s;
}

static std::string JoinIds(const std::vector<std::string>& ids) {
  std::string out;
  for (size_t i = 0; i < ids.size(); i++) {
    if (i) out += ", ";
    out += ids[i];
  }
  return out;
}

static int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

std::string FormatContextBlock(const std::string& context_id, const std::string& content) {
  return "```" + ToUpper(context_id) + "\n" + content + "\n```\n";
}

ConversationManager::ConversationManager(std::string id,
                                         IProvider* provider,
                                         CapabilityRegistry* registry,
                                         ConversationOptions options)
    : id_(std::move(id)), provider_(provider), registry_(registry), options_(std::move(options)) {}

void ConversationManager::InsertMessage(size_t index, ChatMessage message) {
  if (index > messages_.size()) index = messages_.size();
  messages_.insert(messages_.begin() + static_cast<std::ptrdiff_t>(index), std::move(message));
  std::map<size_t, std::string> shifted;
  for (auto& [i, text] : reasoning_) shifted[i >= index ? i + 1 : i] = std::move(text);
  reasoning_ = std::move(shifted);
}

void ConversationManager::EraseMessage(size_t index) {
  if (index >= messages_.size()) return;
  messages_.erase(messages_.begin() + static_cast<std::ptrdiff_t>(index));
  std::map<size_t, std::string> shifted;
  for (auto& [i, text] : reasoning_) {
    if (i == index) continue;
    shifted[i > index ? i - 1 : i] = std::move(text);
  }
  reasoning_ = std::move(shifted);
}

void ConversationManager::AddUserMessage(const std::string& content) {
  ChatMessage m;
  m.role = "user";
  m.content = content;
  messages_.push_back(std::move(m));
}

void ConversationManager::AddSystemMessage(const std::string& content) {
  ChatMessage m;
  m.role = "user";
  m.content = content;
  m.context_id = "system";
  messages_.push_back(std::move(m));
}

void ConversationManager::AddAssistantMessage(const std::string& content,
                                              const std::string& reasoning_content,
                                              std::vector<ToolCall> tool_calls) {
  ChatMessage m;
  m.role = "assistant";
  m.content = content;
  m.tool_calls = std::move(tool_calls);
  messages_.push_back(std::move(m));
  if (!reasoning_content.empty()) reasoning_[messages_.size() - 1] = reasoning_content;
}

void ConversationManager::AddSystemContext(const std::string& context_id, const std::string& content) {
  const auto block = FormatContextBlock(context_id, content);
  for (auto& m : messages_) {
    if (m.context_id && *m.context_id == context_id) {
      m.content = block;
      return;
    }
  }
  ChatMessage m;
  m.role = "user";
  m.content = block;
  m.context_id = context_id;
  auto it = std::find_if(messages_.begin(), messages_.end(), [](const ChatMessage& x) { return !x.context_id; });
  InsertMessage(static_cast<size_t>(it - messages_.begin()), std::move(m));
}

bool ConversationManager::RemoveContext(const std::string& context_id) {
  bool removed = false;
  for (size_t i = messages_.size(); i-- > 0;) {
    if (messages_[i].context_id && *messages_[i].context_id == context_id) {
      EraseMessage(i);
      removed = true;
    }
  }
  return removed;
}

bool ConversationManager::ValidateOrdering(std::string* err) const {
  for (size_t i = 0; i < messages_.size(); i++) {
    const auto& m = messages_[i];
    if (m.role != "assistant" || m.tool_calls.empty()) continue;

    std::vector<std::string> ids;
    for (const auto& c : m.tool_calls) ids.push_back(c.id);

    std::vector<std::string> block;
    for (size_t j = i + 1; j < messages_.size() && messages_[j].role == "tool" && block.size() < ids.size(); j++) {
      block.push_back(messages_[j].tool_call_id.value_or(""));
    }

    const std::set<std::string> answered(block.begin(), block.end());
    std::string missing;
    for (size_t k = 0; k < ids.size(); k++) {
      if (answered.count(ids[k])) continue;
      // Answered further down, past some other message?
      const size_t expected_at = i + 1 + block.size();
      for (size_t j = expected_at; j < messages_.size(); j++) {
        if (messages_[j].role == "tool" && messages_[j].tool_call_id == ids[k]) {
          if (err) {
            *err = "Tool responses must immediately follow their tool calls. Found " +
                   std::to_string(j - expected_at) + " messages in between.";
          }
          return false;
        }
      }
      if (!missing.empty()) missing += ", ";
      const auto& name = m.tool_calls[k].name;
      missing += ids[k] + " (" + (name.empty() ? "unknown" : name) + ")";
    }
    if (!missing.empty()) {
      if (err) {
        *err = "Missing tool responses for tool calls: " + missing +
               ". Each tool call must have a corresponding tool response.";
      }
      return false;
    }
    if (block != ids) {
      if (err) {
        *err = "Tool responses must be in the same order as tool calls. Expected order: " + JoinIds(ids) +
               ". Actual order: " + JoinIds(block);
      }
      return false;
    }
  }
  return true;
}

std::optional<std::string> ConversationManager::SendMessage(std::string* err) {
  if (registry_ && options_.refresh_tools_before_send) registry_->RefreshAllInBackground();

  if (messages_.empty()) {
    if (err) *err = "Cannot send an empty conversation. Add at least one message first.";
    return std::nullopt;
  }
  if (!ValidateOrdering(err)) {
    std::cout << "[conversation] id=" << id_ << " validation failed\n";
    return std::nullopt;
  }
  if (!provider_) {
    if (err) *err = "no chat provider";
    return std::nullopt;
  }

  ChatRequest req;
  req.model = options_.model;
  req.temperature = options_.temperature;
  req.max_tokens = options_.max_tokens;
  req.messages = messages_;
  if (registry_) req.tools = ToolsToFunctions(registry_->GetAllTools());
  if (!req.tools.empty()) req.tool_choice = "auto";

  std::cout << "[conversation] id=" << id_ << " send messages=" << req.messages.size()
            << " tools=" << req.tools.size() << " model=" << req.model << "\n";
  std::string provider_err;
  auto resp = provider_->ChatOnce(req, &provider_err);
  if (!resp) {
    std::cout << "[conversation] id=" << id_ << " chat failed error=" << provider_err << "\n";
    if (err) *err = provider_err;
    return std::nullopt;
  }

  ChatMessage m;
  m.role = "assistant";
  m.content = resp->content;
  m.name = resp->name;
  m.tool_calls = resp->tool_calls;
  for (auto& c : m.tool_calls) {
    if (c.id.empty()) c.id = GenerateToolCallId();
  }
  messages_.push_back(std::move(m));
  if (!resp->reasoning_content.empty()) reasoning_[messages_.size() - 1] = resp->reasoning_content;

  if (!resp->tool_calls.empty()) {
    std::cout << "[conversation] id=" << id_ << " tool_calls=" << resp->tool_calls.size() << " pending\n";
  }
  return resp->content;
}

void ConversationManager::AddToolMessage(const std::string& tool_call_id, const std::string& content) {
  ChatMessage m;
  m.role = "tool";
  m.content = content;
  m.tool_call_id = tool_call_id;
  messages_.push_back(std::move(m));
}

std::string ConversationManager::ExecuteToolCall(const ToolCall& call,
                                                 const std::vector<ToolWithServer>& known,
                                                 ToolCallEvent* event) {
  auto args = nlohmann::json::parse(call.arguments_json.empty() ? "{}" : call.arguments_json, nullptr, false);
  if (args.is_discarded() || !args.is_object()) {
    event->error = "invalid arguments";
    return "Error: Failed to parse arguments: " + std::string(args.is_discarded() ? "invalid JSON" : "not a JSON object");
  }

  std::optional<ResolvedTool> resolved = ResolveApiName(call.name, known);
  if (!resolved && registry_) {
    if (auto server = registry_->FindServerForTool(call.name)) resolved = ResolvedTool{*server, call.name};
  }
  if (resolved && registry_) {
    auto names = registry_->ServerNames();
    if (std::find(names.begin(), names.end(), resolved->server_name) == names.end()) resolved.reset();
  }
  if (!resolved || !registry_) {
    event->error = "server not found";
    return "Error: Server not found for tool \"" + call.name + "\".";
  }

  tracker_.Register(call.id, call.name, resolved->server_name, args);
  // The registered context is authoritative over the generic decode.
  if (auto ctx = tracker_.Get(call.id)) {
    const auto prefix = resolved->server_name + ":";
    if (ctx->tool_name.compare(0, prefix.size(), prefix) == 0) resolved->tool_name = ctx->tool_name.substr(prefix.size());
  }
  event->server_name = resolved->server_name;
  event->tool_name = resolved->tool_name;

  std::cout << "[mcp-call] id=" << call.id << " server=" << resolved->server_name << " tool=" << resolved->tool_name
            << " arguments=" << TruncateForLog(args.dump()) << "\n";
  McpError e;
  auto result = registry_->CallTool(resolved->server_name, resolved->tool_name, args, &e);
  tracker_.Complete(call.id);

  if (!result) {
    event->error = e.ToString();
    std::cout << "[mcp-result] id=" << call.id << " ok=0 error=" << event->error << "\n";
    return "Error: Tool \"" + call.name + "\" failed: " + e.ToString();
  }
  auto text = result->JoinedText();
  if (result->is_error) {
    event->error = text;
    std::cout << "[mcp-result] id=" << call.id << " ok=0 error=" << TruncateForLog(text) << "\n";
    return "Error: Tool \"" + call.name + "\" failed: " + text;
  }
  event->ok = true;
  std::cout << "[mcp-result] id=" << call.id << " ok=1 chars=" << text.size() << "\n";
  return text;
}

bool ConversationManager::ProcessToolCalls() {
  const auto calls = LastToolCalls();
  if (calls.empty()) return false;
  tracker_.CleanupOlderThan();

  const auto known = registry_ ? registry_->GetAllTools() : std::vector<ToolWithServer>{};
  for (const auto& call : calls) {
    ToolCallEvent event;
    event.tool_call_id = call.id;
    event.tool_name = call.name;
    const auto start = std::chrono::steady_clock::now();
    auto content = ExecuteToolCall(call, known, &event);
    event.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    AddToolMessage(call.id, content);
    if (tool_call_listener_) tool_call_listener_(event);
  }
  return true;
}

std::optional<std::string> ConversationManager::ProcessAndContinue(std::string* err) {
  if (!HasUnprocessedToolCalls()) return std::nullopt;

  std::optional<std::string> final_response;
  int round = 0;
  while (HasUnprocessedToolCalls() && round < options_.max_tool_rounds) {
    round++;
    std::cout << "[conversation] id=" << id_ << " tool round=" << round << " calls=" << LastToolCalls().size() << "\n";
    if (!ProcessToolCalls()) break;
    auto r = SendMessage(err);
    if (!r) return std::nullopt;
    final_response = std::move(r);
  }

  if (HasUnprocessedToolCalls()) {
    std::cout << "[conversation] id=" << id_ << " tool round limit reached rounds=" << round << "\n";
    AddToolMessage("system_error_" + std::to_string(NowMillis()),
                      "Error: Too many tool call rounds. Maximum of " + std::to_string(options_.max_tool_rounds) +
                          " rounds exceeded.");
  }
  return final_response;
}

std::optional<std::string> ConversationManager::SendUserMessageAndGetResponse(const std::string& text,
                                                                              std::string* err,
                                                                              bool process_tool_calls_immediately) {
  AddUserMessage(text);
  auto response = SendMessage(err);
  if (!response) return std::nullopt;
  if (process_tool_calls_immediately && HasUnprocessedToolCalls()) {
    std::string loop_err;
    auto follow_up = ProcessAndContinue(&loop_err);
    if (!follow_up && !loop_err.empty()) {
      if (err) *err = loop_err;
      return std::nullopt;
    }
    if (follow_up) return follow_up;
  }
  return response;
}

ConversationState ConversationManager::State() const {
  return HasUnprocessedToolCalls() ? ConversationState::kAwaitingToolResults : ConversationState::kIdle;
}

bool ConversationManager::HasUnprocessedToolCalls() const {
  return !messages_.empty() && messages_.back().role == "assistant" && !messages_.back().tool_calls.empty();
}

std::vector<ToolCall> ConversationManager::LastToolCalls() const {
  if (messages_.empty() || messages_.back().role != "assistant") return {};
  return messages_.back().tool_calls;
}

std::vector<ChatMessage> ConversationManager::GetHistory() const {
  return messages_;
}

std::optional<std::string> ConversationManager::GetReasoningContent(size_t message_index) const {
  auto it = reasoning_.find(message_index);
  if (it == reasoning_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> ConversationManager::LastReasoningContent() const {
  for (size_t i = messages_.size(); i-- > 0;) {
    if (messages_[i].role == "assistant") return GetReasoningContent(i);
  }
  return std::nullopt;
}

void ConversationManager::ClearConversation() {
  messages_.clear();
  reasoning_.clear();
  std::cout << "[conversation] id=" << id_ << " cleared\n";
}

nlohmann::json ConversationManager::ToJson() const {
  nlohmann::json j;
  j["id"] = id_;
  j["model"] = options_.model;
  j["messages"] = nlohmann::json::array();
  for (size_t i = 0; i < messages_.size(); i++) {
    const auto& m = messages_[i];
    nlohmann::json mj;
    mj["role"] = m.role;
    mj["content"] = m.content;
    if (!m.name.empty()) mj["name"] = m.name;
    if (!m.tool_calls.empty()) {
      mj["tool_calls"] = nlohmann::json::array();
      for (const auto& c : m.tool_calls) {
        mj["tool_calls"].push_back(
            {{"id", c.id}, {"type", "function"}, {"function", {{"name", c.name}, {"arguments", c.arguments_json}}}});
      }
    }
    if (m.tool_call_id) mj["tool_call_id"] = *m.tool_call_id;
    if (m.context_id) mj["context_id"] = *m.context_id;
    if (auto it = reasoning_.find(i); it != reasoning_.end()) mj["reasoning_content"] = it->second;
    j["messages"].push_back(std::move(mj));
  }
  return j;
}

void ConversationManager::SetToolCallListener(ToolCallListener listener) {
  tool_call_listener_ = std::move(listener);
}

}  // namespace toolagent
