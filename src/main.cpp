#include "agent.hpp"
#include "capability_registry.hpp"
#include "config.hpp"
#include "conversation.hpp"
#include "log_util.hpp"
#include "openai_compatible_http_provider.hpp"
#include "process_pool.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <string>
#include <vector>

namespace {

static std::string Trim(std::string s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::string FormatTime(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

static void PrintTools(const toolagent::Agent& agent) {
  const auto tools = agent.GetAvailableTools();
  std::cout << tools.size() << " tools\n";
  for (const auto& t : tools) {
    std::cout << "  " << t.UniqueId();
    if (!t.tool.description.empty()) std::cout << " - " << toolagent::TruncateForLog(t.tool.description, 100);
    std::cout << "\n";
  }
}

static void PrintServers(const toolagent::CapabilityRegistry& registry) {
  for (const auto& s : registry.ServerInfo()) {
    std::cout << "  " << s.name << " [" << toolagent::TransportKindName(s.transport) << "] "
              << toolagent::ConnectionStatusName(s.status) << " tools=" << s.tool_count
              << " resources=" << s.resource_count << " prompts=" << s.prompt_count;
    if (s.last_connected_at) std::cout << " since=" << FormatTime(*s.last_connected_at);
    if (!s.reason.empty()) std::cout << " reason=" << s.reason;
    std::cout << "\n";
  }
}

static void PrintStats(const toolagent::CapabilityRegistry& registry, toolagent::ProcessPool& pool) {
  const auto st = registry.Statistics();
  std::cout << "servers=" << st.total_servers << " connected=" << st.connected << " connecting=" << st.connecting
            << " disconnected=" << st.disconnected << " error=" << st.errored << " tools=" << st.total_tools
            << " resources=" << st.total_resources << " prompts=" << st.total_prompts << "\n";
  for (const auto& p : pool.Stats()) {
    std::cout << "  pid=" << p.pid << " refs=" << p.reference_count << " command=" << p.command << " servers=";
    for (size_t i = 0; i < p.referencing_servers.size(); i++) {
      if (i) std::cout << ",";
      std::cout << p.referencing_servers[i];
    }
    std::cout << "\n";
  }
}

static void PrintHistory(const toolagent::Agent& agent) {
  for (const auto& m : agent.GetHistory()) {
    std::cout << "[" << m.role;
    if (m.tool_call_id) std::cout << " " << *m.tool_call_id;
    if (m.context_id) std::cout << " #" << *m.context_id;
    std::cout << "] " << toolagent::TruncateForLog(m.content, 400) << "\n";
    for (const auto& c : m.tool_calls) std::cout << "  -> " << c.id << " " << c.name << " " << c.arguments_json << "\n";
  }
}

static void PrintPendingToolCalls(const toolagent::ConversationManager& conversation) {
  for (const auto& c : conversation.LastToolCalls()) {
    std::cout << "tool> " << c.name << " " << toolagent::TruncateForLog(c.arguments_json, 400) << "\n";
  }
}

}  // namespace

int main() {
  std::cout.setf(std::ios::unitbuf);
  auto cfg = toolagent::LoadConfigFromEnv();
  toolagent::SetVerboseLogging(cfg.verbose);

  std::string load_err;
  auto servers = toolagent::LoadMcpServerDirectory(cfg.mcp_servers_dir, &load_err);
  if (!load_err.empty()) std::cout << "[config] error=" << load_err << "\n";
  load_err.clear();
  auto from_file = toolagent::LoadMcpServerConfigs(cfg.mcp_config_path, &load_err);
  if (!load_err.empty()) std::cout << "[config] error=" << load_err << "\n";
  servers = toolagent::MergeServerConfigs(std::move(servers), from_file);

  std::cout << "[runtime] model=" << cfg.model << " endpoint=" << cfg.chat_endpoint.scheme << "://"
            << cfg.chat_endpoint.host << ":" << cfg.chat_endpoint.port << cfg.chat_endpoint.base_path
            << " api_key=" << (cfg.api_key.empty() ? "<empty>" : "***") << "\n";
  std::cout << "[runtime] mcp servers=" << servers.size() << " config=" << cfg.mcp_config_path
            << " dir=" << cfg.mcp_servers_dir << "\n";

  toolagent::ProcessPool pool;
  toolagent::CapabilityRegistry registry(&pool, std::chrono::seconds(cfg.request_timeout_seconds));
  registry.SetStatusListener([](const toolagent::StatusEvent& e) {
    if (e.status == toolagent::ConnectionStatus::kError) {
      std::cout << "! " << e.server_name << " unavailable: " << e.reason << "\n";
    }
  });
  for (const auto& sc : servers) registry.AddServer(sc);
  const size_t connected = registry.ConnectAll();
  std::cout << "[runtime] connected=" << connected << "/" << servers.size() << "\n";

  std::string scheme_err;
  if (!toolagent::CheckEndpointScheme(cfg.chat_endpoint, &scheme_err)) {
    std::cout << "[config] error=" << scheme_err << "\n";
  }
  toolagent::OpenAiCompatibleHttpProvider provider("chat", cfg.chat_endpoint, cfg.api_key);
  toolagent::ConversationOptions options;
  options.model = cfg.model;
  options.temperature = cfg.temperature;
  options.max_tokens = cfg.max_tokens;
  toolagent::Agent agent("cli", &provider, &registry, options);
  auto& conversation = agent.Conversation();
  conversation.SetToolCallListener([](const toolagent::ToolCallEvent& e) {
    std::cout << "tool< " << e.server_name << ":" << e.tool_name << (e.ok ? " ok" : " failed") << " "
              << e.duration.count() << "ms";
    if (!e.error.empty()) std::cout << " " << toolagent::TruncateForLog(e.error, 200);
    std::cout << "\n";
  });

  std::cout << "commands: /tools /servers /stats /history /clear /refresh /quit\n";
  std::string line;
  while (std::cout << "> " && std::getline(std::cin, line)) {
    line = Trim(line);
    if (line.empty()) continue;
    if (line == "/quit" || line == "/exit") break;
    if (line == "/tools") {
      PrintTools(agent);
    } else if (line == "/servers") {
      PrintServers(registry);
    } else if (line == "/stats") {
      PrintStats(registry, pool);
    } else if (line == "/history") {
      PrintHistory(agent);
    } else if (line == "/clear") {
      conversation.ClearConversation();
    } else if (line == "/refresh") {
      registry.RefreshAll();
      PrintServers(registry);
    } else {
      std::string err;
      auto reply = conversation.SendUserMessageAndGetResponse(line, &err, false);
      if (!reply) {
        std::cout << "error: " << err << "\n";
        continue;
      }
      if (conversation.HasUnprocessedToolCalls()) {
        if (!reply->empty()) std::cout << *reply << "\n";
        PrintPendingToolCalls(conversation);
        reply = conversation.ProcessAndContinue(&err);
        if (!reply && !err.empty()) {
          std::cout << "error: " << err << "\n";
          continue;
        }
      }
      if (reply) std::cout << *reply << "\n";
      if (auto reasoning = conversation.LastReasoningContent(); reasoning && cfg.verbose) {
        std::cout << "[reasoning] " << toolagent::TruncateForLog(*reasoning) << "\n";
      }
    }
  }

  registry.CloseAll();
  pool.ShutdownAll();
  std::cout << "[runtime] bye\n";
  return 0;
}
