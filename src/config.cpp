#include "config.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace toolagent {
namespace {

std::atomic<bool> g_verbose{false};

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static std::optional<nlohmann::json> ReadJsonFile(const std::filesystem::path& p, std::string* err) {
  std::ifstream in(p, std::ios::binary);
  if (!in) {
    if (err) *err = "cannot open " + p.string();
    return std::nullopt;
  }
  std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = "invalid json in " + p.string();
    return std::nullopt;
  }
  return j;
}

}  // namespace

const char* TransportKindName(TransportKind kind) {
  switch (kind) {
    case TransportKind::kStdio:
      return "stdio";
    case TransportKind::kHttp:
      return "http";
  }
  return "unknown";
}

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
    if (default_port == 80) default_port = 443;
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

bool TlsSupported() {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
  return true;
#else
  return false;
#endif
}

bool CheckEndpointScheme(const HttpEndpoint& ep, std::string* err) {
  if (ep.scheme == "http") return true;
  if (ep.scheme == "https") {
    if (TlsSupported()) return true;
    if (err) *err = "https endpoint " + ep.host + " needs TLS support; rebuild with TOOLAGENT_WITH_OPENSSL=ON";
    return false;
  }
  if (err) *err = "unsupported scheme: " + ep.scheme;
  return false;
}

AgentConfig LoadConfigFromEnv() {
  AgentConfig cfg;
  cfg.chat_endpoint = ParseHttpEndpoint("https://api.deepseek.com", 443);

  if (auto ep = GetEnvStr("TOOLAGENT_CHAT_ENDPOINT"); !ep.empty()) cfg.chat_endpoint = ParseHttpEndpoint(ep, 80);
  if (auto key = GetEnvStr("TOOLAGENT_API_KEY"); !key.empty()) {
    cfg.api_key = key;
  } else if (auto ds = GetEnvStr("DEEPSEEK_API_KEY"); !ds.empty()) {
    cfg.api_key = ds;
  }
  if (auto model = GetEnvStr("TOOLAGENT_MODEL"); !model.empty()) cfg.model = model;
  if (auto t = GetEnvStr("TOOLAGENT_TEMPERATURE"); !t.empty()) cfg.temperature = std::strtof(t.c_str(), nullptr);
  if (auto mt = GetEnvStr("TOOLAGENT_MAX_TOKENS"); !mt.empty()) {
    int v = std::atoi(mt.c_str());
    if (v > 0) cfg.max_tokens = v;
  }

  if (auto p = GetEnvStr("TOOLAGENT_MCP_CONFIG"); !p.empty()) cfg.mcp_config_path = p;
  if (auto d = GetEnvStr("TOOLAGENT_MCP_SERVERS_DIR"); !d.empty()) cfg.mcp_servers_dir = d;
  if (auto to = GetEnvStr("TOOLAGENT_REQUEST_TIMEOUT_SECONDS"); !to.empty()) {
    int v = std::atoi(to.c_str());
    if (v > 0) cfg.request_timeout_seconds = v;
  }
  if (auto verbose = GetEnvStr("TOOLAGENT_VERBOSE"); !verbose.empty()) {
    bool b = false;
    if (TryParseBool(verbose, &b)) cfg.verbose = b;
  }
  return cfg;
}

std::optional<ServerConfig> ParseServerConfig(const std::string& name, const nlohmann::json& j, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = name + ": server entry is not an object";
    return std::nullopt;
  }
  ServerConfig sc;
  sc.name = name;
  std::string type;
  if (j.contains("type") && j["type"].is_string()) type = ToLower(j["type"].get<std::string>());
  if (j.contains("command") && j["command"].is_string()) sc.command = j["command"].get<std::string>();
  if (j.contains("url") && j["url"].is_string()) sc.url = j["url"].get<std::string>();
  if (j.contains("args") && j["args"].is_array()) {
    for (const auto& a : j["args"]) {
      if (a.is_string()) sc.args.push_back(a.get<std::string>());
    }
  }
  if (j.contains("env") && j["env"].is_object()) {
    for (auto it = j["env"].begin(); it != j["env"].end(); ++it) {
      if (it.value().is_string()) sc.env[it.key()] = it.value().get<std::string>();
    }
  }

  if (type == "stdio") {
    sc.transport = TransportKind::kStdio;
  } else if (type == "sse" || type == "http" || type == "streamable-http") {
    sc.transport = TransportKind::kHttp;
  } else if (!type.empty()) {
    if (err) *err = name + ": unsupported transport type " + type;
    return std::nullopt;
  } else if (!sc.url.empty()) {
    sc.transport = TransportKind::kHttp;
  } else {
    sc.transport = TransportKind::kStdio;
  }

  if (sc.transport == TransportKind::kStdio && sc.command.empty()) {
    if (err) *err = name + ": stdio server requires a command";
    return std::nullopt;
  }
  if (sc.transport == TransportKind::kHttp) {
    if (sc.url.empty()) {
      if (err) *err = name + ": http server requires a url";
      return std::nullopt;
    }
    sc.endpoint = ParseHttpEndpoint(sc.url, 80);
  }
  return sc;
}

std::vector<ServerConfig> LoadMcpServerConfigs(const std::string& path, std::string* err) {
  std::vector<ServerConfig> out;
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) return out;

  auto j = ReadJsonFile(path, err);
  if (!j) return out;
  if (!j->contains("mcpServers") || !(*j)["mcpServers"].is_object()) {
    if (err) *err = "missing mcpServers object in " + path;
    return out;
  }
  const auto& servers = (*j)["mcpServers"];
  for (auto it = servers.begin(); it != servers.end(); ++it) {
    std::string entry_err;
    auto sc = ParseServerConfig(it.key(), it.value(), &entry_err);
    if (!sc) {
      std::cout << "[config] skip server=" << it.key() << " error=" << entry_err << "\n";
      continue;
    }
    out.push_back(std::move(*sc));
  }
  return out;
}

std::vector<ServerConfig> LoadMcpServerDirectory(const std::string& dir, std::string* err) {
  std::vector<ServerConfig> out;
  std::error_code ec;
  if (dir.empty() || !std::filesystem::is_directory(dir, ec)) return out;

  std::vector<std::filesystem::path> files;
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".json") files.push_back(entry.path());
  }
  if (ec) {
    if (err) *err = "cannot list " + dir + ": " + ec.message();
    return out;
  }
  std::sort(files.begin(), files.end());

  for (const auto& f : files) {
    std::string file_err;
    auto j = ReadJsonFile(f, &file_err);
    if (!j) {
      std::cout << "[config] skip file=" << f.string() << " error=" << file_err << "\n";
      continue;
    }
    std::string name = f.stem().string();
    if (j->contains("name") && (*j)["name"].is_string() && !(*j)["name"].get<std::string>().empty()) {
      name = (*j)["name"].get<std::string>();
    }
    auto sc = ParseServerConfig(name, *j, &file_err);
    if (!sc) {
      std::cout << "[config] skip file=" << f.string() << " error=" << file_err << "\n";
      continue;
    }
    out.push_back(std::move(*sc));
  }
  return out;
}

std::vector<ServerConfig> MergeServerConfigs(std::vector<ServerConfig> primary, const std::vector<ServerConfig>& secondary) {
  for (const auto& sc : secondary) {
    auto dup = std::find_if(primary.begin(), primary.end(), [&](const ServerConfig& p) { return p.name == sc.name; });
    if (dup != primary.end()) {
      std::cout << "[config] duplicate server=" << sc.name << " kept=first\n";
      continue;
    }
    primary.push_back(sc);
  }
  return primary;
}

bool IsVerboseLogging() {
  return g_verbose.load(std::memory_order_relaxed);
}

void SetVerboseLogging(bool verbose) {
  g_verbose.store(verbose, std::memory_order_relaxed);
}

}  // namespace toolagent
