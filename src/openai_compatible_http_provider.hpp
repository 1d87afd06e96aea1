#pragma once

#include "config.hpp"
#include "providers/provider.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace toolagent {

class OpenAiCompatibleHttpProvider : public IProvider {
 public:
  OpenAiCompatibleHttpProvider(std::string name, HttpEndpoint endpoint, std::string api_key);

  std::string Name() const override;
  std::optional<ChatResponse> ChatOnce(const ChatRequest& req, std::string* err) override;

  void SetReadTimeout(int seconds);

 private:
  std::string name_;
  HttpEndpoint endpoint_;
  std::string api_key_;
  int read_timeout_seconds_ = 300;
};

nlohmann::json BuildChatCompletionBody(const ChatRequest& req);
std::optional<ChatResponse> ParseChatCompletionResponse(const nlohmann::json& body, std::string* err);

}  // namespace toolagent
