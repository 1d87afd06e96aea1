#include <gtest/gtest.h>

#include "openai_compatible_http_provider.hpp"

#include <string>

using namespace toolagent;

class ChatProviderTest : public ::testing::Test {
 protected:
  static ChatRequest Request() {
    ChatRequest req;
    req.model = "deepseek-chat";
    req.temperature = 0.5f;
    ChatMessage user;
    user.role = "user";
    user.content = "hi";
    user.context_id = "system";
    ChatMessage assistant;
    assistant.role = "assistant";
    assistant.tool_calls.push_back(ToolCall{"c1", "fs_read", R"({"path":"a"})"});
    ChatMessage tool;
    tool.role = "tool";
    tool.content = "contents";
    tool.tool_call_id = "c1";
    req.messages = {user, assistant, tool};
    return req;
  }
};

TEST_F(ChatProviderTest, BodyCarriesToolsAndToolMessages) {
  auto req = Request();
  req.tools = nlohmann::json::array({{{"type", "function"}, {"function", {{"name", "fs_read"}}}}});
  req.max_tokens = 256;
  auto body = BuildChatCompletionBody(req);

  EXPECT_EQ(body["model"], "deepseek-chat");
  EXPECT_FALSE(body["stream"].get<bool>());
  EXPECT_EQ(body["tool_choice"], "auto");
  EXPECT_EQ(body["tools"].size(), 1u);
  EXPECT_EQ(body["max_tokens"], 256);
  ASSERT_EQ(body["messages"].size(), 3u);
  EXPECT_FALSE(body["messages"][0].contains("context_id"));
  EXPECT_EQ(body["messages"][1]["tool_calls"][0]["function"]["arguments"], R"({"path":"a"})");
  EXPECT_EQ(body["messages"][2]["tool_call_id"], "c1");
}

TEST_F(ChatProviderTest, BodyWithoutToolsOmitsToolChoice) {
  auto body = BuildChatCompletionBody(Request());
  EXPECT_FALSE(body.contains("tools"));
  EXPECT_FALSE(body.contains("tool_choice"));
  EXPECT_FALSE(body.contains("max_tokens"));
}

TEST_F(ChatProviderTest, ParsesToolCallsAndReasoning) {
  auto jr = nlohmann::json::parse(R"({
      "id":"resp-1","model":"deepseek-reasoner",
      "choices":[{"finish_reason":"tool_calls","message":{
        "role":"assistant","content":"","reasoning_content":"need the file",
        "tool_calls":[
          {"id":"c1","type":"function","function":{"name":"fs_read","arguments":"{\"path\":\"a\"}"}},
          {"id":"c2","type":"function","function":{"name":"fs_stat","arguments":{"path":"b"}}},
          {"id":"c3","type":"function","function":{"name":"fs_list"}},
          {"id":"c4","type":"function","function":{}}
        ]}}]})");
  std::string err;
  auto resp = ParseChatCompletionResponse(jr, &err);
  ASSERT_TRUE(resp.has_value()) << err;
  EXPECT_EQ(resp->model, "deepseek-reasoner");
  EXPECT_EQ(resp->finish_reason, "tool_calls");
  EXPECT_EQ(resp->reasoning_content, "need the file");
  ASSERT_EQ(resp->tool_calls.size(), 3u);
  EXPECT_EQ(resp->tool_calls[0].arguments_json, R"({"path":"a"})");
  EXPECT_EQ(resp->tool_calls[1].arguments_json, R"({"path":"b"})");
  EXPECT_EQ(resp->tool_calls[2].arguments_json, "{}");
}

TEST_F(ChatProviderTest, HttpsWithoutTlsFailsWithClearError) {
  if (TlsSupported()) GTEST_SKIP() << "built with TLS support";
  OpenAiCompatibleHttpProvider provider("chat", ParseHttpEndpoint("https://api.deepseek.com", 443), "key");
  std::string err;
  EXPECT_FALSE(provider.ChatOnce(Request(), &err).has_value());
  EXPECT_NE(err.find("needs TLS support"), std::string::npos) << err;
}

TEST_F(ChatProviderTest, RejectsResponseWithoutChoices) {
  std::string err;
  EXPECT_FALSE(ParseChatCompletionResponse(nlohmann::json::parse(R"({"choices":[]})"), &err).has_value());
  EXPECT_EQ(err, "invalid json from /v1/chat/completions");
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
