#include <gtest/gtest.h>

#include "mcp_types.hpp"

#include <string>

using namespace toolagent;

class McpTypesTest : public ::testing::Test {};

TEST_F(McpTypesTest, JsonRpcErrorClassification) {
  auto by_code = McpErrorFromJsonRpc({{"code", -32601}, {"message", "nope"}});
  EXPECT_EQ(by_code.kind, McpErrorKind::kMethodNotFound);
  EXPECT_EQ(by_code.code, -32601);

  auto by_message = McpErrorFromJsonRpc({{"code", -32000}, {"message", "Method not found: prompts/list"}});
  EXPECT_EQ(by_message.kind, McpErrorKind::kMethodNotFound);

  auto remote = McpErrorFromJsonRpc({{"code", -32602}, {"message", "invalid params"}});
  EXPECT_EQ(remote.kind, McpErrorKind::kRemote);
  EXPECT_EQ(remote.ToString(), "remote -32602: invalid params");

  EXPECT_EQ(McpErrorFromJsonRpc("oops").message, "json-rpc error");
}

TEST_F(McpTypesTest, ToolFromJson) {
  auto tool = McpToolFromJson(nlohmann::json::parse(
      R"({"name":"read","description":"Read","inputSchema":{"type":"object"},"annotations":{"readOnlyHint":true}})"));
  ASSERT_TRUE(tool.has_value());
  EXPECT_EQ(tool->name, "read");
  EXPECT_EQ(tool->input_schema["type"], "object");
  EXPECT_TRUE(tool->annotations["readOnlyHint"].get<bool>());

  EXPECT_FALSE(McpToolFromJson(nlohmann::json::parse(R"({"description":"nameless"})")).has_value());
}

TEST_F(McpTypesTest, ToolResultJoinsContent) {
  auto r = McpToolResultFromJson(nlohmann::json::parse(R"({
      "content":[
        {"type":"text","text":"line one"},
        {"type":"image","data":"AAAA","mimeType":"image/png"},
        {"type":"resource","resource":{"uri":"file:///a.txt","text":"inline"}},
        {"type":"resource","resource":{"uri":"file:///b.bin"}}
      ]})"));
  EXPECT_FALSE(r.is_error);
  EXPECT_EQ(r.JoinedText(), "line one\n[image image/png]\ninline\n[resource file:///b.bin]");

  auto failed = McpToolResultFromJson(nlohmann::json::parse(R"({"content":[],"isError":true})"));
  EXPECT_TRUE(failed.is_error);
  EXPECT_EQ(failed.JoinedText(), "");
}

TEST_F(McpTypesTest, ResourceAndPromptPayloads) {
  auto contents = McpResourceContentsFromJson(nlohmann::json::parse(
      R"({"contents":[{"uri":"file:///a","text":"hello"},{"uri":"file:///b","blob":"AA=="}]})"));
  ASSERT_EQ(contents.size(), 2u);
  EXPECT_EQ(contents[0].type, "text");
  EXPECT_EQ(contents[1].type, "blob");

  auto prompt = McpPromptFromJson(nlohmann::json::parse(
      R"({"name":"review","arguments":[{"name":"file","required":true},{"description":"no name"}]})"));
  ASSERT_TRUE(prompt.has_value());
  ASSERT_EQ(prompt->arguments.size(), 1u);
  EXPECT_TRUE(prompt->arguments[0].required);

  auto result = McpPromptResultFromJson(nlohmann::json::parse(
      R"({"description":"d","messages":[{"role":"user","content":{"type":"text","text":"hi"}}]})"));
  ASSERT_EQ(result.messages.size(), 1u);
  EXPECT_EQ(result.messages[0].role, "user");
  EXPECT_EQ(result.messages[0].content.text, "hi");
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
