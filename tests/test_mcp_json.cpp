#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"
#include "infrastructure/mcp/McpJson.hpp"

using nlohmann::json;
using sentinel::discovery::domain::DiscoveredServer;
using sentinel::discovery::domain::ProtocolMismatchError;
namespace json_map = sentinel::discovery::infrastructure::mcp::json_map;

TEST(McpJson, FlatIdentityShape)
{
  auto id = json_map::parse_identity(json{{"name", "flat"},
                                          {"version", "1"},
                                          {"description", "d"},
                                          {"capabilities", {{"tools", true}, {"resources", false}}}});
  EXPECT_EQ(id.name, "flat");
  EXPECT_EQ(id.description, "d");
  EXPECT_TRUE(id.capabilities.tools);
  EXPECT_FALSE(id.capabilities.resources);
  EXPECT_FALSE(id.capabilities.prompts);
}

TEST(McpJson, IdentityWithoutNameIsRejected)
{
  EXPECT_THROW(json_map::parse_identity(json{{"version", "1"}}), ProtocolMismatchError);
  EXPECT_THROW(json_map::parse_identity(json::array()), ProtocolMismatchError);
}

TEST(McpJson, MissingCapabilitiesMeansAllFalse)
{
  auto id = json_map::parse_identity(json{{"serverInfo", {{"name", "x"}}}});
  EXPECT_FALSE(id.capabilities.tools);
  EXPECT_FALSE(id.capabilities.resources);
  EXPECT_FALSE(id.capabilities.prompts);
}

TEST(McpJson, ListingsNeedTheirArray)
{
  EXPECT_THROW(json_map::parse_tools(json{{"items", json::array()}}), ProtocolMismatchError);
  EXPECT_THROW(json_map::parse_prompts(json{{"prompts", "nope"}}), ProtocolMismatchError);
  EXPECT_TRUE(json_map::parse_resources(json{{"resources", json::array()}}).empty());
}

TEST(McpJson, PromptArgumentsAreKept)
{
  auto prompts = json_map::parse_prompts(
      json{{"prompts",
            {{{"name", "summarize"},
              {"arguments", {{{"name", "text"}, {"required", true}}, {{"name", "style"}}}}}}}});
  ASSERT_EQ(prompts.size(), 1u);
  ASSERT_EQ(prompts[0].arguments.size(), 2u);
  EXPECT_TRUE(prompts[0].arguments[0].required);
  EXPECT_FALSE(prompts[0].arguments[1].required);
}

TEST(McpJson, ServerRecordSerialization)
{
  DiscoveredServer s;
  s.url = "http://localhost:3000";
  s.name = "srv";
  s.tools.push_back({"t", "", "{\"type\":\"object\"}"});
  s.responseTime = std::chrono::milliseconds(42);
  s.metadata["discovery_method"] = "localhost_scan";

  auto j = json_map::to_json(s);
  EXPECT_EQ(j["url"], "http://localhost:3000");
  EXPECT_EQ(j["response_time_ms"], 42);
  EXPECT_EQ(j["tools"][0]["inputSchema"]["type"], "object");
  EXPECT_EQ(j["metadata"]["discovery_method"], "localhost_scan");
  EXPECT_EQ(j["status"], "online");
  EXPECT_EQ(j["last_seen"].get<std::string>().back(), 'Z');

  EXPECT_TRUE(json_map::to_json(std::vector<DiscoveredServer>{}).is_array());
}
