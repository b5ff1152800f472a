#include <gtest/gtest.h>

#include <chrono>

#include "application/services/ScanCancellation.hpp"
#include "application/services/ServerProbe.hpp"
#include "support/TestDoubles.hpp"

using sentinel::discovery::application::services::ScanCancellation;
using sentinel::discovery::application::services::ServerProbe;
using sentinel::discovery::domain::Prompt;
using sentinel::discovery::domain::Resource;
using sentinel::discovery::domain::ScanCandidate;
using namespace sentinel::discovery::testing;
using namespace std::chrono_literals;

namespace
{
struct ServerProbeTest : ::testing::Test
{
  NullLogger log;
  FakeReachability reach;
  FakeTransport mcp;
  ServerProbe probe{reach, mcp, log};
  ScanCancellation no_deadline;

  const ScanCandidate candidate{"localhost", 3000, "localhost_scan"};
  const std::string url = "http://localhost:3000";
};
}  // namespace

TEST_F(ServerProbeTest, UnreachableSkipsHandshake)
{
  mcp.add(url, {identity("srv", true, false, false), tools({"a"}), {}, {}});

  EXPECT_FALSE(probe.probe(candidate, 1s, no_deadline).has_value());
  EXPECT_EQ(reach.calls_for(url), 1);
  EXPECT_EQ(mcp.initialize_calls.load(), 0);
}

TEST_F(ServerProbeTest, NonProtocolServerYieldsNothing)
{
  reach.reachable[url] = true;

  EXPECT_FALSE(probe.probe(candidate, 1s, no_deadline).has_value());
  EXPECT_EQ(mcp.initialize_calls.load(), 1);
  EXPECT_EQ(mcp.list_calls.load(), 0);
}

TEST_F(ServerProbeTest, BuildsRecordFromHandshakeAndListings)
{
  reach.reachable[url] = true;
  auto id = identity("srv", true, true, true);
  id.protocolVersion = "2024-11-05";
  mcp.add(url, {id, tools({"search", "fetch"}),
                std::vector<Resource>{{"file:///a", "a", "", "text/plain"}},
                std::vector<Prompt>{{"greet", "", {}}}});

  auto s = probe.probe(candidate, 1s, no_deadline);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->url, url);
  EXPECT_EQ(s->name, "srv");
  EXPECT_EQ(s->status, "online");
  EXPECT_EQ(s->tools.size(), 2u);
  EXPECT_EQ(s->resources.size(), 1u);
  EXPECT_EQ(s->prompts.size(), 1u);
  EXPECT_GE(s->responseTime.count(), 0);
  EXPECT_NE(s->lastSeen.time_since_epoch().count(), 0);
  EXPECT_EQ(s->metadata.at("discovery_method"), "localhost_scan");
  EXPECT_EQ(s->metadata.at("address"), "localhost");
  EXPECT_EQ(s->metadata.at("port"), "3000");
  EXPECT_EQ(s->metadata.at("protocol_version"), "2024-11-05");
}

TEST_F(ServerProbeTest, UnadvertisedCategoriesAreNotListed)
{
  reach.reachable[url] = true;
  mcp.add(url, {identity("bare", false, false, false), tools({"x"}), {}, {}});

  auto s = probe.probe(candidate, 1s, no_deadline);
  ASSERT_TRUE(s.has_value());
  EXPECT_FALSE(s->capabilities.tools);
  EXPECT_FALSE(s->capabilities.resources);
  EXPECT_FALSE(s->capabilities.prompts);
  EXPECT_TRUE(s->tools.empty());
  EXPECT_EQ(mcp.list_calls.load(), 0);
}

TEST_F(ServerProbeTest, FailingCategoryLeavesOthersIntact)
{
  reach.reachable[url] = true;
  // resources and prompts listings fail
  mcp.add(url, {identity("partial", true, true, true), tools({"a", "b", "c"}), std::nullopt,
                std::nullopt});

  auto s = probe.probe(candidate, 1s, no_deadline);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->tools.size(), 3u);
  EXPECT_TRUE(s->resources.empty());
  EXPECT_TRUE(s->prompts.empty());
  EXPECT_TRUE(s->capabilities.resources);
  EXPECT_TRUE(log.saw("resources/list malformed"));
  EXPECT_TRUE(log.saw("prompts/list timed out"));
}

TEST_F(ServerProbeTest, FailingToolsListingKeepsResources)
{
  reach.reachable[url] = true;
  // tools listing fails, resources succeed
  mcp.add(url, {identity("mirror", true, true, false), std::nullopt,
                std::vector<Resource>{{"file:///a", "a", "", "text/plain"},
                                      {"file:///b", "b", "", "text/plain"}},
                std::nullopt});

  auto s = probe.probe(candidate, 1s, no_deadline);
  ASSERT_TRUE(s.has_value());
  EXPECT_TRUE(s->tools.empty());
  EXPECT_TRUE(s->capabilities.tools);
  ASSERT_EQ(s->resources.size(), 2u);
  EXPECT_EQ(s->resources[0].uri, "file:///a");
  EXPECT_TRUE(s->prompts.empty());
  EXPECT_TRUE(log.saw("tools/list failed"));
}

TEST_F(ServerProbeTest, CancelledScanSkipsEverything)
{
  reach.reachable_all = true;
  ScanCancellation cancelled;
  cancelled.cancel();

  EXPECT_FALSE(probe.probe(candidate, 1s, cancelled).has_value());
  EXPECT_EQ(reach.calls_for(url), 0);
}

TEST_F(ServerProbeTest, ProbeUrlRecordsMethod)
{
  reach.reachable_all = true;
  mcp.add("http://10.0.0.7:8080", {identity("remote", false, false, false), {}, {}, {}});

  auto s = probe.probe_url("http://10.0.0.7:8080", "environment", 1s, no_deadline);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->metadata.at("discovery_method"), "environment");
  EXPECT_EQ(s->metadata.at("address"), "10.0.0.7");
  EXPECT_EQ(s->metadata.at("port"), "8080");
}
