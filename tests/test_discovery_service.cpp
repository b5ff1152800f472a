#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <stdexcept>
#include <thread>

#include "application/services/DiscoveryService.hpp"
#include "support/TestDoubles.hpp"

using sentinel::discovery::application::services::DiscoveryService;
using sentinel::discovery::domain::NotFoundError;
using sentinel::discovery::domain::ScanConfiguration;
using namespace sentinel::discovery::testing;
using namespace std::chrono_literals;

namespace
{
ScanConfiguration network_only(std::vector<std::string> ranges, std::vector<int> ports)
{
  ScanConfiguration cfg;
  cfg.scanLocalhost = false;
  cfg.networkRanges = std::move(ranges);
  cfg.knownPorts = std::move(ports);
  cfg.timeout = 1s;
  return cfg;
}

DiscoveryService::EnvLookup env_from(std::map<std::string, std::string> vars)
{
  return [vars](const std::string& name) -> std::optional<std::string> {
    auto it = vars.find(name);
    if (it == vars.end()) return std::nullopt;
    return it->second;
  };
}
}  // namespace

TEST(DiscoveryService, DiscoverReturnsAndCachesProtocolServers)
{
  NullLogger log;
  FakeReachability reach;
  reach.reachable_all = true;
  FakeTransport mcp;
  mcp.add("http://10.0.0.1:8080", {identity("one", true, false, false), tools({"t"}), {}, {}});

  DiscoveryService svc{reach, mcp, log};
  auto report = svc.discover(network_only({"10.0.0.0/30"}, {8080}));

  ASSERT_EQ(report.servers.size(), 1u);
  EXPECT_EQ(report.servers[0].url, "http://10.0.0.1:8080");
  EXPECT_EQ(report.servers[0].metadata.at("discovery_method"), "network_scan");
  EXPECT_TRUE(report.rangeErrors.empty());
  EXPECT_EQ(svc.snapshot().size(), 1u);
}

TEST(DiscoveryService, MalformedRangeDoesNotStopOthers)
{
  NullLogger log;
  FakeReachability reach;
  reach.reachable_all = true;
  FakeTransport mcp;
  mcp.add("http://10.0.0.2:9000", {identity("two", false, false, false), {}, {}, {}});

  DiscoveryService svc{reach, mcp, log};
  auto report = svc.discover(network_only({"300.1.1.1/24", "10.0.0.0/30"}, {9000}));

  ASSERT_EQ(report.rangeErrors.size(), 1u);
  EXPECT_EQ(report.rangeErrors[0].range, "300.1.1.1/24");
  ASSERT_EQ(report.servers.size(), 1u);
  EXPECT_EQ(report.servers[0].name, "two");
}

TEST(DiscoveryService, NothingFoundIsNotAnError)
{
  NullLogger log;
  FakeReachability reach;
  FakeTransport mcp;
  DiscoveryService svc{reach, mcp, log};

  auto report = svc.discover(network_only({"10.9.9.0/30"}, {3000}));
  EXPECT_TRUE(report.servers.empty());
  EXPECT_TRUE(report.rangeErrors.empty());
}

TEST(DiscoveryService, RefreshIsIdempotent)
{
  NullLogger log;
  FakeReachability reach;
  reach.reachable_all = true;
  FakeTransport mcp;
  const std::string url = "http://localhost:3002";
  mcp.add(url, {identity("r", false, false, false), {}, {}, {}});

  DiscoveryService svc{reach, mcp, log};
  auto first = svc.refresh(url);
  auto second = svc.refresh(url);

  EXPECT_EQ(first.url, url);
  EXPECT_EQ(second.metadata.at("discovery_method"), "refresh");
  EXPECT_EQ(svc.snapshot().size(), 1u);
  EXPECT_GE(second.lastSeen, first.lastSeen);
}

TEST(DiscoveryService, RefreshOfDeadUrlThrowsNotFoundAndKeepsCache)
{
  NullLogger log;
  FakeReachability reach;
  FakeTransport mcp;
  DiscoveryService svc{reach, mcp, log};

  EXPECT_THROW(svc.refresh("http://localhost:1"), NotFoundError);
  try
  {
    svc.refresh("http://localhost:1");
  }
  catch (const NotFoundError& e)
  {
    EXPECT_EQ(e.url, "http://localhost:1");
  }
  EXPECT_TRUE(svc.snapshot().empty());
}

TEST(DiscoveryService, RefreshMapsUnexpectedFailureToNotFound)
{
  struct BrokenTransport : FakeTransport
  {
    sentinel::discovery::domain::ServerIdentity initialize(const std::string&, Deadline) override
    {
      throw std::logic_error("adapter bug");
    }
  };

  NullLogger log;
  FakeReachability reach;
  reach.reachable_all = true;
  BrokenTransport mcp;
  DiscoveryService svc{reach, mcp, log};

  EXPECT_THROW(svc.refresh("http://localhost:3000"), NotFoundError);
  EXPECT_TRUE(log.saw("adapter bug"));
  EXPECT_TRUE(svc.snapshot().empty());
}

TEST(DiscoveryService, EnvironmentUrlsAreProbedOnce)
{
  NullLogger log;
  FakeReachability reach;
  reach.reachable_all = true;
  FakeTransport mcp;
  mcp.add("http://a:1000", {identity("a", false, false, false), {}, {}, {}});
  mcp.add("http://b:2000", {identity("b", false, false, false), {}, {}, {}});

  DiscoveryService svc{reach, mcp, log};
  auto found = svc.discover_from_environment(env_from({
      {"MCP_SERVER_URL", "http://a:1000"},
      {"MCP_SERVERS", " http://a:1000 , http://b:2000,,not a url, http://c:3000"},
  }));

  EXPECT_EQ(found.size(), 2u);
  EXPECT_EQ(mcp.init_by_url["http://a:1000"], 1);
  EXPECT_EQ(mcp.init_by_url["http://c:3000"], 1);
  EXPECT_EQ(svc.snapshot().size(), 2u);
  for (const auto& s : found) EXPECT_EQ(s.metadata.at("discovery_method"), "environment");
  EXPECT_TRUE(log.saw("not a url"));
}

TEST(DiscoveryService, EnvironmentWithNothingSet)
{
  NullLogger log;
  FakeReachability reach;
  FakeTransport mcp;
  DiscoveryService svc{reach, mcp, log};
  EXPECT_TRUE(svc.discover_from_environment(env_from({})).empty());
}

TEST(DiscoveryService, ScanDeadlineBoundsTheWholeScan)
{
  NullLogger log;
  FakeReachability reach;
  reach.reachable_all = true;
  reach.delay = 100ms;
  FakeTransport mcp;

  DiscoveryService svc{reach, mcp, log};
  auto cfg = network_only({"10.0.0.0/24"}, {3000});
  cfg.maxConcurrent = 2;
  cfg.scanDeadline = 250ms;

  const auto started = std::chrono::steady_clock::now();
  svc.discover(cfg);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
}

TEST(DiscoveryService, CancelStopsAdmittingProbes)
{
  NullLogger log;
  FakeReachability reach;
  reach.delay = 50ms;
  FakeTransport mcp;

  DiscoveryService svc{reach, mcp, log};
  auto cfg = network_only({"10.0.0.0/24"}, {3000});
  cfg.maxConcurrent = 1;

  std::thread canceller([&] {
    std::this_thread::sleep_for(150ms);
    svc.cancel();
  });
  const auto started = std::chrono::steady_clock::now();
  svc.discover(cfg);
  canceller.join();

  // 254 sequential probes at 50ms would take over 12s
  EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
}
