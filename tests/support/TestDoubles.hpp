#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/ports/IMcpTransport.hpp"
#include "application/ports/IReachabilityProbe.hpp"
#include "domain/Errors.hpp"

namespace sentinel::discovery::testing
{

namespace ports = sentinel::discovery::application::ports;
namespace domain = sentinel::discovery::domain;

// ----------------------------- Logger -----------------------------
struct NullLogger : ports::ILogger
{
  void init(const domain::Settings&) override {}
  void app(ports::LogLevel, const std::string& m) override
  {
    std::lock_guard<std::mutex> lk(mu);
    lines.push_back(m);
  }
  void probe(ports::LogLevel, std::string_view m) override
  {
    std::lock_guard<std::mutex> lk(mu);
    lines.emplace_back(m);
  }

  bool saw(const std::string& needle)
  {
    std::lock_guard<std::mutex> lk(mu);
    return std::any_of(lines.begin(), lines.end(),
                       [&](const std::string& l) { return l.find(needle) != std::string::npos; });
  }

  std::mutex mu;
  std::vector<std::string> lines;
};

// Tracks how many callers are inside a section at once.
struct ConcurrencyGauge
{
  void enter()
  {
    const int now = ++current;
    int prev = peak.load();
    while (now > prev && !peak.compare_exchange_weak(prev, now))
    {
    }
  }
  void leave() { --current; }

  std::atomic<int> current{0};
  std::atomic<int> peak{0};
};

// ----------------------------- Reachability -----------------------------
struct FakeReachability : ports::IReachabilityProbe
{
  bool is_reachable(const std::string& url, std::chrono::steady_clock::time_point) override
  {
    gauge.enter();
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
    gauge.leave();

    std::lock_guard<std::mutex> lk(mu);
    ++calls[url];
    return reachable_all || reachable.count(url) > 0;
  }

  int calls_for(const std::string& url)
  {
    std::lock_guard<std::mutex> lk(mu);
    return calls.count(url) ? calls[url] : 0;
  }

  bool reachable_all{false};
  std::map<std::string, bool> reachable;
  std::chrono::milliseconds delay{0};
  ConcurrencyGauge gauge;

  std::mutex mu;
  std::map<std::string, int> calls;
};

// ----------------------------- Transport -----------------------------
struct FakeTransport : ports::IMcpTransport
{
  struct Server
  {
    domain::ServerIdentity identity;
    std::optional<std::vector<domain::Tool>> tools;  // nullopt = listing fails
    std::optional<std::vector<domain::Resource>> resources;
    std::optional<std::vector<domain::Prompt>> prompts;
  };

  domain::ServerIdentity initialize(const std::string& url, Deadline) override
  {
    ++initialize_calls;
    std::lock_guard<std::mutex> lk(mu);
    ++init_by_url[url];
    auto it = servers.find(url);
    if (it == servers.end()) throw domain::ProtocolMismatchError("not an MCP server");
    return it->second.identity;
  }

  std::vector<domain::Tool> list_tools(const std::string& url, Deadline) override
  {
    ++list_calls;
    auto s = lookup(url);
    if (!s.tools) throw domain::TransportError("tools/list failed");
    return *s.tools;
  }

  std::vector<domain::Resource> list_resources(const std::string& url, Deadline) override
  {
    ++list_calls;
    auto s = lookup(url);
    if (!s.resources) throw domain::ProtocolMismatchError("resources/list malformed");
    return *s.resources;
  }

  std::vector<domain::Prompt> list_prompts(const std::string& url, Deadline) override
  {
    ++list_calls;
    auto s = lookup(url);
    if (!s.prompts) throw domain::TransportError("prompts/list timed out");
    return *s.prompts;
  }

  Server lookup(const std::string& url)
  {
    std::lock_guard<std::mutex> lk(mu);
    return servers.at(url);
  }

  void add(const std::string& url, Server s)
  {
    std::lock_guard<std::mutex> lk(mu);
    servers[url] = std::move(s);
  }

  std::mutex mu;
  std::map<std::string, Server> servers;
  std::map<std::string, int> init_by_url;
  std::atomic<int> initialize_calls{0};
  std::atomic<int> list_calls{0};
};

inline domain::ServerIdentity identity(const std::string& name, bool tools, bool resources,
                                       bool prompts)
{
  domain::ServerIdentity id;
  id.name = name;
  id.version = "1.0.0";
  id.capabilities = {tools, resources, prompts};
  return id;
}

inline std::vector<domain::Tool> tools(std::initializer_list<const char*> names)
{
  std::vector<domain::Tool> out;
  for (auto* n : names) out.push_back(domain::Tool{n, std::string("does ") + n, "{}"});
  return out;
}

}  // namespace sentinel::discovery::testing
