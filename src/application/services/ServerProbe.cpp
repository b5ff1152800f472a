#include "application/services/ServerProbe.hpp"

#include <algorithm>
#include <exception>

#include "domain/Errors.hpp"
#include "domain/protocol/McpMethods.hpp"
#include "shared/url/Url.hpp"

using sentinel::discovery::application::ports::LogLevel;
namespace proto = sentinel::discovery::domain::protocol;

namespace sentinel::discovery::application::services
{

std::optional<domain::DiscoveredServer> ServerProbe::probe(const domain::ScanCandidate& c,
                                                          std::chrono::milliseconds timeout,
                                                          const ScanCancellation& cancel) const
{
  return probe_url(c.url(), c.method, timeout, cancel);
}

std::optional<domain::DiscoveredServer> ServerProbe::probe_url(const std::string& url,
                                                              const std::string& method,
                                                              std::chrono::milliseconds timeout,
                                                              const ScanCancellation& cancel) const
{
  if (cancel.stop_requested())
  {
    log_.probe(LogLevel::debug, "[probe] " + url + " skipped: scan cancelled or past deadline");
    return std::nullopt;
  }

  const Deadline probe_deadline = cancel.clamp(timeout);

  // ---- 1. reachability (short sub-timeout) ----
  const Deadline reach_deadline =
      std::min(probe_deadline, std::chrono::steady_clock::now() + reachTimeout_);
  if (!reach_.is_reachable(url, reach_deadline))
  {
    log_.probe(LogLevel::debug, "[reachability] " + url + " unreachable");
    return std::nullopt;
  }

  // ---- 2. handshake (response time excludes reachability) ----
  const auto started = std::chrono::steady_clock::now();
  auto identity = handshake(url, probe_deadline);
  if (!identity) return std::nullopt;
  const auto elapsed = std::chrono::steady_clock::now() - started;

  domain::DiscoveredServer s;
  s.url = url;
  s.name = identity->name;
  s.version = identity->version;
  s.description = identity->description;
  s.capabilities = identity->capabilities;
  s.status = "online";
  s.lastSeen = std::chrono::system_clock::now();
  s.responseTime = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
  s.metadata["discovery_method"] = method;
  if (!identity->protocolVersion.empty()) s.metadata["protocol_version"] = identity->protocolVersion;
  if (auto parsed = shared::url::try_parse(url))
  {
    s.metadata["address"] = parsed->host;
    s.metadata["port"] = std::to_string(parsed->port);
  }

  // ---- 3. capabilities ----
  enumerate_capabilities(s, probe_deadline);

  log_.probe(LogLevel::info, "Discovered protocol server " + url + " name=" + s.name +
                                 " version=" + s.version +
                                 " tools=" + std::to_string(s.tools.size()) +
                                 " resources=" + std::to_string(s.resources.size()) +
                                 " prompts=" + std::to_string(s.prompts.size()) +
                                 " response_time=" + std::to_string(s.responseTime.count()) + "ms");
  return s;
}

std::optional<domain::ServerIdentity> ServerProbe::handshake(const std::string& url,
                                                            Deadline deadline) const
{
  try
  {
    return mcp_.initialize(url, deadline);
  }
  catch (const domain::ProtocolMismatchError& e)
  {
    log_.probe(LogLevel::debug, "[handshake] " + url + " not a protocol server: " + e.what());
  }
  catch (const domain::TransportError& e)
  {
    log_.probe(LogLevel::debug, "[handshake] " + url + " transport failure: " + e.what());
  }
  return std::nullopt;
}

template <typename T, typename Fn>
std::vector<T> ServerProbe::list_or_empty(std::string_view category, const std::string& url,
                                          Fn&& fn) const
{
  try
  {
    return fn();
  }
  catch (const std::exception& e)
  {
    const domain::CapabilityEnumerationError err{std::string(category), e.what()};
    log_.probe(LogLevel::warn, "[capabilities] " + url + " listing failed, " + err.what());
    return {};
  }
}

void ServerProbe::enumerate_capabilities(domain::DiscoveredServer& s, Deadline deadline) const
{
  const auto& url = s.url;

  if (s.capabilities.tools)
    s.tools = list_or_empty<domain::Tool>(proto::category::tools, url,
                                          [&] { return mcp_.list_tools(url, deadline); });

  if (s.capabilities.resources)
    s.resources = list_or_empty<domain::Resource>(
        proto::category::resources, url, [&] { return mcp_.list_resources(url, deadline); });

  if (s.capabilities.prompts)
    s.prompts = list_or_empty<domain::Prompt>(proto::category::prompts, url,
                                              [&] { return mcp_.list_prompts(url, deadline); });
}

}  // namespace sentinel::discovery::application::services
