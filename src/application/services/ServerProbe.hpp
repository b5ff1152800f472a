#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/ports/IMcpTransport.hpp"
#include "application/ports/IReachabilityProbe.hpp"
#include "application/services/ScanCancellation.hpp"
#include "domain/DiscoveredServer.hpp"
#include "domain/ScanConfiguration.hpp"

namespace sentinel::discovery::application::services
{

// One candidate's pipeline: reachability -> handshake -> capability listing.
// Expected failures (dead host, non-protocol server) yield nullopt, never throw.
class ServerProbe
{
 public:
  static constexpr std::chrono::milliseconds kDefaultReachabilityTimeout{2000};

  ServerProbe(ports::IReachabilityProbe& reach, ports::IMcpTransport& mcp, ports::ILogger& log,
              std::chrono::milliseconds reachabilityTimeout = kDefaultReachabilityTimeout)
      : reach_(reach), mcp_(mcp), log_(log), reachTimeout_(reachabilityTimeout)
  {
  }

  std::optional<domain::DiscoveredServer> probe(const domain::ScanCandidate& c,
                                                std::chrono::milliseconds timeout,
                                                const ScanCancellation& cancel) const;

  std::optional<domain::DiscoveredServer> probe_url(const std::string& url,
                                                    const std::string& method,
                                                    std::chrono::milliseconds timeout,
                                                    const ScanCancellation& cancel) const;

 private:
  using Deadline = std::chrono::steady_clock::time_point;

  std::optional<domain::ServerIdentity> handshake(const std::string& url, Deadline deadline) const;

  // Fills tools/resources/prompts for each advertised category. A failing
  // category is logged and left empty.
  void enumerate_capabilities(domain::DiscoveredServer& s, Deadline deadline) const;

  template <typename T, typename Fn>
  std::vector<T> list_or_empty(std::string_view category, const std::string& url, Fn&& fn) const;

  ports::IReachabilityProbe& reach_;
  ports::IMcpTransport& mcp_;
  ports::ILogger& log_;
  std::chrono::milliseconds reachTimeout_;
};

}  // namespace sentinel::discovery::application::services
