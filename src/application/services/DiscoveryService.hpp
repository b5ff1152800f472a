#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/ports/IMcpTransport.hpp"
#include "application/ports/IReachabilityProbe.hpp"
#include "application/services/DiscoveryCache.hpp"
#include "application/services/ProbeCoordinator.hpp"
#include "application/services/ScanCancellation.hpp"
#include "application/services/ServerProbe.hpp"
#include "application/services/TargetEnumerator.hpp"
#include "domain/DiscoveredServer.hpp"
#include "domain/Errors.hpp"
#include "domain/ScanConfiguration.hpp"
#include "domain/Settings.hpp"

namespace sentinel::discovery::application::services
{

struct DiscoveryReport
{
  std::vector<domain::DiscoveredServer> servers;
  std::vector<domain::ConfigurationError> rangeErrors;
};

struct DiscoveryServiceOptions
{
  int workerThreads{16};
  std::chrono::milliseconds reachabilityTimeout{ServerProbe::kDefaultReachabilityTimeout};
  std::chrono::milliseconds refreshTimeout{10000};
  std::chrono::milliseconds environmentTimeout{domain::ScanConfiguration::kDefaultTimeout};

  static DiscoveryServiceOptions from_settings(const domain::Settings& s)
  {
    DiscoveryServiceOptions o;
    o.workerThreads = s.discovery.workerThreads;
    o.reachabilityTimeout = std::chrono::milliseconds(s.discovery.reachabilityTimeout_ms);
    o.refreshTimeout = std::chrono::milliseconds(s.discovery.refreshTimeout_ms);
    o.environmentTimeout = std::chrono::milliseconds(s.discovery.timeout_ms);
    return o;
  }
};

class DiscoveryService
{
 public:
  using Options = DiscoveryServiceOptions;

  // Returns the variable's value, or nullopt when unset.
  using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

  static constexpr const char* kEnvVars[] = {"MCP_SERVER_URL", "MODEL_CONTEXT_PROTOCOL_URL",
                                             "MCP_SERVERS"};

  DiscoveryService(ports::IReachabilityProbe& reach, ports::IMcpTransport& mcp,
                   ports::ILogger& log, Options opts = {});

  // Bulk scan of localhost and every network range. Never fails wholesale:
  // individual candidates drop silently, malformed ranges come back in rangeErrors.
  DiscoveryReport discover(const domain::ScanConfiguration& cfg);

  // Re-probes one URL and upserts it. Throws domain::NotFoundError.
  domain::DiscoveredServer refresh(const std::string& url);

  std::vector<domain::DiscoveredServer> snapshot() const { return cache_.snapshot(); }

  // Probes the URLs named in MCP_SERVER_URL, MODEL_CONTEXT_PROTOCOL_URL and
  // the comma-separated MCP_SERVERS.
  std::vector<domain::DiscoveredServer> discover_from_environment(EnvLookup env = {});

  // Stops admitting new probes in every in-flight discover().
  void cancel();

 private:
  std::shared_ptr<ScanCancellation> register_scan(std::optional<std::chrono::milliseconds> budget);
  void unregister_scan(const std::shared_ptr<ScanCancellation>& c);

  ports::ILogger& log_;
  Options opts_;
  TargetEnumerator enumerator_;
  ServerProbe probe_;
  ProbeCoordinator coordinator_;
  DiscoveryCache cache_;

  std::mutex active_mu_;
  std::vector<std::shared_ptr<ScanCancellation>> active_;
};

}  // namespace sentinel::discovery::application::services
