#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sentinel::discovery::domain
{

struct Settings
{
  struct Discovery
  {
    std::vector<uint16_t> knownPorts{};
    std::vector<std::pair<int, int>> portRanges{};
    std::vector<std::string> networkRanges{};
    int timeout_ms{5000};
    int maxConcurrent{10};
    int workerThreads{16};
    int reachabilityTimeout_ms{2000};
    int refreshTimeout_ms{10000};
    int scanDeadline_ms{0};  // 0 = no scan-wide deadline
    bool scanLocalhost{true};
  } discovery;

  struct Periodic
  {
    bool enabled{false};
    int interval_minutes{30};
  } periodic;

  // Console / Logs
  bool showConsole{false};
  bool saveLog{true};
  bool saveProbeLog{true};
  std::string logsDir{"logs"};
  std::string appLogFilename{"discovery_app.log"};
  std::string probeLogFilename{"discovery_probe.log"};
  std::string configPath{"sentinel-discovery.toml"};
};

}  // namespace sentinel::discovery::domain
