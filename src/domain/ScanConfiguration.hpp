#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "domain/Settings.hpp"

namespace sentinel::discovery::domain
{

// Inclusive on both ends.
struct PortRange
{
  int start{0};
  int end{0};
};

struct ScanConfiguration
{
  static constexpr int kDefaultMaxConcurrent = 10;
  static constexpr std::chrono::milliseconds kDefaultTimeout{5000};

  std::vector<PortRange> portRanges;
  std::vector<std::string> networkRanges;
  std::vector<int> knownPorts;
  std::chrono::milliseconds timeout{kDefaultTimeout};
  int maxConcurrent{kDefaultMaxConcurrent};

  // Upper bound for a whole discover() call; unset means per-request timeouts only.
  std::optional<std::chrono::milliseconds> scanDeadline;
  bool scanLocalhost{true};

  int effective_max_concurrent() const noexcept
  {
    return maxConcurrent > 0 ? maxConcurrent : kDefaultMaxConcurrent;
  }

  std::chrono::milliseconds effective_timeout() const noexcept
  {
    return timeout.count() > 0 ? timeout : kDefaultTimeout;
  }

  static ScanConfiguration from_settings(const Settings& s)
  {
    ScanConfiguration c;
    for (const auto& [a, b] : s.discovery.portRanges) c.portRanges.push_back(PortRange{a, b});
    c.networkRanges = s.discovery.networkRanges;
    c.knownPorts.assign(s.discovery.knownPorts.begin(), s.discovery.knownPorts.end());
    c.timeout = std::chrono::milliseconds(s.discovery.timeout_ms);
    c.maxConcurrent = s.discovery.maxConcurrent;
    if (s.discovery.scanDeadline_ms > 0)
      c.scanDeadline = std::chrono::milliseconds(s.discovery.scanDeadline_ms);
    c.scanLocalhost = s.discovery.scanLocalhost;
    return c;
  }
};

struct ScanCandidate
{
  std::string address;
  uint16_t port{0};
  std::string method{"localhost_scan"};  // recorded as metadata.discovery_method

  std::string url() const { return "http://" + address + ":" + std::to_string(port); }
};

}  // namespace sentinel::discovery::domain
