#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "domain/Errors.hpp"
#include "domain/ScanConfiguration.hpp"

namespace sentinel::discovery::application::services
{

struct EnumerationResult
{
  std::vector<domain::ScanCandidate> candidates;
  std::vector<domain::ConfigurationError> rangeErrors;
};

// Expands a ScanConfiguration into concrete address:port candidates.
class TargetEnumerator
{
 public:
  static constexpr std::size_t kMaxAddressesPerRange = 254;
  static constexpr const char* kLocalhost = "localhost";
  static constexpr int kMinPort = 1;
  static constexpr int kMaxPort = 65535;

  explicit TargetEnumerator(ports::ILogger& log) : log_(log) {}

  // Ports probed on localhost on every scan, before knownPorts and portRanges.
  static const std::vector<uint16_t>& common_ports();

  // Never throws: a malformed range lands in rangeErrors and the rest still expands.
  EnumerationResult enumerate(const domain::ScanConfiguration& cfg) const;

  // Host addresses of an IPv4 CIDR block without the network and broadcast
  // addresses, at most kMaxAddressesPerRange. Throws domain::ConfigurationError.
  static std::vector<std::string> hosts_in_range(const std::string& cidr);

  // Intersection of `r` with [kMinPort, kMaxPort]; empty when they do not overlap.
  static std::optional<domain::PortRange> clamp_range(const domain::PortRange& r);

  static bool is_broadcast(const std::array<uint8_t, 4>& ip, const std::array<uint8_t, 4>& mask);

 private:
  ports::ILogger& log_;
};

}  // namespace sentinel::discovery::application::services
