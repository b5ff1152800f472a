#include "application/services/TargetEnumerator.hpp"

#include <algorithm>
#include <boost/asio/ip/network_v4.hpp>
#include <iterator>
#include <set>

using sentinel::discovery::application::ports::LogLevel;

namespace sentinel::discovery::application::services
{

namespace
{
constexpr uint16_t kCommonPorts[] = {3000, 3001, 3002, 8000, 8001, 8080, 9000};

bool valid_port(int p)
{
  return p >= TargetEnumerator::kMinPort && p <= TargetEnumerator::kMaxPort;
}

// Appends unless the URL was already emitted; the first occurrence keeps its method.
void push_unique(std::vector<domain::ScanCandidate>& out, std::set<std::string>& seen,
                 domain::ScanCandidate c)
{
  if (seen.insert(c.url()).second) out.push_back(std::move(c));
}
}  // namespace

std::optional<domain::PortRange> TargetEnumerator::clamp_range(const domain::PortRange& r)
{
  const int lo = std::max(r.start, kMinPort);
  const int hi = std::min(r.end, kMaxPort);
  if (lo > hi) return std::nullopt;
  return domain::PortRange{lo, hi};
}

const std::vector<uint16_t>& TargetEnumerator::common_ports()
{
  static const std::vector<uint16_t> ports(std::begin(kCommonPorts), std::end(kCommonPorts));
  return ports;
}

bool TargetEnumerator::is_broadcast(const std::array<uint8_t, 4>& ip,
                                    const std::array<uint8_t, 4>& mask)
{
  for (std::size_t i = 0; i < ip.size(); ++i)
  {
    const auto bcast = static_cast<uint8_t>(ip[i] | static_cast<uint8_t>(~mask[i]));
    if (ip[i] != bcast) return false;
  }
  return true;
}

std::vector<std::string> TargetEnumerator::hosts_in_range(const std::string& cidr)
{
  boost::system::error_code ec;
  const auto net = boost::asio::ip::make_network_v4(cidr, ec);
  if (ec) throw domain::ConfigurationError(cidr, ec.message());

  const auto network = net.network();
  const auto mask = net.netmask().to_bytes();
  const uint32_t first = network.to_uint();
  const uint64_t span = uint64_t{1} << (32 - net.prefix_length());

  std::vector<std::string> hosts;
  for (uint64_t i = 0; i < span && hosts.size() < kMaxAddressesPerRange; ++i)
  {
    const boost::asio::ip::address_v4 ip(static_cast<uint32_t>(first + i));
    if (ip == network) continue;
    if (is_broadcast(ip.to_bytes(), mask)) continue;
    hosts.push_back(ip.to_string());
  }
  return hosts;
}

EnumerationResult TargetEnumerator::enumerate(const domain::ScanConfiguration& cfg) const
{
  EnumerationResult r;
  std::set<std::string> seen;

  // ---------------------------
  // localhost: common + known + ranges
  // ---------------------------
  if (cfg.scanLocalhost)
  {
    std::vector<int> ports(common_ports().begin(), common_ports().end());
    ports.insert(ports.end(), cfg.knownPorts.begin(), cfg.knownPorts.end());

    for (const auto& pr : cfg.portRanges)
    {
      const std::string label = std::to_string(pr.start) + "-" + std::to_string(pr.end);
      if (pr.start > pr.end)
      {
        log_.app(LogLevel::warn, "Skipping port range " + label + " (start > end)");
        continue;
      }

      const auto bounded = clamp_range(pr);
      if (!bounded)
      {
        log_.app(LogLevel::warn, "Skipping port range " + label + " (outside 1-65535)");
        continue;
      }
      if (bounded->start != pr.start || bounded->end != pr.end)
        log_.app(LogLevel::warn, "Clamping port range " + label + " to " +
                                     std::to_string(bounded->start) + "-" +
                                     std::to_string(bounded->end));

      for (int p = bounded->start; p <= bounded->end; ++p) ports.push_back(p);
    }

    for (int p : ports)
    {
      if (!valid_port(p))
      {
        log_.app(LogLevel::warn, "Skipping out-of-range port " + std::to_string(p));
        continue;
      }
      push_unique(r.candidates, seen,
                  domain::ScanCandidate{kLocalhost, static_cast<uint16_t>(p), "localhost_scan"});
    }
  }

  // ---------------------------
  // network ranges: hosts x known ports
  // ---------------------------
  for (const auto& range : cfg.networkRanges)
  {
    std::vector<std::string> hosts;
    try
    {
      hosts = hosts_in_range(range);
    }
    catch (const domain::ConfigurationError& e)
    {
      log_.app(LogLevel::warn, e.what());
      r.rangeErrors.push_back(e);
      continue;
    }

    if (cfg.knownPorts.empty())
      log_.app(LogLevel::warn, "Network range " + range + " has no known ports to probe");

    for (const auto& host : hosts)
    {
      for (int p : cfg.knownPorts)
      {
        if (!valid_port(p)) continue;
        push_unique(r.candidates, seen,
                    domain::ScanCandidate{host, static_cast<uint16_t>(p), "network_scan"});
      }
    }
  }

  log_.app(LogLevel::debug, "Enumerated " + std::to_string(r.candidates.size()) +
                                " candidates (" + std::to_string(r.rangeErrors.size()) +
                                " invalid ranges)");
  return r;
}

}  // namespace sentinel::discovery::application::services
