#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sentinel::discovery::domain
{

struct DiscoveryError : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

// Malformed network range; scoped to that one range.
struct ConfigurationError : DiscoveryError
{
  ConfigurationError(std::string range, const std::string& why)
      : DiscoveryError("invalid network range '" + range + "': " + why), range(std::move(range))
  {
  }

  std::string range;
};

struct ReachabilityError : DiscoveryError
{
  using DiscoveryError::DiscoveryError;
};

struct TransportError : DiscoveryError
{
  using DiscoveryError::DiscoveryError;
};

struct ProtocolMismatchError : DiscoveryError
{
  using DiscoveryError::DiscoveryError;
};

struct CapabilityEnumerationError : DiscoveryError
{
  CapabilityEnumerationError(std::string category, const std::string& why)
      : DiscoveryError(category + ": " + why), category(std::move(category))
  {
  }

  std::string category;
};

struct NotFoundError : DiscoveryError
{
  explicit NotFoundError(const std::string& url)
      : DiscoveryError("no protocol server at " + url), url(url)
  {
  }

  std::string url;
};

}  // namespace sentinel::discovery::domain
