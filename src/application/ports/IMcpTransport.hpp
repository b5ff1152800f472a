#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "domain/DiscoveredServer.hpp"

namespace sentinel::discovery::application::ports
{

// Protocol client. Every call is bounded by `deadline` and throws
// domain::TransportError or domain::ProtocolMismatchError on failure.
struct IMcpTransport
{
  using Deadline = std::chrono::steady_clock::time_point;

  virtual ~IMcpTransport() = default;

  virtual domain::ServerIdentity initialize(const std::string& url, Deadline deadline) = 0;

  virtual std::vector<domain::Tool> list_tools(const std::string& url, Deadline deadline) = 0;
  virtual std::vector<domain::Resource> list_resources(const std::string& url,
                                                       Deadline deadline) = 0;
  virtual std::vector<domain::Prompt> list_prompts(const std::string& url, Deadline deadline) = 0;
};

}  // namespace sentinel::discovery::application::ports
