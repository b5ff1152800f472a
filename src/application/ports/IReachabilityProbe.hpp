#pragma once

#include <chrono>
#include <string>

namespace sentinel::discovery::application::ports
{

// Cheap liveness check run before any protocol work.
struct IReachabilityProbe
{
  virtual ~IReachabilityProbe() = default;

  // True when the target answered with a status below 500 before `deadline`.
  // Never throws for network failures; those are simply "unreachable".
  virtual bool is_reachable(const std::string& url,
                            std::chrono::steady_clock::time_point deadline) = 0;
};

}  // namespace sentinel::discovery::application::ports
