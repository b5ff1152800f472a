#pragma once

#include "application/ports/ILogger.hpp"
#include "application/ports/IReachabilityProbe.hpp"
#include "infrastructure/http/HttpClient_Beast.hpp"

namespace sentinel::discovery::infrastructure::http
{

// HEAD request; reachable iff any status below 500 comes back in time.
class Reachability_Http final : public sentinel::discovery::application::ports::IReachabilityProbe
{
 public:
  explicit Reachability_Http(sentinel::discovery::application::ports::ILogger& log) : log_(log) {}

  bool is_reachable(const std::string& url,
                    std::chrono::steady_clock::time_point deadline) override;

  // Returns the HEAD status. Throws domain::ReachabilityError on a transport
  // failure, a timeout or a status of 500 and above.
  unsigned check(const std::string& url, std::chrono::steady_clock::time_point deadline) const;

 private:
  sentinel::discovery::application::ports::ILogger& log_;
  HttpClient_Beast http_;
};

}  // namespace sentinel::discovery::infrastructure::http
