#include "infrastructure/http/Reachability_Http.hpp"

#include "domain/Errors.hpp"

using sentinel::discovery::application::ports::LogLevel;

namespace sentinel::discovery::infrastructure::http
{

unsigned Reachability_Http::check(const std::string& url,
                                  std::chrono::steady_clock::time_point deadline) const
{
  HttpResponse res;
  try
  {
    res = http_.request(boost::beast::http::verb::head, url, {}, deadline);
  }
  catch (const domain::TransportError& e)
  {
    throw domain::ReachabilityError(e.what());
  }

  if (res.status >= 500)
    throw domain::ReachabilityError(url + " answered " + std::to_string(res.status));
  return res.status;
}

bool Reachability_Http::is_reachable(const std::string& url,
                                     std::chrono::steady_clock::time_point deadline)
{
  try
  {
    check(url, deadline);
    return true;
  }
  catch (const domain::ReachabilityError& e)
  {
    log_.probe(LogLevel::trace, std::string("[reachability] ") + e.what());
    return false;
  }
}

}  // namespace sentinel::discovery::infrastructure::http
