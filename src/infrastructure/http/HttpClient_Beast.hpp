#pragma once

#include <boost/beast/http/verb.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace sentinel::discovery::infrastructure::http
{

struct HttpResponse
{
  unsigned status{0};
  std::string contentType;
  std::string body;
};

// Blocking HTTP/1.1 exchange on a private io_context, bounded by an absolute
// deadline covering resolve, connect, write and read. One connection per call.
class HttpClient_Beast
{
 public:
  using Deadline = std::chrono::steady_clock::time_point;

  static constexpr std::size_t kMaxBodyBytes = 4 * 1024 * 1024;

  // Throws domain::TransportError on a bad URL, network failure or timeout.
  // Any HTTP status is a successful exchange.
  HttpResponse request(boost::beast::http::verb method, const std::string& url,
                       const std::string& body, Deadline deadline,
                       const std::string& contentType = "application/json") const;
};

}  // namespace sentinel::discovery::infrastructure::http
