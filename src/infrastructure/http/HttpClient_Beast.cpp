#include "infrastructure/http/HttpClient_Beast.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <stdexcept>

#include "domain/Errors.hpp"
#include "domain/protocol/McpMethods.hpp"
#include "shared/url/Url.hpp"

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace asio = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace sentinel::discovery::infrastructure::http
{

namespace
{
std::string describe(const beast::error_code& ec)
{
  if (ec == beast::error::timeout || ec == asio::error::operation_aborted) return "timed out";
  return ec.message();
}
}  // namespace

HttpResponse HttpClient_Beast::request(bhttp::verb method, const std::string& url,
                                       const std::string& body, Deadline deadline,
                                       const std::string& contentType) const
{
  shared::url::Url u;
  try
  {
    u = shared::url::parse(url);
  }
  catch (const std::invalid_argument& e)
  {
    throw domain::TransportError(url + ": " + e.what());
  }
  if (u.scheme != "http") throw domain::TransportError(url + ": only plain http is supported");
  if (std::chrono::steady_clock::now() >= deadline)
    throw domain::TransportError(url + ": deadline already passed");

  asio::io_context ioc;
  tcp::resolver resolver{ioc};
  beast::tcp_stream stream{ioc};
  asio::steady_timer resolve_timer{ioc};

  bhttp::request<bhttp::string_body> req{method, u.target, 11};
  req.set(bhttp::field::host, u.host_header());
  req.set(bhttp::field::user_agent, std::string(domain::protocol::kUserAgent));
  req.set(bhttp::field::connection, "close");
  if (method == bhttp::verb::post)
  {
    req.set(bhttp::field::content_type, contentType);
    req.set(bhttp::field::accept, "application/json, text/event-stream");
    req.body() = body;
    req.prepare_payload();
  }

  beast::flat_buffer buffer;
  bhttp::response_parser<bhttp::string_body> parser;
  parser.body_limit(kMaxBodyBytes);
  if (method == bhttp::verb::head) parser.skip(true);

  beast::error_code failure;
  const char* stage = "resolve";

  // resolver has no expiry of its own
  resolve_timer.expires_at(deadline);
  resolve_timer.async_wait(
      [&](const beast::error_code& ec)
      {
        if (!ec) resolver.cancel();
      });

  resolver.async_resolve(
      u.host, std::to_string(u.port),
      [&](const beast::error_code& ec, tcp::resolver::results_type results)
      {
        resolve_timer.cancel();
        if (ec)
        {
          failure = ec;
          return;
        }

        stage = "connect";
        stream.expires_at(deadline);
        stream.async_connect(
            results,
            [&](const beast::error_code& ec2, const tcp::endpoint&)
            {
              if (ec2)
              {
                failure = ec2;
                return;
              }

              stage = "write";
              bhttp::async_write(
                  stream, req,
                  [&](const beast::error_code& ec3, std::size_t)
                  {
                    if (ec3)
                    {
                      failure = ec3;
                      return;
                    }

                    stage = "read";
                    bhttp::async_read(stream, buffer, parser,
                                      [&](const beast::error_code& ec4, std::size_t)
                                      { failure = ec4; });
                  });
            });
      });

  ioc.run();

  beast::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

  if (failure)
    throw domain::TransportError(std::string(bhttp::to_string(method)) + " " + url + " " + stage +
                                 " failed: " + describe(failure));
  if (!parser.is_header_done())
    throw domain::TransportError(url + ": connection closed before a response arrived");

  auto res = parser.release();
  HttpResponse out;
  out.status = res.result_int();
  out.contentType = std::string(res[bhttp::field::content_type]);
  out.body = std::move(res.body());
  return out;
}

}  // namespace sentinel::discovery::infrastructure::http
