#pragma once

#include <cctype>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sentinel::discovery::shared::url
{

// http://host[:port][/target]; https is recognised only to be rejected by callers.
struct Url
{
  std::string scheme;
  std::string host;  // brackets stripped for IPv6 literals
  uint16_t port{80};
  std::string target{"/"};

  std::string host_header() const
  {
    const bool v6 = host.find(':') != std::string::npos;
    std::string h = v6 ? "[" + host + "]" : host;
    return h + ":" + std::to_string(port);
  }
};

inline Url parse(std::string_view in)
{
  Url u;

  const auto sep = in.find("://");
  if (sep == std::string_view::npos) throw std::invalid_argument("missing scheme in URL");
  u.scheme.assign(in.substr(0, sep));
  for (auto& ch : u.scheme) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (u.scheme != "http" && u.scheme != "https")
    throw std::invalid_argument("unsupported scheme '" + u.scheme + "'");
  u.port = (u.scheme == "https") ? 443 : 80;

  std::string_view rest = in.substr(sep + 3);
  const auto slash = rest.find('/');
  std::string_view authority = rest.substr(0, slash);
  if (slash != std::string_view::npos) u.target.assign(rest.substr(slash));

  std::string_view port_part;
  if (!authority.empty() && authority.front() == '[')
  {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) throw std::invalid_argument("unterminated IPv6 literal");
    u.host.assign(authority.substr(1, close - 1));
    if (close + 1 < authority.size())
    {
      if (authority[close + 1] != ':') throw std::invalid_argument("garbage after IPv6 literal");
      port_part = authority.substr(close + 2);
    }
  }
  else
  {
    const auto colon = authority.rfind(':');
    u.host.assign(authority.substr(0, colon));
    if (colon != std::string_view::npos) port_part = authority.substr(colon + 1);
  }

  if (u.host.empty()) throw std::invalid_argument("empty host in URL");

  if (!port_part.empty())
  {
    unsigned long v = 0;
    for (char ch : port_part)
    {
      if (ch < '0' || ch > '9') throw std::invalid_argument("non-numeric port in URL");
      v = v * 10 + static_cast<unsigned long>(ch - '0');
      if (v > 65535) throw std::invalid_argument("port out of range in URL");
    }
    if (v == 0) throw std::invalid_argument("port out of range in URL");
    u.port = static_cast<uint16_t>(v);
  }

  return u;
}

inline std::optional<Url> try_parse(std::string_view in)
{
  try
  {
    return parse(in);
  }
  catch (const std::invalid_argument&)
  {
    return std::nullopt;
  }
}

}  // namespace sentinel::discovery::shared::url
