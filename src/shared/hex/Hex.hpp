#pragma once

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace sentinel::discovery::shared::hex
{

// -----------------------------------------------------------------------------
// hex_dump(data, max_len)
//  - Space-separated uppercase bytes; appends the total when truncated.
// -----------------------------------------------------------------------------
inline std::string hex_dump(std::string_view data, size_t max_len = 32)
{
  std::ostringstream oss;
  oss << std::hex << std::uppercase << std::setfill('0');

  const size_t take = (max_len > 0) ? (std::min)(max_len, data.size()) : data.size();

  for (size_t i = 0; i < take; ++i)
  {
    const auto v = static_cast<unsigned int>(static_cast<unsigned char>(data[i]));
    oss << std::setw(2) << v << ' ';
  }

  if (take < data.size())
  {
    oss << "...(" << std::dec << data.size() << " bytes total)";
  }

  return oss.str();
}

// -----------------------------------------------------------------------------
// make_line(tag, body, max)
//  - "<tag> n=<size>: <hex>" for diagnostics on bodies that failed to parse.
// -----------------------------------------------------------------------------
inline std::string make_line(std::string_view tag, std::string_view body, size_t max = 32)
{
  std::string line;
  line.reserve(64 + max * 3);
  line.append(tag).append(" n=").append(std::to_string(body.size())).append(": ");
  line += hex_dump(body, max);
  return line;
}

}  // namespace sentinel::discovery::shared::hex
