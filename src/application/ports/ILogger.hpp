#pragma once

#include <string>
#include <string_view>

#include "domain/Settings.hpp"

namespace sentinel::discovery::application::ports
{

enum class LogLevel
{
  trace,
  debug,
  info,
  warn,
  err,
  critical,
  off
};

struct ILogger
{
  virtual ~ILogger() = default;
  virtual void init(const sentinel::discovery::domain::Settings& s) = 0;
  // Lifecycle, configuration and scan summaries.
  virtual void app(LogLevel level, const std::string& msg) = 0;
  // Per-candidate diagnostics (stage, address, reason).
  virtual void probe(LogLevel level, std::string_view msg) = 0;
};

}  // namespace sentinel::discovery::application::ports
