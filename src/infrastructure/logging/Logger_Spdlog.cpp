#include "infrastructure/logging/Logger_Spdlog.hpp"

#if defined(_WIN32)
  #ifndef NOMINMAX
  #define NOMINMAX
  #endif
  #ifndef WIN32_LEAN_AND_MEAN
  #define WIN32_LEAN_AND_MEAN
  #endif
  #include <windows.h>
#endif

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>

#include <boost/filesystem.hpp>
#include <vector>
#include <chrono>

namespace fs = boost::filesystem;
using sentinel::discovery::application::ports::LogLevel;

namespace sentinel::discovery::infrastructure::logging {

// -------------------------------------------------------------------------------------------------
// map_level
//  - Converts ports::LogLevel to spdlog's native level enum.
// -------------------------------------------------------------------------------------------------
spdlog::level::level_enum Logger_Spdlog::map_level(LogLevel l) {
  switch (l) {
    case LogLevel::trace:    return spdlog::level::trace;
    case LogLevel::debug:    return spdlog::level::debug;
    case LogLevel::info:     return spdlog::level::info;
    case LogLevel::warn:     return spdlog::level::warn;
    case LogLevel::err:      return spdlog::level::err;
    case LogLevel::critical: return spdlog::level::critical;
    case LogLevel::off:      return spdlog::level::off;
  }
  return spdlog::level::info;
}

// -------------------------------------------------------------------------------------------------
// configure_console_colors_
//  - Per-level colors on the console sink only.
// -------------------------------------------------------------------------------------------------
#if defined(_WIN32)
static void configure_console_colors_(const std::shared_ptr<spdlog::sinks::wincolor_stdout_sink_mt>& sink) {
  const WORD GRAY     = FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_BLUE;
  const WORD BGRAY    = GRAY | FOREGROUND_INTENSITY;
  const WORD GREEN    = FOREGROUND_GREEN | FOREGROUND_INTENSITY;
  const WORD CYAN     = FOREGROUND_GREEN | FOREGROUND_BLUE  | FOREGROUND_INTENSITY;
  const WORD YELLOW   = FOREGROUND_RED   | FOREGROUND_GREEN | FOREGROUND_INTENSITY;
  const WORD RED      = FOREGROUND_RED   | FOREGROUND_INTENSITY;
  const WORD MAGENTA  = FOREGROUND_RED   | FOREGROUND_BLUE  | FOREGROUND_INTENSITY;

  sink->set_color(spdlog::level::trace,    BGRAY);
  sink->set_color(spdlog::level::debug,    CYAN);
  sink->set_color(spdlog::level::info,     GREEN);
  sink->set_color(spdlog::level::warn,     YELLOW);
  sink->set_color(spdlog::level::err,      RED);
  sink->set_color(spdlog::level::critical, MAGENTA);
}
#else
static void configure_console_colors_(const std::shared_ptr<spdlog::sinks::ansicolor_stdout_sink_mt>& sink) {
  const std::string BGRAY   = "\x1b[90m";
  const std::string CYAN    = "\x1b[36m";
  const std::string GREEN   = "\x1b[32m";
  const std::string YELLOW  = "\x1b[33m";
  const std::string RED     = "\x1b[31m";
  const std::string MAGENTA = "\x1b[35m";

  sink->set_color(spdlog::level::trace,    BGRAY);
  sink->set_color(spdlog::level::debug,    CYAN);
  sink->set_color(spdlog::level::info,     GREEN);
  sink->set_color(spdlog::level::warn,     YELLOW);
  sink->set_color(spdlog::level::err,      RED);
  sink->set_color(spdlog::level::critical, MAGENTA);
}
#endif

// -------------------------------------------------------------------------------------------------
// init(settings)
//  - Rotating file sinks for the "app" and "probe" channels (saveLog / saveProbeLog).
//  - Optional colored console sink shared by both channels (showConsole).
//  - Async loggers on one shared spdlog thread pool: probe workers never block on disk.
//  - Safe to call again; previous loggers are dropped and rebuilt.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::init(const sentinel::discovery::domain::Settings& s) {
  const fs::path dir       = s.logsDir.empty() ? fs::path{"logs"} : fs::path{s.logsDir};
  const fs::path appPath   = dir / (s.appLogFilename.empty()   ? "discovery_app.log"   : s.appLogFilename);
  const fs::path probePath = dir / (s.probeLogFilename.empty() ? "discovery_probe.log" : s.probeLogFilename);

  boost::system::error_code ec;
  fs::create_directories(dir, ec);

  // Re-init safety: flush and drop old named loggers if they exist
  if (auto prev = spdlog::get("app"))   { prev->flush(); spdlog::drop(prev->name()); }
  if (auto prev = spdlog::get("probe")) { prev->flush(); spdlog::drop(prev->name()); }

  std::vector<spdlog::sink_ptr> app_sinks;
  std::vector<spdlog::sink_ptr> probe_sinks;

  // File sinks - no colors
  if (s.saveLog) {
    auto app_file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(appPath.string(), 5 * 1024 * 1024, 3);
    app_file->set_level(spdlog::level::trace);
    app_sinks.push_back(app_file);
  }
  if (s.saveProbeLog) {
    auto probe_file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(probePath.string(), 5 * 1024 * 1024, 3);
    probe_file->set_level(spdlog::level::trace);
    probe_sinks.push_back(probe_file);
  }

  // Optional console sink - colored by level
  if (s.showConsole) {
#if defined(_WIN32)
    auto console_sink = std::make_shared<spdlog::sinks::wincolor_stdout_sink_mt>();
#else
    auto console_sink = std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>();
#endif
    configure_console_colors_(console_sink);
    console_sink->set_level(spdlog::level::info); // probe chatter stays in the file
    app_sinks.push_back(console_sink);
    probe_sinks.push_back(console_sink);
  }

  const size_t qsize   = 8192;
  const size_t workers = 1;

  if (!spdlog::thread_pool()) spdlog::init_thread_pool(qsize, workers);
  app_   = std::make_shared<spdlog::async_logger>("app",   app_sinks.begin(),   app_sinks.end(),
             spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  probe_ = std::make_shared<spdlog::async_logger>("probe", probe_sinks.begin(), probe_sinks.end(),
             spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::register_logger(app_);
  spdlog::register_logger(probe_);

  // ONLY console renders colors between %^ and %$.
  const char* pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] %^[%l]%$ %v";
  app_->set_pattern(pattern);
  probe_->set_pattern(pattern);

  // Logger levels (global); per-sink levels still apply.
  app_->set_level(spdlog::level::trace);
  probe_->set_level(spdlog::level::debug);

  // Flush policy
  app_->flush_on(spdlog::level::err);
  probe_->flush_on(spdlog::level::err);
  spdlog::flush_every(std::chrono::seconds(2));
}

// -------------------------------------------------------------------------------------------------
// app(level, msg)
//  - "app" channel: lifecycle, configuration, scan summaries.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::app(LogLevel level, const std::string& msg) {
  if (app_) app_->log(map_level(level), msg);
}

// -------------------------------------------------------------------------------------------------
// probe(level, msg)
//  - "probe" channel: one line per candidate stage outcome.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::probe(LogLevel level, std::string_view msg) {
  if (probe_) probe_->log(map_level(level), msg);
}

// -------------------------------------------------------------------------------------------------
// set_level(level)
//  - Adjusts both loggers at runtime.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::set_level(LogLevel level) {
  auto lv = map_level(level);
  if (app_)   app_->set_level(lv);
  if (probe_) probe_->set_level(lv);
}

void Logger_Spdlog::flush() {
  if (app_)   app_->flush();
  if (probe_) probe_->flush();
}

} // namespace sentinel::discovery::infrastructure::logging
