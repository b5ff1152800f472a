#pragma once
#include <string>
#include <sstream>
#include "application/ports/IConfigProvider.hpp"
#include "application/ports/ILogger.hpp"

namespace sentinel::discovery::application::services {

struct Bootstrap {
  ports::IConfigProvider& cfg;
  ports::ILogger&         log;

  template <typename T>
  static inline std::string join(const T& v) {
    std::ostringstream oss;
    for (size_t i = 0; i < v.size(); ++i) {
      if (i) oss << ", ";
      oss << v[i];
    }
    return oss.str();
  }
  static inline const char* b2s(bool b) { return b ? "true" : "false"; }

  domain::Settings run(const std::string& configPath) {
    auto s = cfg.load_or_create(configPath);
    log.init(s);

    using ports::LogLevel;
    const auto& d = s.discovery;

    log.app(LogLevel::info, "Sentinel Discovery started");
    log.app(LogLevel::info, std::string("Config file: ") + s.configPath);
    log.app(LogLevel::info, std::string("Known ports: [") + join(d.knownPorts) + "]");
    log.app(LogLevel::info, std::string("Network ranges: [") + join(d.networkRanges) + "]");

    std::ostringstream limits;
    limits << "timeout_ms: " << d.timeout_ms
           << " | maxConcurrent: " << d.maxConcurrent
           << " | workerThreads: " << d.workerThreads
           << " | scanDeadline_ms: " << d.scanDeadline_ms;
    log.app(LogLevel::info, limits.str());

    std::ostringstream flags;
    flags << "Console: " << b2s(s.showConsole)
          << " | saveLog: " << b2s(s.saveLog)
          << " | saveProbeLog: " << b2s(s.saveProbeLog)
          << " | periodic: " << b2s(s.periodic.enabled);
    log.app(LogLevel::info, flags.str());

    return s;
  }
};

} // namespace sentinel::discovery::application::services
