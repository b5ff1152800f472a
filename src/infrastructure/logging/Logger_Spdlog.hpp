#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace sentinel::discovery::infrastructure::logging
{

class Logger_Spdlog final : public sentinel::discovery::application::ports::ILogger
{
 public:
  void init(const sentinel::discovery::domain::Settings& s) override;

  void app(sentinel::discovery::application::ports::LogLevel level,
           const std::string& msg) override;

  void probe(sentinel::discovery::application::ports::LogLevel level,
             std::string_view msg) override;

  void set_level(sentinel::discovery::application::ports::LogLevel level);

  void flush();

 private:
  std::shared_ptr<spdlog::logger> app_;
  std::shared_ptr<spdlog::logger> probe_;

  // Helpers
  static spdlog::level::level_enum map_level(sentinel::discovery::application::ports::LogLevel l);
};

}  // namespace sentinel::discovery::infrastructure::logging
