#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>

#include "application/services/Bootstrap.hpp"
#include "application/services/DiscoveryService.hpp"
#include "domain/ScanConfiguration.hpp"
#include "infrastructure/config/Config_Toml.hpp"
#include "infrastructure/http/Reachability_Http.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"
#include "infrastructure/mcp/McpJson.hpp"
#include "infrastructure/mcp/McpTransport_Http.hpp"
#include "infrastructure/scheduler/PeriodicDiscovery_Asio.hpp"

namespace app_srv = sentinel::discovery::application::services;
namespace infra = sentinel::discovery::infrastructure;
namespace domain = sentinel::discovery::domain;

static void usage(const char* argv0)
{
  std::cerr << "Usage: " << argv0 << " [config.toml] [--refresh URL] [--env] [--periodic]\n";
}

int main(int argc, char** argv)
{
  std::string configPath{"sentinel-discovery.toml"};
  std::optional<std::string> refreshUrl;
  bool fromEnv = false;
  bool periodic = false;

  for (int i = 1; i < argc; ++i)
  {
    if (std::strcmp(argv[i], "--refresh") == 0 && i + 1 < argc)
      refreshUrl = argv[++i];
    else if (std::strcmp(argv[i], "--env") == 0)
      fromEnv = true;
    else if (std::strcmp(argv[i], "--periodic") == 0)
      periodic = true;
    else if (argv[i][0] == '-')
    {
      usage(argv[0]);
      return 64;
    }
    else
      configPath = argv[i];
  }

  infra::config::Config_Toml cfg_impl;
  infra::logging::Logger_Spdlog log_impl;

  app_srv::Bootstrap boot{cfg_impl, log_impl};
  const auto settings = boot.run(configPath);

  infra::http::Reachability_Http reach{log_impl};
  infra::mcp::McpTransport_Http mcp{log_impl};
  app_srv::DiscoveryService service{reach, mcp, log_impl,
                                    app_srv::DiscoveryService::Options::from_settings(settings)};

  // ---- single target ----
  if (refreshUrl)
  {
    try
    {
      const auto server = service.refresh(*refreshUrl);
      std::cout << infra::mcp::json_map::to_json(server).dump(2) << "\n";
      log_impl.flush();
      return 0;
    }
    catch (const domain::NotFoundError& e)
    {
      std::cerr << e.what() << "\n";
      log_impl.flush();
      return 1;
    }
  }

  if (fromEnv)
  {
    const auto found = service.discover_from_environment();
    std::cout << infra::mcp::json_map::to_json(found).dump(2) << "\n";
  }

  // ---- bulk scan ----
  const auto scan = domain::ScanConfiguration::from_settings(settings);
  const auto report = service.discover(scan);
  for (const auto& err : report.rangeErrors) std::cerr << err.what() << "\n";
  std::cout << infra::mcp::json_map::to_json(report.servers).dump(2) << "\n";

  if (periodic || settings.periodic.enabled)
  {
    infra::scheduler::PeriodicDiscovery_Asio scheduler{log_impl};
    scheduler.on_run([&] { service.discover(scan); });
    scheduler.start(std::chrono::minutes(settings.periodic.interval_minutes));

    boost::asio::io_context sig_io;
    boost::asio::signal_set signals{sig_io, SIGINT, SIGTERM};
    signals.async_wait(
        [&](const boost::system::error_code&, int)
        {
          service.cancel();
        });
    sig_io.run();

    scheduler.stop();
    std::cout << infra::mcp::json_map::to_json(service.snapshot()).dump(2) << "\n";
  }

  log_impl.flush();
  return (report.servers.empty() && !report.rangeErrors.empty()) ? 2 : 0;
}
