#include "application/services/DiscoveryService.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <set>
#include <sstream>

#include "shared/url/Url.hpp"

using sentinel::discovery::application::ports::LogLevel;

namespace sentinel::discovery::application::services
{

namespace
{
std::string trim(const std::string& s)
{
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::optional<std::string> process_env(const std::string& name)
{
  if (const char* v = std::getenv(name.c_str())) return std::string(v);
  return std::nullopt;
}
}  // namespace

DiscoveryService::DiscoveryService(ports::IReachabilityProbe& reach, ports::IMcpTransport& mcp,
                                   ports::ILogger& log, Options opts)
    : log_(log),
      opts_(opts),
      enumerator_(log),
      probe_(reach, mcp, log, opts.reachabilityTimeout),
      coordinator_(probe_, log, opts.workerThreads)
{
}

std::shared_ptr<ScanCancellation> DiscoveryService::register_scan(
    std::optional<std::chrono::milliseconds> budget)
{
  auto c = std::make_shared<ScanCancellation>(budget);
  std::lock_guard<std::mutex> lk(active_mu_);
  active_.push_back(c);
  return c;
}

void DiscoveryService::unregister_scan(const std::shared_ptr<ScanCancellation>& c)
{
  std::lock_guard<std::mutex> lk(active_mu_);
  active_.erase(std::remove(active_.begin(), active_.end(), c), active_.end());
}

void DiscoveryService::cancel()
{
  std::lock_guard<std::mutex> lk(active_mu_);
  for (auto& c : active_) c->cancel();
  if (!active_.empty())
    log_.app(LogLevel::info, "Cancelling " + std::to_string(active_.size()) + " running scan(s)");
}

DiscoveryReport DiscoveryService::discover(const domain::ScanConfiguration& cfg)
{
  const auto timeout = cfg.effective_timeout();
  const int maxConcurrent = cfg.effective_max_concurrent();
  if (cfg.maxConcurrent <= 0)
    log_.app(LogLevel::warn, "maxConcurrent=" + std::to_string(cfg.maxConcurrent) +
                                 " is not positive, using " + std::to_string(maxConcurrent));

  {
    std::ostringstream oss;
    oss << "Starting discovery: port_ranges=" << cfg.portRanges.size()
        << " network_ranges=" << cfg.networkRanges.size()
        << " known_ports=" << cfg.knownPorts.size() << " timeout=" << timeout.count() << "ms"
        << " maxConcurrent=" << maxConcurrent;
    if (cfg.scanDeadline) oss << " scanDeadline=" << cfg.scanDeadline->count() << "ms";
    log_.app(LogLevel::info, oss.str());
  }

  DiscoveryReport report;
  auto targets = enumerator_.enumerate(cfg);
  report.rangeErrors = std::move(targets.rangeErrors);

  auto cancel = register_scan(cfg.scanDeadline);
  report.servers = coordinator_.run(targets.candidates, maxConcurrent, timeout, *cancel);
  const bool cut_short = cancel->stop_requested();
  unregister_scan(cancel);

  cache_.merge(report.servers);

  log_.app(LogLevel::info, "Discovery completed: servers_found=" +
                               std::to_string(report.servers.size()) + " candidates=" +
                               std::to_string(targets.candidates.size()) + " invalid_ranges=" +
                               std::to_string(report.rangeErrors.size()) +
                               (cut_short ? " (stopped early)" : ""));
  return report;
}

domain::DiscoveredServer DiscoveryService::refresh(const std::string& url)
{
  log_.app(LogLevel::debug, "Refreshing " + url);

  const ScanCancellation no_deadline;
  std::optional<domain::DiscoveredServer> server;
  try
  {
    server = probe_.probe_url(url, "refresh", opts_.refreshTimeout, no_deadline);
  }
  catch (const std::exception& ex)
  {
    log_.probe(LogLevel::err, "[refresh] " + url + " aborted: " + ex.what());
  }
  if (!server)
  {
    log_.app(LogLevel::info, "Refresh found no protocol server at " + url);
    throw domain::NotFoundError(url);
  }

  cache_.upsert(*server);
  return *server;
}

std::vector<domain::DiscoveredServer> DiscoveryService::discover_from_environment(EnvLookup env)
{
  if (!env) env = process_env;

  std::vector<std::string> urls;
  std::set<std::string> seen;
  for (const char* name : kEnvVars)
  {
    auto value = env(name);
    if (!value) continue;

    std::stringstream ss(*value);
    std::string item;
    while (std::getline(ss, item, ','))
    {
      item = trim(item);
      if (item.empty()) continue;
      if (!shared::url::try_parse(item))
      {
        log_.app(LogLevel::warn, std::string("Ignoring malformed URL in ") + name + ": " + item);
        continue;
      }
      if (seen.insert(item).second) urls.push_back(item);
    }
  }

  std::vector<domain::DiscoveredServer> found;
  if (urls.empty()) return found;

  const ScanCancellation no_deadline;
  for (const auto& url : urls)
  {
    try
    {
      if (auto s = probe_.probe_url(url, "environment", opts_.environmentTimeout, no_deadline))
        found.push_back(std::move(*s));
    }
    catch (const std::exception& ex)
    {
      log_.probe(LogLevel::err, "[environment] " + url + " aborted: " + ex.what());
    }
  }

  cache_.merge(found);
  log_.app(LogLevel::info, "Environment discovery: " + std::to_string(found.size()) + " of " +
                               std::to_string(urls.size()) + " configured servers online");
  return found;
}

}  // namespace sentinel::discovery::application::services
