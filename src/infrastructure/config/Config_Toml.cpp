#include "infrastructure/config/Config_Toml.hpp"

#include <algorithm>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <exception>
#include <fstream>
#include <sstream>
#include <toml++/toml.hpp>
#include <vector>

using sentinel::discovery::domain::Settings;
namespace fs = boost::filesystem;

namespace sentinel::discovery::infrastructure::config
{

namespace
{
constexpr const char* kDefaultLogsDir = "logs";
constexpr const char* kDefaultAppLog = "discovery_app.log";
constexpr const char* kDefaultProbeLog = "discovery_probe.log";

template <typename T>
static std::string join(const std::vector<T>& v)
{
  std::ostringstream oss;
  for (size_t i = 0; i < v.size(); ++i)
  {
    if (i) oss << ", ";
    oss << v[i];
  }
  return oss.str();
}

static std::string join_quoted(const std::vector<std::string>& v)
{
  std::ostringstream oss;
  for (size_t i = 0; i < v.size(); ++i)
  {
    if (i) oss << ", ";
    oss << '"' << v[i] << '"';
  }
  return oss.str();
}

static std::string join_ranges(const std::vector<std::pair<int, int>>& v)
{
  std::ostringstream oss;
  for (size_t i = 0; i < v.size(); ++i)
  {
    if (i) oss << ", ";
    oss << '[' << v[i].first << ", " << v[i].second << ']';
  }
  return oss.str();
}

static void clamp_positive(int& v, int fallback)
{
  if (v <= 0) v = fallback;
}
}  // namespace

std::optional<std::pair<int, int>> Config_Toml::normalize_port_range(int64_t start, int64_t end)
{
  if (start > end) return std::nullopt;
  const int64_t lo = std::max<int64_t>(start, 1);
  const int64_t hi = std::min<int64_t>(end, 65535);
  if (lo > hi) return std::nullopt;
  return std::make_pair(static_cast<int>(lo), static_cast<int>(hi));
}

void Config_Toml::write_default(const fs::path& path, Settings& s)
{
  boost::system::error_code ec;
  if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
  std::ofstream out(path.string());

  // Header
  out << "# sentinel-discovery.toml - auto-generated initial configuration\n"
         "# Edit as needed and restart the application\n\n";

  // [logging]
  out << "[logging]\n";
  out << "showConsole      = " << (s.showConsole ? "true" : "false") << "\n";
  out << "saveLog          = " << (s.saveLog ? "true" : "false") << "\n";
  out << "saveProbeLog     = " << (s.saveProbeLog ? "true" : "false") << "\n";
  out << "logsDir          = \"" << kDefaultLogsDir << "\"\n";
  out << "appLogFilename   = \"" << kDefaultAppLog << "\"\n";
  out << "probeLogFilename = \"" << kDefaultProbeLog << "\"\n\n";

  // [discovery]
  const auto& d = s.discovery;
  out << "[discovery]\n";
  out << "knownPorts             = [" << join(d.knownPorts) << "]\n";
  out << "portRanges             = [" << join_ranges(d.portRanges) << "]\n";
  out << "networkRanges          = [" << join_quoted(d.networkRanges) << "]\n";
  out << "timeout_ms             = " << d.timeout_ms << "\n";
  out << "maxConcurrent          = " << d.maxConcurrent << "\n";
  out << "workerThreads          = " << d.workerThreads << "\n";
  out << "reachabilityTimeout_ms = " << d.reachabilityTimeout_ms << "\n";
  out << "refreshTimeout_ms      = " << d.refreshTimeout_ms << "\n";
  out << "scanDeadline_ms        = " << d.scanDeadline_ms << "  # 0 = no scan-wide deadline\n";
  out << "scanLocalhost          = " << (d.scanLocalhost ? "true" : "false") << "\n\n";

  // [periodic]
  out << "[periodic]\n";
  out << "enabled          = " << (s.periodic.enabled ? "true" : "false") << "\n";
  out << "interval_minutes = " << s.periodic.interval_minutes << "\n";

  out.close();

  // mirror useful defaults back to Settings
  s.logsDir = kDefaultLogsDir;
  s.appLogFilename = kDefaultAppLog;
  s.probeLogFilename = kDefaultProbeLog;
}

Settings Config_Toml::load_or_create(const std::string& configPath)
{
  Settings s;
  s.configPath = configPath;
  const fs::path path{configPath};

  if (!fs::exists(path))
  {
    write_default(path, s);
    return s;
  }

  toml::table tbl;
  try
  {
    tbl = toml::parse_file(path.string());
  }
  catch (const std::exception&)
  {
    // if parsing fails, recreate with defaults
    write_default(path, s);
    return s;
  }

  // ---------------------------
  // [logging]
  // ---------------------------
  if (auto log = tbl["logging"].as_table())
  {
    if (auto v = (*log)["showConsole"].value<bool>()) s.showConsole = *v;
    if (auto v = (*log)["saveLog"].value<bool>()) s.saveLog = *v;
    if (auto v = (*log)["saveProbeLog"].value<bool>()) s.saveProbeLog = *v;
    if (auto v = (*log)["logsDir"].value<std::string>()) s.logsDir = *v;
    if (auto v = (*log)["appLogFilename"].value<std::string>()) s.appLogFilename = *v;
    if (auto v = (*log)["probeLogFilename"].value<std::string>()) s.probeLogFilename = *v;
  }

  if (s.logsDir.empty()) s.logsDir = kDefaultLogsDir;
  if (s.appLogFilename.empty()) s.appLogFilename = kDefaultAppLog;
  if (s.probeLogFilename.empty()) s.probeLogFilename = kDefaultProbeLog;

  // ---------------------------
  // [discovery]
  // ---------------------------
  const Settings::Discovery defaults{};
  if (auto d = tbl["discovery"].as_table())
  {
    auto& out = s.discovery;

    if (auto arr = (*d)["knownPorts"].as_array())
    {
      out.knownPorts.clear();
      for (auto& e : *arr)
      {
        if (auto p = e.value<int64_t>(); p && *p >= 1 && *p <= 65535)
          out.knownPorts.push_back(static_cast<uint16_t>(*p));
      }
    }

    // [[start, end], ...]
    if (auto arr = (*d)["portRanges"].as_array())
    {
      out.portRanges.clear();
      for (auto& e : *arr)
      {
        auto pair = e.as_array();
        if (!pair || pair->size() != 2) continue;
        auto a = (*pair)[0].value<int64_t>();
        auto b = (*pair)[1].value<int64_t>();
        if (!a || !b) continue;
        if (auto r = normalize_port_range(*a, *b)) out.portRanges.push_back(*r);
      }
    }

    if (auto arr = (*d)["networkRanges"].as_array())
    {
      out.networkRanges.clear();
      for (auto& e : *arr)
      {
        if (auto r = e.value<std::string>()) out.networkRanges.push_back(*r);
      }
    }

    auto read_int = [&](const char* key, int& dst)
    {
      if (auto v = (*d)[key].value<int64_t>()) dst = static_cast<int>(*v);
    };
    read_int("timeout_ms", out.timeout_ms);
    read_int("maxConcurrent", out.maxConcurrent);
    read_int("workerThreads", out.workerThreads);
    read_int("reachabilityTimeout_ms", out.reachabilityTimeout_ms);
    read_int("refreshTimeout_ms", out.refreshTimeout_ms);
    read_int("scanDeadline_ms", out.scanDeadline_ms);
    if (auto v = (*d)["scanLocalhost"].value<bool>()) out.scanLocalhost = *v;
  }

  // fallback defaults for values that must be positive
  clamp_positive(s.discovery.timeout_ms, defaults.timeout_ms);
  clamp_positive(s.discovery.maxConcurrent, defaults.maxConcurrent);
  clamp_positive(s.discovery.workerThreads, defaults.workerThreads);
  clamp_positive(s.discovery.reachabilityTimeout_ms, defaults.reachabilityTimeout_ms);
  clamp_positive(s.discovery.refreshTimeout_ms, defaults.refreshTimeout_ms);
  if (s.discovery.scanDeadline_ms < 0) s.discovery.scanDeadline_ms = 0;

  // ---------------------------
  // [periodic]
  // ---------------------------
  if (auto p = tbl["periodic"].as_table())
  {
    if (auto v = (*p)["enabled"].value<bool>()) s.periodic.enabled = *v;
    if (auto v = (*p)["interval_minutes"].value<int64_t>())
      s.periodic.interval_minutes = static_cast<int>(*v);
  }
  clamp_positive(s.periodic.interval_minutes, Settings::Periodic{}.interval_minutes);

  return s;
}

}  // namespace sentinel::discovery::infrastructure::config
