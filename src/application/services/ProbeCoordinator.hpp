#pragma once

#include <chrono>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/services/ScanCancellation.hpp"
#include "application/services/ServerProbe.hpp"
#include "domain/DiscoveredServer.hpp"
#include "domain/ScanConfiguration.hpp"

namespace sentinel::discovery::application::services
{

// Runs one unit per candidate on a worker pool; at most `maxConcurrent` units
// are past admission at any instant. Returns after every unit has finished.
class ProbeCoordinator
{
 public:
  static constexpr int kMaxWorkerThreads = 256;

  ProbeCoordinator(const ServerProbe& probe, ports::ILogger& log, int workerThreads)
      : probe_(probe), log_(log), workerThreads_(workerThreads > 0 ? workerThreads : 1)
  {
  }

  // Results arrive in completion order. A unit that throws contributes nothing.
  std::vector<domain::DiscoveredServer> run(const std::vector<domain::ScanCandidate>& candidates,
                                            int maxConcurrent, std::chrono::milliseconds timeout,
                                            const ScanCancellation& cancel) const;

 private:
  const ServerProbe& probe_;
  ports::ILogger& log_;
  int workerThreads_;
};

}  // namespace sentinel::discovery::application::services
