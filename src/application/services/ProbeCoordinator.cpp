#include "application/services/ProbeCoordinator.hpp"

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <exception>
#include <mutex>
#include <optional>

#include "application/services/AdmissionPool.hpp"

using sentinel::discovery::application::ports::LogLevel;

namespace sentinel::discovery::application::services
{

std::vector<domain::DiscoveredServer> ProbeCoordinator::run(
    const std::vector<domain::ScanCandidate>& candidates, int maxConcurrent,
    std::chrono::milliseconds timeout, const ScanCancellation& cancel) const
{
  std::vector<domain::DiscoveredServer> results;
  if (candidates.empty()) return results;

  if (maxConcurrent <= 0) maxConcurrent = domain::ScanConfiguration::kDefaultMaxConcurrent;

  // Enough threads for the bound to be reachable; tokens, not threads, enforce it.
  const auto threads = static_cast<std::size_t>(
      std::min({std::max(workerThreads_, maxConcurrent), kMaxWorkerThreads,
                static_cast<int>(std::min<std::size_t>(candidates.size(), kMaxWorkerThreads))}));

  AdmissionPool admission{maxConcurrent};
  std::mutex results_mu;
  boost::asio::thread_pool pool{threads};

  log_.app(LogLevel::debug, "Probing " + std::to_string(candidates.size()) + " candidates on " +
                                std::to_string(threads) + " workers, maxConcurrent=" +
                                std::to_string(maxConcurrent));

  for (const auto& candidate : candidates)
  {
    boost::asio::post(
        pool,
        [this, &candidate, &admission, &results, &results_mu, &cancel, timeout]
        {
          const auto url = candidate.url();
          try
          {
            std::optional<AdmissionPool::Token> token;
            if (const auto& dl = cancel.deadline())
              token = admission.try_acquire_until(*dl);
            else
              token.emplace(admission.acquire());

            if (!token)
            {
              log_.probe(LogLevel::debug, "[admission] " + url + " not admitted before scan deadline");
              return;
            }

            auto server = probe_.probe(candidate, timeout, cancel);
            if (!server) return;

            std::lock_guard<std::mutex> lk(results_mu);
            results.push_back(std::move(*server));
          }
          catch (const std::exception& ex)
          {
            // unit failures stay inside the unit
            log_.probe(LogLevel::err, "[unit] " + url + " aborted: " + ex.what());
          }
          catch (...)
          {
            log_.probe(LogLevel::err, "[unit] " + url + " aborted: unknown exception");
          }
        });
  }

  pool.join();
  return results;
}

}  // namespace sentinel::discovery::application::services
