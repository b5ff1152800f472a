#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "domain/DiscoveredServer.hpp"

namespace sentinel::discovery::application::services
{

// Latest record per server URL. Every write is a whole-record replacement;
// every read hands out copies.
class DiscoveryCache
{
 public:
  void merge(const std::vector<domain::DiscoveredServer>& batch)
  {
    std::unique_lock lk(mu_);
    for (const auto& s : batch) servers_.insert_or_assign(s.url, s);
  }

  void upsert(const domain::DiscoveredServer& s)
  {
    std::unique_lock lk(mu_);
    servers_.insert_or_assign(s.url, s);
  }

  std::vector<domain::DiscoveredServer> snapshot() const
  {
    std::shared_lock lk(mu_);
    std::vector<domain::DiscoveredServer> out;
    out.reserve(servers_.size());
    for (const auto& [url, s] : servers_) out.push_back(s);
    return out;
  }

  std::optional<domain::DiscoveredServer> find(const std::string& url) const
  {
    std::shared_lock lk(mu_);
    auto it = servers_.find(url);
    if (it == servers_.end()) return std::nullopt;
    return it->second;
  }

  std::size_t size() const
  {
    std::shared_lock lk(mu_);
    return servers_.size();
  }

 private:
  mutable std::shared_mutex mu_;
  std::map<std::string, domain::DiscoveredServer> servers_;
};

}  // namespace sentinel::discovery::application::services
