#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>

namespace sentinel::discovery::application::services
{

// Shared by every unit of one scan: an optional absolute deadline plus a flag
// that cancel() flips for an in-flight scan.
class ScanCancellation
{
 public:
  using clock = std::chrono::steady_clock;

  ScanCancellation() = default;
  explicit ScanCancellation(std::optional<std::chrono::milliseconds> budget)
  {
    if (budget) deadline_ = clock::now() + *budget;
  }

  void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

  bool stop_requested() const noexcept
  {
    if (cancelled_.load(std::memory_order_acquire)) return true;
    return deadline_ && clock::now() >= *deadline_;
  }

  // Per-request deadline: now + timeout, never past the scan deadline.
  clock::time_point clamp(std::chrono::milliseconds timeout) const noexcept
  {
    const auto local = clock::now() + timeout;
    return deadline_ ? std::min(local, *deadline_) : local;
  }

  const std::optional<clock::time_point>& deadline() const noexcept { return deadline_; }

 private:
  std::optional<clock::time_point> deadline_;
  std::atomic<bool> cancelled_{false};
};

}  // namespace sentinel::discovery::application::services
