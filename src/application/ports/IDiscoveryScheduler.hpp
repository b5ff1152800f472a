#pragma once

#include <chrono>
#include <cstddef>
#include <functional>

namespace sentinel::discovery::application::ports
{

// Re-runs a discovery job on a fixed interval until stopped.
struct IDiscoveryScheduler
{
  virtual ~IDiscoveryScheduler() = default;

  virtual void start(std::chrono::milliseconds interval) = 0;

  virtual void stop() = 0;

  virtual bool is_running() const = 0;

  // Completed runs since the last start(); failed runs count too.
  virtual std::size_t runs() const = 0;

  virtual void on_run(std::function<void()> job) = 0;
};

}  // namespace sentinel::discovery::application::ports
