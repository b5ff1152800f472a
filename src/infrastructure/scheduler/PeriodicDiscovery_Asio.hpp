#pragma once

#include <atomic>
#include <utility>  // boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <thread>

#include "application/ports/IDiscoveryScheduler.hpp"
#include "application/ports/ILogger.hpp"

namespace sentinel::discovery::infrastructure::scheduler
{

// Fixed-interval runner on its own io thread. The job runs on that thread, so
// a slow scan delays the next tick rather than overlapping with it.
class PeriodicDiscovery_Asio final
    : public sentinel::discovery::application::ports::IDiscoveryScheduler
{
 public:
  explicit PeriodicDiscovery_Asio(sentinel::discovery::application::ports::ILogger& log);
  ~PeriodicDiscovery_Asio() override;

  // IDiscoveryScheduler
  void start(std::chrono::milliseconds interval) override;
  void stop() override;
  bool is_running() const override { return running_.load(); }
  std::size_t runs() const override { return runs_.load(); }
  void on_run(std::function<void()> job) override { job_ = std::move(job); }

 private:
  void schedule_next();
  void run_once();

  sentinel::discovery::application::ports::ILogger& log_;

  // asio
  boost::asio::io_context io_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_{io_.get_executor()};
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  boost::asio::steady_timer tick_timer_{strand_};

  // state
  std::chrono::milliseconds interval_{std::chrono::minutes(30)};
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> runs_{0};

  std::function<void()> job_;
};

}  // namespace sentinel::discovery::infrastructure::scheduler
