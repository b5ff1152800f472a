#include "infrastructure/scheduler/PeriodicDiscovery_Asio.hpp"

#include <exception>
#include <string>

using sentinel::discovery::application::ports::LogLevel;

namespace sentinel::discovery::infrastructure::scheduler
{

// -------------------- ctor/dtor --------------------
PeriodicDiscovery_Asio::PeriodicDiscovery_Asio(application::ports::ILogger& log) : log_(log) {}

PeriodicDiscovery_Asio::~PeriodicDiscovery_Asio()
{
  stop();
}

// -------------------- public API --------------------
void PeriodicDiscovery_Asio::start(std::chrono::milliseconds interval)
{
  if (running_.exchange(true)) return;
  if (io_thread_.joinable()) io_thread_.join();

  interval_ = interval.count() > 0 ? interval : std::chrono::milliseconds(std::chrono::minutes(30));
  runs_ = 0;

  io_.restart();
  work_.emplace(boost::asio::make_work_guard(io_));

  log_.app(LogLevel::info, "Starting periodic discovery, interval=" +
                               std::to_string(interval_.count()) + "ms");

  boost::asio::post(strand_, [this] { schedule_next(); });
  io_thread_ = std::thread([this] { io_.run(); });
}

void PeriodicDiscovery_Asio::stop()
{
  if (!running_.exchange(false))
  {
    if (io_thread_.joinable() && io_thread_.get_id() != std::this_thread::get_id())
      io_thread_.join();
    return;
  }

  boost::asio::post(strand_,
                    [this]
                    {
                      tick_timer_.cancel();
                      if (work_) work_->reset();
                    });

  // stop() from inside the job cannot join its own thread
  if (io_thread_.joinable() && io_thread_.get_id() != std::this_thread::get_id())
    io_thread_.join();

  log_.app(LogLevel::info, "Stopped periodic discovery");
}

// -------------------- timer loop --------------------
void PeriodicDiscovery_Asio::schedule_next()
{
  if (!running_) return;

  tick_timer_.expires_after(interval_);
  tick_timer_.async_wait(
      [this](const boost::system::error_code& ec)
      {
        if (ec || !running_) return;
        run_once();
        schedule_next();
      });
}

void PeriodicDiscovery_Asio::run_once()
{
  log_.app(LogLevel::info, "Running periodic discovery");
  try
  {
    if (job_) job_();
  }
  catch (const std::exception& ex)
  {
    // keep the schedule alive
    log_.app(LogLevel::err, std::string("Periodic discovery run failed: ") + ex.what());
  }
  ++runs_;
}

}  // namespace sentinel::discovery::infrastructure::scheduler
