#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <semaphore>

namespace sentinel::discovery::application::services
{

// Fixed-capacity admission tokens. A unit of work holds a Token while it runs;
// the Token gives its slot back when destroyed, on every exit path.
class AdmissionPool
{
 public:
  class Token
  {
   public:
    Token(Token&& o) noexcept : pool_(o.pool_) { o.pool_ = nullptr; }
    Token& operator=(Token&& o) noexcept
    {
      if (this != &o)
      {
        reset();
        pool_ = o.pool_;
        o.pool_ = nullptr;
      }
      return *this;
    }
    Token(const Token&) = delete;
    Token& operator=(const Token&) = delete;
    ~Token() { reset(); }

    void reset() noexcept
    {
      if (pool_) pool_->release();
      pool_ = nullptr;
    }

   private:
    friend class AdmissionPool;
    explicit Token(AdmissionPool* p) noexcept : pool_(p) {}
    AdmissionPool* pool_;
  };

  explicit AdmissionPool(int capacity)
      : capacity_(capacity > 0 ? capacity : 1), sem_(capacity > 0 ? capacity : 1)
  {
  }

  AdmissionPool(const AdmissionPool&) = delete;
  AdmissionPool& operator=(const AdmissionPool&) = delete;

  // Blocks the calling unit until a slot frees up.
  Token acquire()
  {
    sem_.acquire();
    in_use_.fetch_add(1, std::memory_order_acq_rel);
    return Token{this};
  }

  // Empty when no slot became free before `deadline`.
  std::optional<Token> try_acquire_until(std::chrono::steady_clock::time_point deadline)
  {
    if (!sem_.try_acquire_until(deadline)) return std::nullopt;
    in_use_.fetch_add(1, std::memory_order_acq_rel);
    return Token{this};
  }

  int capacity() const noexcept { return capacity_; }
  int in_use() const noexcept { return in_use_.load(std::memory_order_acquire); }

 private:
  void release() noexcept
  {
    in_use_.fetch_sub(1, std::memory_order_acq_rel);
    sem_.release();
  }

  const int capacity_;
  std::counting_semaphore<> sem_;
  std::atomic<int> in_use_{0};
};

}  // namespace sentinel::discovery::application::services
