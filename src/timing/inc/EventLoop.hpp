#ifndef NETMETER_TIMING_EVENT_LOOP_HPP
#define NETMETER_TIMING_EVENT_LOOP_HPP
/**
 * @file EventLoop.hpp
 * @brief Single-threaded timer and task loop (epoll + timerfd + eventfd).
 * @note Linux-only.
 *
 * The loop thread is the serialized context that owns all published state.
 * Periodic timers fire there; other threads hand work over with post().
 *
 * Cancellation contract: once cancelTimer() returns, the timer's callback
 * will not start again. If cancelTimer() is called from another thread while
 * the callback is executing, it waits for that callback to finish.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace netmeter {

namespace timing {

/// Timer handle. 0 is never a valid timer.
using TimerId = std::uint64_t;

/// Invalid timer handle returned on failure.
inline constexpr TimerId INVALID_TIMER = 0;

/* ----------------------------- EventLoop ----------------------------- */

class EventLoop {
public:
  EventLoop();
  ~EventLoop();

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  /// @brief True if the epoll and wakeup descriptors were created.
  [[nodiscard]] bool valid() const noexcept { return epollFd_ >= 0 && wakeFd_ >= 0; }

  /**
   * @brief Register a periodic timer; first expiry after one interval.
   * @param intervalMs Period in milliseconds (must be > 0).
   * @param callback Invoked on the loop thread at each expiry.
   * @return Timer handle, or INVALID_TIMER on bad interval or syscall failure.
   */
  [[nodiscard]] TimerId addTimer(std::int64_t intervalMs, std::function<void()> callback);

  /**
   * @brief Cancel a timer (see cancellation contract above).
   * @return false if the handle was unknown.
   */
  bool cancelTimer(TimerId id);

  /**
   * @brief Queue a task for execution on the loop thread. Thread-safe.
   */
  void post(std::function<void()> task);

  /// @brief Dispatch events until stop() is called.
  void run();

  /// @brief Dispatch events for at most the given duration.
  void runFor(std::chrono::milliseconds budget);

  /// @brief Make run() return. Thread-safe.
  void stop() noexcept;

  /// @brief True when called from the thread currently inside run()/runFor().
  [[nodiscard]] bool isLoopThread() const noexcept;

  /// @brief Number of registered timers.
  [[nodiscard]] std::size_t timerCount() const;

private:
  struct Timer {
    int fd{-1};
    std::function<void()> callback;
  };

  void dispatchOnce(int timeoutMs);
  void fireTimer(TimerId id);
  void drainPosted();
  void wake() noexcept;

  int epollFd_{-1};
  int wakeFd_{-1};

  mutable std::mutex mutex_; // timers_, posted_, nextId_
  std::mutex dispatchMutex_; // held while a callback or task runs
  std::unordered_map<TimerId, Timer> timers_;
  std::vector<std::function<void()>> posted_;
  TimerId nextId_{1};

  std::atomic<bool> stopRequested_{false};
  std::atomic<std::thread::id> loopThread_{};
};

} // namespace timing

} // namespace netmeter

#endif // NETMETER_TIMING_EVENT_LOOP_HPP
