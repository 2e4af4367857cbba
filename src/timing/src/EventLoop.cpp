/**
 * @file EventLoop.cpp
 * @brief epoll-driven timer loop.
 */

#include "src/timing/inc/EventLoop.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>

namespace netmeter {

namespace timing {

namespace {

/* ----------------------------- Constants ----------------------------- */

constexpr int MAX_EVENTS = 16;

/// epoll user data for the wakeup eventfd (timer ids start at 1).
constexpr std::uint64_t WAKE_TAG = 0;

} // namespace

/* ----------------------------- Lifecycle ----------------------------- */

EventLoop::EventLoop() {
  epollFd_ = ::epoll_create1(EPOLL_CLOEXEC);
  if (epollFd_ < 0) {
    SPDLOG_ERROR("epoll_create1 failed: {}", std::strerror(errno));
    return;
  }

  wakeFd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wakeFd_ < 0) {
    SPDLOG_ERROR("eventfd failed: {}", std::strerror(errno));
    return;
  }

  struct epoll_event ev{};
  ev.events = EPOLLIN;
  ev.data.u64 = WAKE_TAG;
  if (::epoll_ctl(epollFd_, EPOLL_CTL_ADD, wakeFd_, &ev) != 0) {
    SPDLOG_ERROR("epoll_ctl(eventfd) failed: {}", std::strerror(errno));
    ::close(wakeFd_);
    wakeFd_ = -1;
  }
}

EventLoop::~EventLoop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : timers_) {
      ::close(kv.second.fd);
    }
    timers_.clear();
    posted_.clear();
  }
  if (wakeFd_ >= 0) {
    ::close(wakeFd_);
  }
  if (epollFd_ >= 0) {
    ::close(epollFd_);
  }
}

/* ----------------------------- Timers ----------------------------- */

TimerId EventLoop::addTimer(std::int64_t intervalMs, std::function<void()> callback) {
  if (intervalMs <= 0 || !callback || !valid()) {
    return INVALID_TIMER;
  }

  const int TFD = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
  if (TFD < 0) {
    SPDLOG_ERROR("timerfd_create failed: {}", std::strerror(errno));
    return INVALID_TIMER;
  }

  struct timespec ts{};
  ts.tv_sec = static_cast<time_t>(intervalMs / 1000);
  ts.tv_nsec = static_cast<long>((intervalMs % 1000) * 1'000'000);

  struct itimerspec its{};
  its.it_interval = ts; // periodic
  its.it_value = ts;    // first expiry

  if (::timerfd_settime(TFD, 0, &its, nullptr) != 0) {
    SPDLOG_ERROR("timerfd_settime failed: {}", std::strerror(errno));
    ::close(TFD);
    return INVALID_TIMER;
  }

  TimerId id = INVALID_TIMER;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = nextId_++;
    timers_.emplace(id, Timer{TFD, std::move(callback)});
  }

  struct epoll_event ev{};
  ev.events = EPOLLIN;
  ev.data.u64 = id;
  if (::epoll_ctl(epollFd_, EPOLL_CTL_ADD, TFD, &ev) != 0) {
    SPDLOG_ERROR("epoll_ctl(timerfd) failed: {}", std::strerror(errno));
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.erase(id);
    ::close(TFD);
    return INVALID_TIMER;
  }

  return id;
}

bool EventLoop::cancelTimer(TimerId id) {
  int fd = -1;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto IT = timers_.find(id);
    if (IT == timers_.end()) {
      return false;
    }
    fd = IT->second.fd;
    timers_.erase(IT);
  }

  if (::epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr) != 0) {
    SPDLOG_DEBUG("epoll_ctl(DEL) failed: {}", std::strerror(errno));
  }
  ::close(fd);

  // A callback already executing on the loop thread is allowed to finish.
  if (!isLoopThread()) {
    std::lock_guard<std::mutex> wait(dispatchMutex_);
  }
  return true;
}

std::size_t EventLoop::timerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timers_.size();
}

/* ----------------------------- Tasks ----------------------------- */

void EventLoop::post(std::function<void()> task) {
  if (!task) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    posted_.push_back(std::move(task));
  }
  wake();
}

void EventLoop::wake() noexcept {
  if (wakeFd_ < 0) {
    return;
  }
  const std::uint64_t ONE = 1;
  // EAGAIN means the counter is already non-zero, so the loop will wake.
  if (::write(wakeFd_, &ONE, sizeof(ONE)) < 0 && errno != EAGAIN) {
    SPDLOG_WARN("eventfd write failed: {}", std::strerror(errno));
  }
}

void EventLoop::drainPosted() {
  std::vector<std::function<void()>> tasks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks.swap(posted_);
  }
  for (auto& task : tasks) {
    std::lock_guard<std::mutex> running(dispatchMutex_);
    task();
  }
}

/* ----------------------------- Dispatch ----------------------------- */

void EventLoop::fireTimer(TimerId id) {
  std::lock_guard<std::mutex> running(dispatchMutex_);

  std::function<void()> callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto IT = timers_.find(id);
    if (IT == timers_.end()) {
      return; // cancelled after epoll_wait returned
    }

    std::uint64_t expirations = 0;
    if (::read(IT->second.fd, &expirations, sizeof(expirations)) !=
        static_cast<ssize_t>(sizeof(expirations))) {
      return; // spurious wakeup
    }
    callback = IT->second.callback;
  }

  callback();
}

void EventLoop::dispatchOnce(int timeoutMs) {
  struct epoll_event events[MAX_EVENTS];
  const int N = ::epoll_wait(epollFd_, events, MAX_EVENTS, timeoutMs);
  if (N < 0) {
    if (errno != EINTR) {
      SPDLOG_ERROR("epoll_wait failed: {}", std::strerror(errno));
    }
    return;
  }

  for (int i = 0; i < N; ++i) {
    if (events[i].data.u64 == WAKE_TAG) {
      std::uint64_t count = 0;
      if (::read(wakeFd_, &count, sizeof(count)) < 0 && errno != EAGAIN) {
        SPDLOG_WARN("eventfd read failed: {}", std::strerror(errno));
      }
      continue;
    }
    fireTimer(events[i].data.u64);
  }

  drainPosted();
}

void EventLoop::run() {
  if (!valid()) {
    return;
  }

  loopThread_.store(std::this_thread::get_id());
  drainPosted();
  while (!stopRequested_.load()) {
    dispatchOnce(-1);
  }
  stopRequested_.store(false);
  loopThread_.store(std::thread::id{});
}

void EventLoop::runFor(std::chrono::milliseconds budget) {
  if (!valid()) {
    return;
  }

  using std::chrono::steady_clock;
  const auto DEADLINE = steady_clock::now() + budget;

  loopThread_.store(std::this_thread::get_id());
  drainPosted();
  while (!stopRequested_.load()) {
    const auto NOW = steady_clock::now();
    if (NOW >= DEADLINE) {
      break;
    }
    const auto REMAINING =
        std::chrono::duration_cast<std::chrono::milliseconds>(DEADLINE - NOW).count();
    dispatchOnce(static_cast<int>(REMAINING > 0 ? REMAINING : 1));
  }
  stopRequested_.store(false);
  loopThread_.store(std::thread::id{});
}

void EventLoop::stop() noexcept {
  stopRequested_.store(true);
  wake();
}

bool EventLoop::isLoopThread() const noexcept {
  return loopThread_.load() == std::this_thread::get_id();
}

} // namespace timing

} // namespace netmeter
