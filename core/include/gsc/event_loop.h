#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <unordered_map>
#include <utility>

namespace gsc {

class Clock {
 public:
  using time_point = std::chrono::steady_clock::time_point;

  virtual ~Clock() = default;
  virtual time_point now() const = 0;
  // Virtual clocks jump straight to the next timer deadline when the loop is idle.
  virtual bool is_virtual() const { return false; }
  virtual void advance_to(time_point) {}
};

class SteadyClock final : public Clock {
 public:
  time_point now() const override { return std::chrono::steady_clock::now(); }
};

class ManualClock final : public Clock {
 public:
  ManualClock() : now_(time_point{} + std::chrono::hours(1)) {}

  time_point now() const override { return now_; }
  bool is_virtual() const override { return true; }
  void advance_to(time_point tp) override {
    if (tp > now_) now_ = tp;
  }
  void advance(std::chrono::milliseconds delta) { now_ += delta; }

 private:
  time_point now_;
};

using TimerId = uint64_t;
constexpr TimerId kInvalidTimer = 0;

// Single-threaded cooperative scheduler: posted tasks, timers and fd readiness.
// Nothing here is thread-safe; every service runs its callbacks on the loop.
class EventLoop {
 public:
  using Task = std::function<void()>;
  using FdCallback = std::function<void(uint32_t events)>;

  static constexpr uint32_t kReadable = 1u << 0;
  static constexpr uint32_t kWritable = 1u << 1;
  static constexpr uint32_t kError = 1u << 2;

  EventLoop();
  explicit EventLoop(Clock& clock);
  ~EventLoop();

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  Clock::time_point now() const { return clock_->now(); }
  bool virtual_time() const { return clock_->is_virtual(); }

  void post(Task task);
  TimerId call_later(std::chrono::milliseconds delay, Task task);
  TimerId call_every(std::chrono::milliseconds interval, Task task);
  bool cancel(TimerId id);
  bool timer_active(TimerId id) const { return timers_by_id_.count(id) > 0; }
  size_t timer_count() const { return timers_by_id_.size(); }

  void watch_fd(int fd, uint32_t events, FdCallback callback);
  void update_fd(int fd, uint32_t events);
  void unwatch_fd(int fd);

  // One scheduling round. Returns false when there was nothing to do and nothing can happen.
  bool run_once(std::chrono::milliseconds max_wait);
  void run();
  void stop() { stop_requested_ = true; }

  // Runs until pred() holds or the loop clock passes now + limit.
  bool run_until(const std::function<bool()>& pred, std::chrono::milliseconds limit);
  void run_for(std::chrono::milliseconds duration);

 private:
  struct Timer {
    Task task;
    std::chrono::milliseconds interval{0};
    bool repeating = false;
  };
  struct FdWatch {
    uint32_t events = 0;
    FdCallback callback;
  };
  using TimerKey = std::pair<Clock::time_point, TimerId>;

  TimerId add_timer(std::chrono::milliseconds delay, Task task, bool repeating);
  bool drain_posted();
  bool fire_due_timers();
  bool poll_fds(int timeout_ms);
  bool idle() const;

  SteadyClock default_clock_;
  Clock* clock_ = nullptr;
  std::deque<Task> posted_;
  std::map<TimerKey, Timer> timers_;
  std::unordered_map<TimerId, Clock::time_point> timers_by_id_;
  std::unordered_map<int, FdWatch> fds_;
  TimerId next_timer_ = 1;
  bool stop_requested_ = false;
};

} // namespace gsc
