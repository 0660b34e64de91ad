#include "gsc/event_loop.h"

#include "gsc/log.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include <poll.h>

namespace gsc {

namespace {
constexpr std::chrono::milliseconds kMinRepeat{1};

int to_poll_events(uint32_t events) {
  int out = 0;
  if (events & EventLoop::kReadable) out |= POLLIN;
  if (events & EventLoop::kWritable) out |= POLLOUT;
  return out;
}
} // namespace

EventLoop::EventLoop() : clock_(&default_clock_) {}

EventLoop::EventLoop(Clock& clock) : clock_(&clock) {}

EventLoop::~EventLoop() = default;

void EventLoop::post(Task task) {
  posted_.push_back(std::move(task));
}

TimerId EventLoop::call_later(std::chrono::milliseconds delay, Task task) {
  return add_timer(delay, std::move(task), false);
}

TimerId EventLoop::call_every(std::chrono::milliseconds interval, Task task) {
  return add_timer(std::max(interval, kMinRepeat), std::move(task), true);
}

TimerId EventLoop::add_timer(std::chrono::milliseconds delay, Task task, bool repeating) {
  const TimerId id = next_timer_++;
  const auto deadline = now() + std::max(delay, std::chrono::milliseconds(0));
  Timer timer;
  timer.task = std::move(task);
  timer.interval = delay;
  timer.repeating = repeating;
  timers_.emplace(TimerKey{deadline, id}, std::move(timer));
  timers_by_id_[id] = deadline;
  return id;
}

bool EventLoop::cancel(TimerId id) {
  auto it = timers_by_id_.find(id);
  if (it == timers_by_id_.end()) {
    return false;
  }
  timers_.erase(TimerKey{it->second, id});
  timers_by_id_.erase(it);
  return true;
}

void EventLoop::watch_fd(int fd, uint32_t events, FdCallback callback) {
  FdWatch watch;
  watch.events = events;
  watch.callback = std::move(callback);
  fds_[fd] = std::move(watch);
}

void EventLoop::update_fd(int fd, uint32_t events) {
  auto it = fds_.find(fd);
  if (it != fds_.end()) {
    it->second.events = events;
  }
}

void EventLoop::unwatch_fd(int fd) {
  fds_.erase(fd);
}

bool EventLoop::drain_posted() {
  if (posted_.empty()) {
    return false;
  }
  std::deque<Task> batch;
  batch.swap(posted_);
  for (auto& task : batch) {
    task();
  }
  return true;
}

bool EventLoop::fire_due_timers() {
  const auto current = now();
  std::vector<TimerKey> due;
  for (const auto& entry : timers_) {
    if (entry.first.first > current) break;
    due.push_back(entry.first);
  }
  for (const auto& key : due) {
    auto it = timers_.find(key);
    if (it == timers_.end()) {
      continue;
    }
    Timer timer = std::move(it->second);
    timers_.erase(it);
    timers_by_id_.erase(key.second);
    Task task = timer.task;
    if (timer.repeating) {
      const auto next = std::max(key.first + timer.interval, current + kMinRepeat);
      timers_.emplace(TimerKey{next, key.second}, std::move(timer));
      timers_by_id_[key.second] = next;
    }
    task();
  }
  return !due.empty();
}

bool EventLoop::poll_fds(int timeout_ms) {
  std::vector<pollfd> pfds;
  pfds.reserve(fds_.size());
  for (const auto& entry : fds_) {
    pollfd p{};
    p.fd = entry.first;
    p.events = static_cast<short>(to_poll_events(entry.second.events));
    pfds.push_back(p);
  }
  const int rc = ::poll(pfds.empty() ? nullptr : pfds.data(), pfds.size(), timeout_ms);
  if (rc < 0) {
    if (errno != EINTR) {
      log::warn(std::string("event loop poll failed: ") + std::strerror(errno));
    }
    return false;
  }
  if (rc == 0) {
    return false;
  }
  for (const auto& p : pfds) {
    if (p.revents == 0) continue;
    auto it = fds_.find(p.fd);
    if (it == fds_.end()) continue;
    uint32_t events = 0;
    if (p.revents & POLLIN) events |= kReadable;
    if (p.revents & POLLOUT) events |= kWritable;
    if (p.revents & (POLLERR | POLLHUP | POLLNVAL)) events |= kError;
    FdCallback callback = it->second.callback;
    callback(events);
  }
  return true;
}

bool EventLoop::idle() const {
  return posted_.empty() && timers_.empty() && fds_.empty();
}

bool EventLoop::run_once(std::chrono::milliseconds max_wait) {
  bool did_work = drain_posted();
  did_work = fire_due_timers() || did_work;
  if (!posted_.empty()) {
    return true;
  }

  const auto current = now();
  std::chrono::milliseconds wait = did_work ? std::chrono::milliseconds(0) : max_wait;
  if (!timers_.empty()) {
    const auto next = timers_.begin()->first.first;
    const auto until_next = std::chrono::duration_cast<std::chrono::milliseconds>(next - current);
    wait = std::min(wait, std::max(until_next, std::chrono::milliseconds(0)));
  }

  if (clock_->is_virtual()) {
    if (!fds_.empty() && poll_fds(0)) {
      return true;
    }
    if (did_work) {
      return true;
    }
    clock_->advance_to(current + wait);
    return !idle();
  }

  if (fds_.empty()) {
    if (wait.count() > 0) {
      poll_fds(static_cast<int>(wait.count()));
    }
  } else {
    did_work = poll_fds(static_cast<int>(wait.count())) || did_work;
  }
  return did_work || !idle();
}

void EventLoop::run() {
  stop_requested_ = false;
  while (!stop_requested_) {
    if (!run_once(std::chrono::milliseconds(250))) {
      break;
    }
  }
}

bool EventLoop::run_until(const std::function<bool()>& pred, std::chrono::milliseconds limit) {
  const auto deadline = now() + limit;
  while (!pred()) {
    const auto current = now();
    if (current >= deadline) {
      return pred();
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - current);
    if (remaining.count() < 1) {
      remaining = std::chrono::milliseconds(1);
    }
    if (!run_once(remaining)) {
      clock_->advance_to(deadline);
      return pred();
    }
  }
  return true;
}

void EventLoop::run_for(std::chrono::milliseconds duration) {
  run_until([] { return false; }, duration);
}

} // namespace gsc
