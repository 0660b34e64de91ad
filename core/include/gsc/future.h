#pragma once

#include "gsc/error.h"
#include "gsc/event_loop.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace gsc {

// Value type for futures that only signal completion.
struct Unit {};

template <typename T>
struct Outcome {
  std::optional<T> value;
  Error error;

  bool ok() const { return value.has_value(); }
};

namespace detail {
template <typename T>
struct FutureState {
  bool settled = false;
  Outcome<T> outcome;
  std::vector<std::function<void(const Outcome<T>&)>> continuations;

  bool settle(Outcome<T> result) {
    if (settled) {
      return false;
    }
    settled = true;
    outcome = std::move(result);
    auto pending = std::move(continuations);
    continuations.clear();
    for (auto& fn : pending) {
      fn(outcome);
    }
    return true;
  }
};
} // namespace detail

// Settle-once result shared by any number of observers. Continuations run
// synchronously on the thread that settles (always the loop thread).
template <typename T>
class Future {
 public:
  Future() = default;
  explicit Future(std::shared_ptr<detail::FutureState<T>> state) : state_(std::move(state)) {}

  bool valid() const { return state_ != nullptr; }
  bool ready() const { return state_ && state_->settled; }
  const Outcome<T>& outcome() const { return state_->outcome; }

  void then(std::function<void(const Outcome<T>&)> fn) const {
    if (!state_) {
      return;
    }
    if (state_->settled) {
      fn(state_->outcome);
      return;
    }
    state_->continuations.push_back(std::move(fn));
  }

 private:
  std::shared_ptr<detail::FutureState<T>> state_;
};

template <typename T>
class Promise {
 public:
  Promise() : state_(std::make_shared<detail::FutureState<T>>()) {}

  Future<T> future() const { return Future<T>(state_); }
  bool settled() const { return state_->settled; }

  bool resolve(T value) const {
    Outcome<T> out;
    out.value = std::move(value);
    return state_->settle(std::move(out));
  }

  bool reject(Error error) const {
    Outcome<T> out;
    out.error = std::move(error);
    return state_->settle(std::move(out));
  }

  bool settle(const Outcome<T>& outcome) const {
    return state_->settle(outcome);
  }

 private:
  std::shared_ptr<detail::FutureState<T>> state_;
};

template <typename T>
Future<T> make_ready_future(T value) {
  Promise<T> promise;
  promise.resolve(std::move(value));
  return promise.future();
}

template <typename T>
Future<T> make_failed_future(Error error) {
  Promise<T> promise;
  promise.reject(std::move(error));
  return promise.future();
}

// Races future against a timer; the timer loses once the future settles.
template <typename T>
Future<T> with_timeout(EventLoop& loop, const Future<T>& future, std::chrono::milliseconds timeout,
                       Error timeout_error) {
  Promise<T> promise;
  EventLoop* loop_ptr = &loop;
  const TimerId timer = loop.call_later(timeout, [promise, timeout_error] {
    promise.reject(timeout_error);
  });
  future.then([promise, loop_ptr, timer](const Outcome<T>& outcome) {
    loop_ptr->cancel(timer);
    promise.settle(outcome);
  });
  return promise.future();
}

inline Future<Unit> sleep_for(EventLoop& loop, std::chrono::milliseconds delay) {
  Promise<Unit> promise;
  loop.call_later(delay, [promise] { promise.resolve(Unit{}); });
  return promise.future();
}

} // namespace gsc
