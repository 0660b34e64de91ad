#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gsc {

using SubscriptionId = uint64_t;

class EventBus {
 public:
  template <typename T>
  SubscriptionId subscribe(std::function<void(const T&)> handler) {
    const SubscriptionId id = next_id_++;
    auto& bucket = handlers_[std::type_index(typeid(T))];
    bucket.push_back({id, [handler](const std::any& ev) {
      handler(std::any_cast<const T&>(ev));
    }});
    return id;
  }

  bool unsubscribe(SubscriptionId id) {
    for (auto& entry : handlers_) {
      auto& bucket = entry.second;
      for (auto it = bucket.begin(); it != bucket.end(); ++it) {
        if (it->id == id) {
          bucket.erase(it);
          return true;
        }
      }
    }
    return false;
  }

  // Handlers added or removed while emitting take effect on the next emit.
  template <typename T>
  void emit(const T& event) {
    auto it = handlers_.find(std::type_index(typeid(T)));
    if (it == handlers_.end() || it->second.empty()) {
      return;
    }
    const auto snapshot = it->second;
    const std::any wrapped(event);
    for (const auto& handler : snapshot) {
      handler.fn(wrapped);
    }
  }

  template <typename T>
  size_t subscriber_count() const {
    auto it = handlers_.find(std::type_index(typeid(T)));
    return it == handlers_.end() ? 0 : it->second.size();
  }

 private:
  struct Handler {
    SubscriptionId id = 0;
    std::function<void(const std::any&)> fn;
  };

  std::unordered_map<std::type_index, std::vector<Handler>> handlers_;
  SubscriptionId next_id_ = 1;
};

} // namespace gsc
