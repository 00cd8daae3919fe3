#pragma once

#include "readcache/log.hpp"

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace readcache {

// Per-request memoization. Duplicate reads inside one request share the
// first call's result (or its in-flight future). A failed call is forgotten
// before the exception reaches the callers, so a retry runs fn again.
// Nothing expires and nothing is evicted; the memo dies with the request.
template <typename V> class RequestMemo {
public:
  explicit RequestMemo(bool debug_perf = false) : debug_perf_(debug_perf) {}

  V memoize(const std::string &key, const std::function<V()> &fn);

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return slots_.size();
  }

private:
  struct Slot {
    std::promise<V> promise;
    std::shared_future<V> result{promise.get_future().share()};
  };

  void trace(const char *event, const std::string &key) const {
    if (debug_perf_)
      log_line(std::string("[memo] ") + event + " key=" + key);
  }

  bool debug_perf_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

template <typename V>
V RequestMemo<V>::memoize(const std::string &key,
                          const std::function<V()> &fn) {
  std::shared_ptr<Slot> slot;
  bool owner = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = slots_.find(key);
    if (it != slots_.end()) {
      slot = it->second;
      trace("hit", key);
    } else {
      slot = std::make_shared<Slot>();
      slots_.emplace(key, slot);
      owner = true;
      trace("miss", key);
    }
  }
  if (!owner)
    return slot->result.get();

  try {
    slot->promise.set_value(fn());
  } catch (...) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto it = slots_.find(key);
      if (it != slots_.end() && it->second == slot)
        slots_.erase(it);
      trace("evict-on-error", key);
    }
    slot->promise.set_exception(std::current_exception());
    throw;
  }
  return slot->result.get();
}

} // namespace readcache
