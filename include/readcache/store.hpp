#pragma once

#include "readcache/cache.hpp"
#include "readcache/log.hpp"
#include "readcache/types.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <iterator>
#include <limits>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace readcache {

struct StoreConfig {
  std::size_t max_items{500};
  std::size_t ttl_cleanup_per_tick{128};
  bool debug_perf{false};
};

/*
 * Local backend: bounded, expiring, thread-safe LRU store.
 *
 * Recency is an explicit list (front = most recently used) indexed by key.
 * Every insert also pushes a (deadline, key, generation) record onto a
 * min-heap; tick() and set() pop due records to drop expired entries
 * eagerly, get() drops them lazily. A single mutex guards the list, the
 * index, the heap, the pending-fetch table and the counters. Producers
 * passed to fetch_or_compute run outside the lock.
 *
 * Deleting or invalidating a key that has a fetch in flight detaches the
 * pending fetch: new callers start a fresh producer, and the detached
 * producer still stores its result when it finishes (last write wins).
 */
template <typename V>
class LruStore final : public Cache<V>, public IPrefixInvalidation {
public:
  using Producer = typename Cache<V>::Producer;

  explicit LruStore(StoreConfig cfg);

  std::string name() const override { return "local"; }
  std::string info() const override;

  CacheResult<V> get(const std::string &key) override;
  CacheStatus set(const std::string &key, V value,
                  std::int64_t ttl_seconds) override;
  CacheStatus del(const std::string &key) override;
  std::size_t invalidate_prefix(const std::string &prefix) override;
  CacheResult<V> fetch_or_compute(const std::string &key,
                                  std::int64_t ttl_seconds,
                                  const Producer &producer) override;

  IPrefixInvalidation *prefix_invalidation() override { return this; }

  // Bounded eager expiry; returns the number of entries removed.
  std::size_t tick();
  void clear();

  std::size_t size() const;
  std::size_t pending() const;
  std::size_t max_items() const { return cfg_.max_items; }
  StoreStats stats() const;
  // Keys from least to most recently used.
  std::vector<std::string> eviction_order() const;

private:
  struct Node {
    std::string key;
    V value;
    TimePoint inserted_at;
    TimePoint expires_at;
    std::uint64_t generation;
  };

  struct ExpiryNode {
    TimePoint deadline;
    std::string key;
    std::uint64_t generation;
    bool operator>(const ExpiryNode &other) const {
      return deadline > other.deadline;
    }
  };

  struct PendingFetch {
    std::promise<V> promise;
    std::shared_future<V> result{promise.get_future().share()};
  };

  using RecencyList = std::list<Node>;

  std::optional<V> lookup_locked(const std::string &key, TimePoint now);
  void insert_locked(const std::string &key, V value, std::int64_t ttl_seconds,
                     TimePoint now);
  void erase_locked(typename RecencyList::iterator it);
  std::size_t purge_expired_locked(TimePoint now, std::size_t limit);
  void evict_until_fit_locked(TimePoint now);
  void compact_expiry_heap_locked();
  void finish_pending_locked(const std::string &key,
                             const std::shared_ptr<PendingFetch> &pending);
  void trace(const char *event, const std::string &key) const;

  StoreConfig cfg_;
  mutable std::mutex mu_;
  RecencyList entries_;
  std::unordered_map<std::string, typename RecencyList::iterator> index_;
  std::priority_queue<ExpiryNode, std::vector<ExpiryNode>,
                      std::greater<ExpiryNode>>
      expiry_heap_;
  std::unordered_map<std::string, std::shared_ptr<PendingFetch>> pending_;
  StoreStats stats_;
  std::uint64_t generation_{0};
};

template <typename V>
LruStore<V>::LruStore(StoreConfig cfg) : cfg_(std::move(cfg)) {
  if (cfg_.max_items == 0)
    cfg_.max_items = 1;
}

template <typename V> std::string LruStore<V>::info() const {
  std::lock_guard<std::mutex> lock(mu_);
  return format_store_info(name(), entries_.size(), cfg_.max_items,
                           pending_.size(), stats_);
}

template <typename V> CacheResult<V> LruStore<V>::get(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  return {CacheStatus::ok, lookup_locked(key, Clock::now())};
}

template <typename V>
CacheStatus LruStore<V>::set(const std::string &key, V value,
                             std::int64_t ttl_seconds) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = Clock::now();
  purge_expired_locked(now, cfg_.ttl_cleanup_per_tick);
  insert_locked(key, std::move(value), ttl_seconds, now);
  return CacheStatus::ok;
}

template <typename V> CacheStatus LruStore<V>::del(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = index_.find(key);
  if (it != index_.end())
    erase_locked(it->second);
  pending_.erase(key);
  trace("delete", key);
  return CacheStatus::ok;
}

template <typename V>
std::size_t LruStore<V>::invalidate_prefix(const std::string &prefix) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = Clock::now();
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    auto next = std::next(it);
    if (it->key.starts_with(prefix)) {
      // Only live entries count as invalidated.
      if (now >= it->expires_at)
        ++stats_.expirations;
      else
        ++removed;
      erase_locked(it);
    }
    it = next;
  }
  std::erase_if(pending_, [&prefix](const auto &item) {
    return item.first.starts_with(prefix);
  });
  stats_.invalidated += removed;
  trace("invalidate", prefix);
  return removed;
}

template <typename V>
CacheResult<V> LruStore<V>::fetch_or_compute(const std::string &key,
                                             std::int64_t ttl_seconds,
                                             const Producer &producer) {
  std::shared_ptr<PendingFetch> pending;
  bool leader = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto cached = lookup_locked(key, Clock::now());
    if (cached.has_value())
      return {CacheStatus::ok, std::move(cached)};
    auto it = pending_.find(key);
    if (it != pending_.end()) {
      pending = it->second;
      ++stats_.coalesced_waits;
    } else {
      pending = std::make_shared<PendingFetch>();
      pending_.emplace(key, pending);
      ++stats_.producer_runs;
      leader = true;
    }
  }

  if (!leader) {
    // Rethrows the producer's exception if the leader failed.
    return {CacheStatus::ok, pending->result.get()};
  }

  std::optional<V> produced;
  try {
    produced.emplace(producer());
  } catch (...) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++stats_.producer_failures;
      finish_pending_locked(key, pending);
      trace("producer-failed", key);
    }
    pending->promise.set_exception(std::current_exception());
    throw;
  }

  try {
    {
      std::lock_guard<std::mutex> lock(mu_);
      insert_locked(key, *produced, ttl_seconds, Clock::now());
      finish_pending_locked(key, pending);
    }
    pending->promise.set_value(*produced);
  } catch (...) {
    // Waiters must never block on a fetch that can no longer complete.
    {
      std::lock_guard<std::mutex> lock(mu_);
      finish_pending_locked(key, pending);
    }
    pending->promise.set_exception(std::current_exception());
    throw;
  }
  return {CacheStatus::ok, std::move(produced)};
}

template <typename V> std::size_t LruStore<V>::tick() {
  std::lock_guard<std::mutex> lock(mu_);
  return purge_expired_locked(Clock::now(), cfg_.ttl_cleanup_per_tick);
}

template <typename V> void LruStore<V>::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
  index_.clear();
  expiry_heap_ = decltype(expiry_heap_)();
  pending_.clear();
}

template <typename V> std::size_t LruStore<V>::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

template <typename V> std::size_t LruStore<V>::pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_.size();
}

template <typename V> StoreStats LruStore<V>::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

template <typename V>
std::vector<std::string> LruStore<V>::eviction_order() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (auto it = entries_.rbegin(); it != entries_.rend(); ++it)
    out.push_back(it->key);
  return out;
}

template <typename V>
std::optional<V> LruStore<V>::lookup_locked(const std::string &key,
                                            TimePoint now) {
  auto it = index_.find(key);
  if (it == index_.end()) {
    ++stats_.misses;
    trace("miss", key);
    return std::nullopt;
  }
  auto node = it->second;
  if (now >= node->expires_at) {
    erase_locked(node);
    ++stats_.expirations;
    ++stats_.misses;
    trace("expire", key);
    return std::nullopt;
  }
  entries_.splice(entries_.begin(), entries_, node);
  ++stats_.hits;
  trace("hit", key);
  return node->value;
}

template <typename V>
void LruStore<V>::insert_locked(const std::string &key, V value,
                                std::int64_t ttl_seconds, TimePoint now) {
  auto existing = index_.find(key);
  if (existing != index_.end())
    erase_locked(existing->second);
  if (ttl_seconds <= 0)
    return;

  const auto ttl = std::chrono::seconds(std::min(ttl_seconds, kMaxTtlSeconds));
  const auto gen = ++generation_;
  entries_.push_front(Node{key, std::move(value), now, now + ttl, gen});
  index_[key] = entries_.begin();
  expiry_heap_.push({now + ttl, key, gen});
  trace("set", key);

  evict_until_fit_locked(now);
  compact_expiry_heap_locked();
}

template <typename V>
void LruStore<V>::erase_locked(typename RecencyList::iterator it) {
  index_.erase(it->key);
  entries_.erase(it);
}

template <typename V>
std::size_t LruStore<V>::purge_expired_locked(TimePoint now,
                                              std::size_t limit) {
  std::size_t cleaned = 0;
  while (!expiry_heap_.empty() && cleaned < limit) {
    const auto &top = expiry_heap_.top();
    if (top.deadline > now)
      break;
    const auto key = top.key;
    const auto gen = top.generation;
    expiry_heap_.pop();
    auto it = index_.find(key);
    if (it == index_.end() || it->second->generation != gen)
      continue;
    erase_locked(it->second);
    ++stats_.expirations;
    ++cleaned;
    trace("expire", key);
  }
  return cleaned;
}

template <typename V> void LruStore<V>::evict_until_fit_locked(TimePoint now) {
  if (entries_.size() <= cfg_.max_items)
    return;
  // Expired entries give up their slot before any live entry is evicted.
  purge_expired_locked(now, std::numeric_limits<std::size_t>::max());
  while (entries_.size() > cfg_.max_items) {
    auto victim = std::prev(entries_.end());
    trace("evict", victim->key);
    erase_locked(victim);
    ++stats_.evictions;
  }
}

template <typename V> void LruStore<V>::compact_expiry_heap_locked() {
  if (expiry_heap_.size() <= 4 * entries_.size() + 64)
    return;
  std::vector<ExpiryNode> live;
  live.reserve(entries_.size());
  for (const auto &node : entries_)
    live.push_back({node.expires_at, node.key, node.generation});
  expiry_heap_ = decltype(expiry_heap_)(std::greater<ExpiryNode>(),
                                        std::move(live));
}

template <typename V>
void LruStore<V>::finish_pending_locked(
    const std::string &key, const std::shared_ptr<PendingFetch> &pending) {
  auto it = pending_.find(key);
  if (it != pending_.end() && it->second == pending)
    pending_.erase(it);
}

template <typename V>
void LruStore<V>::trace(const char *event, const std::string &key) const {
  if (!cfg_.debug_perf)
    return;
  log_line(std::string("[cache] ") + event + " key=" + key);
}

} // namespace readcache
