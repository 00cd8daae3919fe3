#pragma once

#include "readcache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace readcache {

// Optional capability: bulk removal of every key that starts with a literal
// prefix. Backends that cannot enumerate keys do not expose it.
class IPrefixInvalidation {
public:
  virtual ~IPrefixInvalidation() = default;
  virtual std::size_t invalidate_prefix(const std::string &prefix) = 0;
};

// The value-independent half of the contract. Invalidation code and the
// backend selector only need this.
class CacheBackend {
public:
  virtual ~CacheBackend() = default;
  virtual std::string name() const = 0;
  virtual std::string info() const = 0;
  virtual CacheStatus del(const std::string &key) = 0;

  // nullptr when the backend does not support prefix invalidation.
  virtual IPrefixInvalidation *prefix_invalidation() { return nullptr; }
  bool supports_prefix_invalidation() { return prefix_invalidation() != nullptr; }
};

/*
 * Capability contract every backend satisfies.
 *
 * get       hit returns a copy of the value; a miss is ok with no value.
 * set       replaces unconditionally; ttl_seconds <= 0 leaves the key absent.
 * del       removing a missing key is a no-op.
 * fetch_or_compute
 *           returns the cached value or runs producer at most once per key
 *           across concurrent callers. An exception thrown by producer is
 *           rethrown to every caller waiting on that run and nothing is
 *           cached.
 *
 * A backend that is not wired reports CacheStatus::unimplemented from every
 * operation instead of behaving like an always-miss cache.
 */
template <typename V> class Cache : public CacheBackend {
public:
  using value_type = V;
  using Producer = std::function<V()>;

  virtual CacheResult<V> get(const std::string &key) = 0;
  virtual CacheStatus set(const std::string &key, V value,
                          std::int64_t ttl_seconds) = 0;
  virtual CacheResult<V> fetch_or_compute(const std::string &key,
                                          std::int64_t ttl_seconds,
                                          const Producer &producer) = 0;
};

} // namespace readcache
