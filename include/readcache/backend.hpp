#pragma once

#include "readcache/cache.hpp"
#include "readcache/config.hpp"
#include "readcache/remote.hpp"
#include "readcache/store.hpp"

#include <memory>

namespace readcache {

// Builds the backend named by cfg. Call once at startup and share the
// instance by reference; a cache built per request never hits and never
// coalesces concurrent fetches.
template <typename V>
std::unique_ptr<Cache<V>> make_cache(const CacheConfig &cfg) {
  if (cfg.backend == BackendKind::remote)
    return std::make_unique<RemoteBackend<V>>();
  return std::make_unique<LruStore<V>>(cfg.store_config());
}

} // namespace readcache
