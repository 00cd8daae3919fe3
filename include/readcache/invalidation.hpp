#pragma once

#include "readcache/cache.hpp"
#include "readcache/types.hpp"

#include <cstddef>
#include <string>

namespace readcache {

enum class InvalidationScope {
  controls,
  faqs,
};

const char *scope_name(InvalidationScope scope);
const char *scope_prefix(InvalidationScope scope);

struct InvalidationResult {
  CacheStatus status{CacheStatus::ok};
  InvalidationScope scope{InvalidationScope::controls};
  std::string prefix;
  std::size_t removed{0};
  std::string request_id;

  bool ok() const { return status == CacheStatus::ok; }
};

// Clears every cached list read of one entity. Called by mutation handlers
// after the underlying write succeeded. A backend without prefix
// invalidation yields CacheStatus::unsupported.
InvalidationResult invalidate_scope(CacheBackend &cache,
                                    InvalidationScope scope,
                                    const std::string &request_id = "-");
InvalidationResult invalidate_controls(CacheBackend &cache,
                                       const std::string &request_id = "-");
InvalidationResult invalidate_faqs(CacheBackend &cache,
                                   const std::string &request_id = "-");

} // namespace readcache
