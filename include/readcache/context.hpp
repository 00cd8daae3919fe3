#pragma once

#include "readcache/cache.hpp"
#include "readcache/memo.hpp"

#include <string>

namespace readcache {

// 16 hex digits, unique enough to correlate log lines of one request.
std::string make_request_id();

// What one request handler sees: the process-wide cache by reference, its
// own id and its own memo.
template <typename V> struct RequestContext {
  explicit RequestContext(Cache<V> &shared_cache, bool debug_perf = false)
      : cache(shared_cache), request_id(make_request_id()), memo(debug_perf) {}

  Cache<V> &cache;
  std::string request_id;
  RequestMemo<V> memo;
};

} // namespace readcache
