#include "readcache/invalidation.hpp"

#include "readcache/keys.hpp"
#include "readcache/log.hpp"

#include <sstream>

namespace readcache {

const char *scope_name(InvalidationScope scope) {
  switch (scope) {
  case InvalidationScope::controls:
    return "controls";
  case InvalidationScope::faqs:
    return "faqs";
  }
  return "unknown";
}

const char *scope_prefix(InvalidationScope scope) {
  switch (scope) {
  case InvalidationScope::controls:
    return kControlsListPrefix;
  case InvalidationScope::faqs:
    return kFaqsListPrefix;
  }
  return kControlsListPrefix;
}

InvalidationResult invalidate_scope(CacheBackend &cache,
                                    InvalidationScope scope,
                                    const std::string &request_id) {
  InvalidationResult result;
  result.scope = scope;
  result.prefix = scope_prefix(scope);
  result.request_id = request_id;

  auto *capability = cache.prefix_invalidation();
  if (capability == nullptr)
    result.status = CacheStatus::unsupported;
  else
    result.removed = capability->invalidate_prefix(result.prefix);

  std::ostringstream os;
  os << "[cache] requestId=" << request_id
     << " invalidate scope=" << scope_name(scope)
     << " prefix=" << result.prefix << " backend=" << cache.name()
     << " status=" << status_name(result.status)
     << " removed=" << result.removed;
  if (result.ok())
    log_line(os.str());
  else
    log_error(os.str());
  return result;
}

InvalidationResult invalidate_controls(CacheBackend &cache,
                                       const std::string &request_id) {
  return invalidate_scope(cache, InvalidationScope::controls, request_id);
}

InvalidationResult invalidate_faqs(CacheBackend &cache,
                                   const std::string &request_id) {
  return invalidate_scope(cache, InvalidationScope::faqs, request_id);
}

} // namespace readcache
