#include "readcache/remote.hpp"

#include "readcache/log.hpp"

namespace readcache {

CacheStatus report_unimplemented(const char *operation) {
  log_error(std::string("[cache] remote backend: ") + operation +
            " is not implemented");
  return CacheStatus::unimplemented;
}

} // namespace readcache
