#include "readcache/types.hpp"

#include <sstream>

namespace readcache {

const char *status_name(CacheStatus status) {
  switch (status) {
  case CacheStatus::ok:
    return "ok";
  case CacheStatus::unimplemented:
    return "unimplemented";
  case CacheStatus::unsupported:
    return "unsupported";
  }
  return "unknown";
}

std::string format_store_info(const std::string &backend, std::size_t keys,
                              std::size_t max_items, std::size_t pending,
                              const StoreStats &stats) {
  std::ostringstream os;
  os << "backend:" << backend << "\n";
  os << "keys:" << keys << "\n";
  os << "max_items:" << max_items << "\n";
  os << "pending_fetches:" << pending << "\n";
  os << "hits:" << stats.hits << "\n";
  os << "misses:" << stats.misses << "\n";
  os << "evictions:" << stats.evictions << "\n";
  os << "expirations:" << stats.expirations << "\n";
  os << "invalidated:" << stats.invalidated << "\n";
  os << "producer_runs:" << stats.producer_runs << "\n";
  os << "producer_failures:" << stats.producer_failures << "\n";
  os << "coalesced_waits:" << stats.coalesced_waits << "\n";
  const auto lookups = stats.hits + stats.misses;
  os << "hit_rate:"
     << (lookups == 0 ? 0.0
                      : static_cast<double>(stats.hits) /
                            static_cast<double>(lookups))
     << "\n";
  return os.str();
}

} // namespace readcache
