#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace readcache {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Longest TTL the store honours; larger values are clamped.
constexpr std::int64_t kMaxTtlSeconds = 10LL * 365 * 24 * 60 * 60;

enum class CacheStatus {
  ok,
  unimplemented,
  unsupported,
};

const char *status_name(CacheStatus status);

template <typename T> struct CacheResult {
  CacheStatus status{CacheStatus::ok};
  std::optional<T> value;

  bool ok() const { return status == CacheStatus::ok; }
  bool hit() const { return ok() && value.has_value(); }
};

struct StoreStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
  std::uint64_t invalidated{0};
  std::uint64_t producer_runs{0};
  std::uint64_t producer_failures{0};
  std::uint64_t coalesced_waits{0};
};

std::string format_store_info(const std::string &backend, std::size_t keys,
                              std::size_t max_items, std::size_t pending,
                              const StoreStats &stats);

} // namespace readcache
