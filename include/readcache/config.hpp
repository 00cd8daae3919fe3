#pragma once

#include "readcache/store.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace readcache {

constexpr std::size_t kDefaultMaxItems = 500;

enum class BackendKind {
  local,
  remote,
};

struct CacheConfig {
  std::size_t max_items{kDefaultMaxItems};
  BackendKind backend{BackendKind::local};
  bool debug_perf{false};
  std::size_t ttl_cleanup_per_tick{128};

  StoreConfig store_config() const {
    return {max_items, ttl_cleanup_per_tick, debug_perf};
  }
};

const char *backend_kind_name(BackendKind kind);

// Positive decimal integer; anything else yields nullopt.
std::optional<std::size_t> parse_positive(const std::string &raw);
// "local"/"lru" and "remote"/"redis", case-insensitive.
std::optional<BackendKind> parse_backend_kind(const std::string &raw);
// "true", "1", "yes", "on", case-insensitive.
bool parse_truthy(const std::string &raw);

using EnvLookup =
    std::function<std::optional<std::string>(const std::string &name)>;

// Reads CACHE_MAX_ITEMS, CACHE_BACKEND (falling back to CACHE_ADAPTER) and
// DEBUG_PERF. Invalid values resolve to defaults; a description of each
// fallback is appended to warnings when given.
CacheConfig config_from_lookup(const EnvLookup &lookup,
                               std::vector<std::string> *warnings = nullptr);
CacheConfig config_from_env(std::vector<std::string> *warnings = nullptr);

// --max-items N, --backend KIND, --cleanup-per-tick N, --debug-perf.
bool apply_cli_args(int argc, char **argv, CacheConfig &cfg,
                    std::string *err = nullptr);

} // namespace readcache
