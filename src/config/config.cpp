#include "readcache/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace readcache {
namespace {
std::string trim_lower(std::string s) {
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}
} // namespace

const char *backend_kind_name(BackendKind kind) {
  switch (kind) {
  case BackendKind::local:
    return "local";
  case BackendKind::remote:
    return "remote";
  }
  return "local";
}

std::optional<std::size_t> parse_positive(const std::string &raw) {
  const auto s = trim_lower(raw);
  if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c);
      }))
    return std::nullopt;
  try {
    std::size_t idx = 0;
    const auto v = std::stoull(s, &idx);
    if (idx != s.size() || v == 0)
      return std::nullopt;
    return static_cast<std::size_t>(v);
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::optional<BackendKind> parse_backend_kind(const std::string &raw) {
  const auto s = trim_lower(raw);
  if (s == "local" || s == "lru")
    return BackendKind::local;
  if (s == "remote" || s == "redis")
    return BackendKind::remote;
  return std::nullopt;
}

bool parse_truthy(const std::string &raw) {
  const auto s = trim_lower(raw);
  return s == "true" || s == "1" || s == "yes" || s == "on";
}

CacheConfig config_from_lookup(const EnvLookup &lookup,
                               std::vector<std::string> *warnings) {
  CacheConfig cfg;
  auto warn = [warnings](const std::string &msg) {
    if (warnings)
      warnings->push_back(msg);
  };

  if (auto raw = lookup("CACHE_MAX_ITEMS")) {
    if (auto v = parse_positive(*raw))
      cfg.max_items = *v;
    else
      warn("CACHE_MAX_ITEMS='" + *raw + "' is not a positive integer, using " +
           std::to_string(kDefaultMaxItems));
  }

  std::string backend_var = "CACHE_BACKEND";
  auto backend = lookup(backend_var);
  if (!backend) {
    backend_var = "CACHE_ADAPTER";
    backend = lookup(backend_var);
  }
  if (backend) {
    if (auto kind = parse_backend_kind(*backend))
      cfg.backend = *kind;
    else
      warn(backend_var + "='" + *backend +
           "' is not a known backend, using local");
  }

  if (auto raw = lookup("DEBUG_PERF"))
    cfg.debug_perf = parse_truthy(*raw);
  return cfg;
}

CacheConfig config_from_env(std::vector<std::string> *warnings) {
  return config_from_lookup(
      [](const std::string &name) -> std::optional<std::string> {
        const char *v = std::getenv(name.c_str());
        if (v == nullptr)
          return std::nullopt;
        return std::string(v);
      },
      warnings);
}

bool apply_cli_args(int argc, char **argv, CacheConfig &cfg,
                    std::string *err) {
  auto fail = [err](const std::string &msg) {
    if (err)
      *err = msg;
    return false;
  };
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--debug-perf") {
      cfg.debug_perf = true;
    } else if (a == "--max-items" || a == "--cleanup-per-tick" ||
               a == "--backend") {
      if (i + 1 >= argc)
        return fail(a + " requires a value");
      const std::string v = argv[++i];
      if (a == "--backend") {
        auto kind = parse_backend_kind(v);
        if (!kind)
          return fail("unknown backend: " + v);
        cfg.backend = *kind;
        continue;
      }
      auto n = parse_positive(v);
      if (!n)
        return fail(a + " expects a positive integer, got " + v);
      if (a == "--max-items")
        cfg.max_items = *n;
      else
        cfg.ttl_cleanup_per_tick = *n;
    } else {
      return fail("unknown argument: " + a);
    }
  }
  return true;
}

} // namespace readcache
