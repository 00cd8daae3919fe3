#pragma once

#include "readcache/cache.hpp"
#include "readcache/types.hpp"

#include <string>

namespace readcache {

// Logs that a remote operation was called and returns
// CacheStatus::unimplemented.
CacheStatus report_unimplemented(const char *operation);

// Stand-in for a network-backed cache. Selecting it is a wiring decision that
// must surface during integration, so every call fails immediately instead of
// acting as an always-miss cache. It declares no prefix invalidation.
template <typename V> class RemoteBackend final : public Cache<V> {
public:
  using Producer = typename Cache<V>::Producer;

  std::string name() const override { return "remote"; }
  std::string info() const override {
    return "backend:remote\nstatus:unimplemented\n";
  }

  CacheResult<V> get(const std::string &) override {
    return {report_unimplemented("get"), std::nullopt};
  }
  CacheStatus set(const std::string &, V, std::int64_t) override {
    return report_unimplemented("set");
  }
  CacheStatus del(const std::string &) override {
    return report_unimplemented("del");
  }
  CacheResult<V> fetch_or_compute(const std::string &, std::int64_t,
                                  const Producer &) override {
    return {report_unimplemented("fetch_or_compute"), std::nullopt};
  }
};

} // namespace readcache
