#include "readcache/invalidation.hpp"
#include "readcache/remote.hpp"

#include <catch2/catch.hpp>

#include <string>

using namespace readcache;

TEST_CASE("Remote stub fails every operation as unimplemented", "[remote]") {
  RemoteBackend<std::string> remote;

  auto got = remote.get("k");
  CHECK(got.status == CacheStatus::unimplemented);
  CHECK_FALSE(got.hit());
  CHECK(remote.set("k", "v", 60) == CacheStatus::unimplemented);
  CHECK(remote.del("k") == CacheStatus::unimplemented);
  CHECK(remote.info().find("status:unimplemented") != std::string::npos);
}

TEST_CASE("Remote stub never runs the producer", "[remote]") {
  RemoteBackend<std::string> remote;
  bool called = false;
  auto r = remote.fetch_or_compute("k", 60, [&] {
    called = true;
    return std::string("v");
  });
  CHECK(r.status == CacheStatus::unimplemented);
  CHECK_FALSE(r.value.has_value());
  CHECK_FALSE(called);
}

TEST_CASE("Remote stub declares no prefix invalidation", "[remote]") {
  RemoteBackend<std::string> remote;
  CHECK(remote.prefix_invalidation() == nullptr);

  auto r = invalidate_controls(remote, "req-1");
  CHECK(r.status == CacheStatus::unsupported);
  CHECK_FALSE(r.ok());
  CHECK(r.removed == 0);
  CHECK(r.prefix == "controls:list:");
  CHECK(r.request_id == "req-1");
}
