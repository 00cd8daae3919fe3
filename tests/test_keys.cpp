#include "readcache/invalidation.hpp"
#include "readcache/keys.hpp"
#include "readcache/store.hpp"

#include <catch2/catch.hpp>

#include <string>

using namespace readcache;

TEST_CASE("Raw list keys keep arguments verbatim and omit unset ones",
          "[keys]") {
  CHECK(controls_list_key({}) == "controls:list");
  CHECK(controls_list_key({10, std::nullopt, "SOC2", std::nullopt}) ==
        "controls:list:first=10:category=SOC2");
  CHECK(faqs_list_key({5, "abc", "Privacy", "data retention"}) ==
        "faqs:list:first=5:after=abc:category=Privacy:search=data retention");
}

TEST_CASE("Read keys are deterministic for equivalent inputs", "[keys]") {
  ListArgs a{10, std::nullopt, "  SOC2 ", "Access   Control"};
  ListArgs b{10, std::nullopt, "soc2", " access control"};
  CHECK(controls_read_key(a) == controls_read_key(b));
  CHECK(controls_read_key(a) ==
        "controls:list:role=public:first=10:category=soc2:search=access control");
  CHECK(controls_read_key(a) != faqs_read_key(a));
}

TEST_CASE("Read keys clamp page size and drop empty filters", "[keys]") {
  CHECK(controls_read_key({500, "  ", "   ", ""}) ==
        "controls:list:role=public:first=50");
  CHECK(controls_read_key({0, std::nullopt, std::nullopt, std::nullopt}) ==
        "controls:list:role=public:first=10");
  CHECK(controls_read_key({-4, " cur ", std::nullopt, std::nullopt}) ==
        "controls:list:role=public:first=10:after=cur");
}

TEST_CASE("Read keys carry the auth scope", "[keys]") {
  CHECK(faqs_read_key({}, " Admin ") == "faqs:list:role=admin");
  CHECK(faqs_read_key({}, "") == "faqs:list:role=public");
  CHECK(faqs_read_key({}).starts_with(kFaqsListPrefix));
}

TEST_CASE("normalize_text trims, collapses and lowercases", "[keys]") {
  CHECK(normalize_text("  Hello \t  World\n") == "hello world");
  CHECK(normalize_text("   ") == "");
  CHECK(clamp_page_size(25) == 25);
}

TEST_CASE("Entity invalidation clears only that entity's list reads",
          "[keys][invalidate]") {
  LruStore<std::string> s(StoreConfig{});
  const auto c1 = controls_read_key({10, std::nullopt, "soc2", std::nullopt});
  const auto c2 = controls_read_key({20, std::nullopt, std::nullopt, "mfa"});
  const auto f1 = faqs_read_key({10, std::nullopt, std::nullopt, std::nullopt});
  s.set(c1, "page", 300);
  s.set(c2, "page", 300);
  s.set(f1, "page", 300);

  auto r = invalidate_controls(s, "req-42");
  CHECK(r.ok());
  CHECK(r.removed == 2);
  CHECK(r.scope == InvalidationScope::controls);
  CHECK(r.prefix == kControlsListPrefix);
  CHECK_FALSE(s.get(c1).hit());
  CHECK_FALSE(s.get(c2).hit());
  CHECK(s.get(f1).hit());

  auto faqs = invalidate_faqs(s);
  CHECK(faqs.removed == 1);
  CHECK(std::string(scope_name(faqs.scope)) == "faqs");
  CHECK(s.size() == 0);
}
