#include "readcache/context.hpp"
#include "readcache/keys.hpp"
#include "readcache/store.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace readcache;

TEST_CASE("Memo dedupes duplicate reads in one request", "[memo]") {
  RequestMemo<int> memo;
  int calls = 0;
  auto fn = [&] { return ++calls; };
  CHECK(memo.memoize("controls:list:first=10", fn) == 1);
  CHECK(memo.memoize("controls:list:first=10", fn) == 1);
  CHECK(memo.memoize("faqs:list:first=10", fn) == 2);
  CHECK(calls == 2);
  CHECK(memo.size() == 2);
}

TEST_CASE("Memo shares an in-flight call between concurrent callers",
          "[memo][concurrency]") {
  RequestMemo<std::string> memo;
  std::atomic<int> calls{0};
  std::vector<std::future<std::string>> results;
  for (int i = 0; i < 6; ++i) {
    results.push_back(std::async(std::launch::async, [&] {
      return memo.memoize("k", [&] {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return std::string("rows");
      });
    }));
  }
  for (auto &f : results)
    CHECK(f.get() == "rows");
  CHECK(calls.load() == 1);
}

TEST_CASE("Memo forgets failures so a retry runs again", "[memo][failure]") {
  RequestMemo<int> memo;
  int calls = 0;
  std::function<int()> flaky = [&]() -> int {
    if (++calls == 1)
      throw std::runtime_error("boom");
    return 7;
  };
  CHECK_THROWS_AS(memo.memoize("k", flaky), std::runtime_error);
  CHECK(memo.size() == 0);
  CHECK(memo.memoize("k", flaky) == 7);
  CHECK(calls == 2);
}

TEST_CASE("Request context pairs the shared cache with a private memo",
          "[memo][context]") {
  LruStore<std::string> shared(StoreConfig{});
  RequestContext<std::string> first(shared);
  RequestContext<std::string> second(shared);

  CHECK(first.request_id.size() == 16);
  CHECK(first.request_id != second.request_id);
  CHECK(&first.cache == &second.cache);

  const ListArgs args{10, std::nullopt, "SOC2", std::nullopt};
  int db_reads = 0;
  auto load = [&] {
    return first.memo.memoize(controls_list_key(args), [&] {
      auto r = first.cache.fetch_or_compute(controls_read_key(args), 300, [&] {
        ++db_reads;
        return std::string("page");
      });
      return *r.value;
    });
  };
  CHECK(load() == "page");
  CHECK(load() == "page");
  CHECK(db_reads == 1);
  CHECK(first.memo.size() == 1);
  CHECK(second.memo.size() == 0);
  CHECK(second.cache.get(controls_read_key(args)).hit());
}
