#include "readcache/config.hpp"
#include "readcache/store.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <thread>
#include <vector>

using namespace readcache;

namespace {
void run_workloads(const CacheConfig &base) {
  const std::vector<std::size_t> capacities = {64, 256, base.max_items};
  const std::vector<std::string> presets = {"hotset", "uniform", "writeheavy"};

  for (const auto &preset : presets) {
    std::cout << "workload=" << preset << "\n";
    for (const auto cap : capacities) {
      auto cfg = base.store_config();
      cfg.max_items = cap;
      LruStore<std::string> store(cfg);
      std::mt19937_64 rng(42);
      std::uniform_int_distribution<int> u(0, 999);
      const int ops = 20000;
      auto start = std::chrono::steady_clock::now();
      int hits = 0;
      std::vector<double> lat;
      lat.reserve(ops);
      for (int i = 0; i < ops; ++i) {
        auto t0 = std::chrono::steady_clock::now();
        int k = u(rng);
        if (preset == "hotset")
          k = static_cast<int>(std::pow((u(rng) % 100) + 1, 1.4));
        const auto key = "controls:list:page=" + std::to_string(k % 1000);
        const bool do_write =
            preset == "writeheavy" ? (i % 2 == 0) : (i % 5 == 0);
        if (do_write)
          store.set(key, std::string(64, 'v'), 300);
        else if (store.get(key).hit())
          ++hits;
        auto t1 = std::chrono::steady_clock::now();
        lat.push_back(
            std::chrono::duration<double, std::micro>(t1 - t0).count());
      }
      auto end = std::chrono::steady_clock::now();
      std::sort(lat.begin(), lat.end());
      auto pct = [&](double p) {
        return lat[static_cast<std::size_t>(p * (lat.size() - 1))];
      };
      double seconds = std::chrono::duration<double>(end - start).count();
      std::cout << "max_items=" << cap << " ops/s=" << std::fixed
                << std::setprecision(2) << (ops / seconds)
                << " p50_us=" << pct(0.50) << " p95_us=" << pct(0.95)
                << " p99_us=" << pct(0.99)
                << " hit_rate=" << (static_cast<double>(hits) / ops)
                << " evictions=" << store.stats().evictions << "\n";
    }
  }
}

void run_stampede(const CacheConfig &base) {
  const int callers = 64;
  LruStore<std::string> store(base.store_config());
  std::atomic<int> producer_calls{0};
  std::vector<std::thread> threads;
  auto start = std::chrono::steady_clock::now();
  for (int t = 0; t < callers; ++t) {
    threads.emplace_back([&] {
      store.fetch_or_compute("search:stampede", 60, [&] {
        ++producer_calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return std::string("result");
      });
    });
  }
  for (auto &th : threads)
    th.join();
  auto end = std::chrono::steady_clock::now();
  std::cout << "stampede callers=" << callers
            << " producer_calls=" << producer_calls.load()
            << " coalesced=" << store.stats().coalesced_waits << " wall_ms="
            << std::chrono::duration<double, std::milli>(end - start).count()
            << "\n";
}
} // namespace

int main(int argc, char **argv) {
  std::vector<std::string> warnings;
  auto cfg = config_from_env(&warnings);
  std::string err;
  if (!apply_cli_args(argc, argv, cfg, &err)) {
    std::cerr << err << "\n";
    return 2;
  }
  for (const auto &w : warnings)
    std::cerr << "warning: " << w << "\n";

  run_workloads(cfg);
  run_stampede(cfg);
  return 0;
}
