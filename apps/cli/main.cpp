#include "readcache/backend.hpp"
#include "readcache/config.hpp"
#include "readcache/invalidation.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

bool parse_i64(const std::string &s, std::int64_t &out) {
  try {
    std::size_t idx = 0;
    out = std::stoll(s, &idx);
    return idx == s.size();
  } catch (const std::logic_error &) {
    return false;
  }
}

std::vector<std::string> split(const std::string &line) {
  std::istringstream in(line);
  std::vector<std::string> out;
  std::string tok;
  while (in >> tok)
    out.push_back(tok);
  return out;
}

std::string reply(readcache::CacheStatus status) {
  if (status == readcache::CacheStatus::ok)
    return "OK";
  return std::string("ERR ") + readcache::status_name(status);
}

std::string reply(const readcache::CacheResult<std::string> &r) {
  if (!r.ok())
    return reply(r.status);
  return r.value ? *r.value : "(nil)";
}

void usage() {
  std::cout << "commands:\n"
               "  GET key\n"
               "  SET key value ttl_seconds\n"
               "  DEL key\n"
               "  FETCH key ttl_seconds value   (value is produced on miss)\n"
               "  FAIL key                      (fetch with a failing producer)\n"
               "  INVALIDATE prefix\n"
               "  INVALIDATE_CONTROLS | INVALIDATE_FAQS\n"
               "  INFO | HELP | QUIT\n";
}
} // namespace

int main(int argc, char **argv) {
  std::vector<std::string> warnings;
  auto cfg = readcache::config_from_env(&warnings);
  std::string err;
  if (!readcache::apply_cli_args(argc, argv, cfg, &err)) {
    std::cerr << err << "\n";
    return 2;
  }
  for (const auto &w : warnings)
    std::cerr << "warning: " << w << "\n";

  auto cache = readcache::make_cache<std::string>(cfg);
  std::cout << "readcache_cli backend=" << cache->name()
            << " max_items=" << cfg.max_items << "\n";

  std::string line;
  while (std::getline(std::cin, line)) {
    auto cmd = split(line);
    if (cmd.empty())
      continue;
    const auto op = upper(cmd[0]);
    std::int64_t ttl = 0;

    if (op == "QUIT") {
      break;
    } else if (op == "HELP") {
      usage();
    } else if (op == "INFO") {
      std::cout << cache->info();
    } else if (op == "GET" && cmd.size() == 2) {
      std::cout << reply(cache->get(cmd[1])) << "\n";
    } else if (op == "SET" && cmd.size() == 4) {
      if (!parse_i64(cmd[3], ttl))
        std::cout << "ERR invalid ttl\n";
      else
        std::cout << reply(cache->set(cmd[1], cmd[2], ttl)) << "\n";
    } else if (op == "DEL" && cmd.size() == 2) {
      std::cout << reply(cache->del(cmd[1])) << "\n";
    } else if (op == "FETCH" && cmd.size() == 4) {
      if (!parse_i64(cmd[2], ttl)) {
        std::cout << "ERR invalid ttl\n";
        continue;
      }
      bool produced = false;
      const auto value = cmd[3];
      auto r = cache->fetch_or_compute(cmd[1], ttl, [&] {
        produced = true;
        return value;
      });
      std::cout << reply(r) << (produced ? " (computed)" : "") << "\n";
    } else if (op == "FAIL" && cmd.size() == 2) {
      try {
        auto r = cache->fetch_or_compute(cmd[1], 60, []() -> std::string {
          throw std::runtime_error("producer failed");
        });
        std::cout << reply(r) << "\n";
      } catch (const std::exception &e) {
        std::cout << "ERR " << e.what() << "\n";
      }
    } else if (op == "INVALIDATE" && cmd.size() == 2) {
      auto *capability = cache->prefix_invalidation();
      if (capability == nullptr)
        std::cout << reply(readcache::CacheStatus::unsupported) << "\n";
      else
        std::cout << capability->invalidate_prefix(cmd[1]) << "\n";
    } else if (op == "INVALIDATE_CONTROLS" || op == "INVALIDATE_FAQS") {
      auto r = op == "INVALIDATE_CONTROLS" ? readcache::invalidate_controls(*cache)
                                           : readcache::invalidate_faqs(*cache);
      std::cout << reply(r.status) << " " << r.prefix << " " << r.removed
                << "\n";
    } else {
      std::cout << "ERR unknown command or wrong arity, try HELP\n";
    }
  }
  return 0;
}
