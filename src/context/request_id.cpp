#include "readcache/context.hpp"

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace readcache {

std::string make_request_id() {
  static std::mutex mu;
  static std::mt19937_64 rng(std::random_device{}());
  std::uint64_t v = 0;
  {
    std::lock_guard<std::mutex> lock(mu);
    v = rng();
  }
  std::ostringstream os;
  os << std::hex << std::setw(16) << std::setfill('0') << v;
  return os.str();
}

} // namespace readcache
