#include "readcache/log.hpp"

#include <iostream>
#include <mutex>

namespace readcache {
namespace {
std::mutex &log_mutex() {
  static std::mutex mu;
  return mu;
}
} // namespace

void log_line(const std::string &line) {
  std::lock_guard<std::mutex> lock(log_mutex());
  std::clog << line << "\n";
}

void log_error(const std::string &line) {
  std::lock_guard<std::mutex> lock(log_mutex());
  std::cerr << line << std::endl;
}

} // namespace readcache
