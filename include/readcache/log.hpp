#pragma once

#include <string>

namespace readcache {

// Trace output (std::clog). Each call writes one complete line.
void log_line(const std::string &line);

// Diagnostics and warnings (std::cerr).
void log_error(const std::string &line);

} // namespace readcache
