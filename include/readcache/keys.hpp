#pragma once

#include <optional>
#include <string>

namespace readcache {

constexpr const char *kControlsListPrefix = "controls:list:";
constexpr const char *kFaqsListPrefix = "faqs:list:";

constexpr int kDefaultPageSize = 10;
constexpr int kMaxPageSize = 50;

struct ListArgs {
  std::optional<int> first;
  std::optional<std::string> after;
  std::optional<std::string> category;
  std::optional<std::string> search;
};

// Raw keys keep the arguments verbatim, e.g.
// "controls:list:first=10:category=SOC2". Used for per-request memoization.
std::string controls_list_key(const ListArgs &args);
std::string faqs_list_key(const ListArgs &args);

// Shared read-cache keys: arguments normalized so equivalent requests share
// an entry, plus an auth-scope segment, e.g.
// "controls:list:role=public:first=10:category=soc2".
std::string controls_read_key(const ListArgs &args,
                              const std::string &auth_scope = "public");
std::string faqs_read_key(const ListArgs &args,
                          const std::string &auth_scope = "public");

ListArgs normalize_list_args(const ListArgs &args);
int clamp_page_size(int first);
// Trim, collapse internal whitespace runs to one space, lowercase.
std::string normalize_text(const std::string &value);

} // namespace readcache
