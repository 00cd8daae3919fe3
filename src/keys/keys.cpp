#include "readcache/keys.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace readcache {
namespace {
std::string trim(const std::string &s) {
  auto b = std::find_if(s.begin(), s.end(),
                        [](unsigned char c) { return !std::isspace(c); });
  auto e = std::find_if(s.rbegin(), s.rend(),
                        [](unsigned char c) { return !std::isspace(c); })
               .base();
  return b < e ? std::string(b, e) : std::string();
}

std::string join_segments(const std::string &head, const ListArgs &args) {
  std::string out = head;
  if (args.first.has_value())
    out += ":first=" + std::to_string(*args.first);
  if (args.after.has_value())
    out += ":after=" + *args.after;
  if (args.category.has_value())
    out += ":category=" + *args.category;
  if (args.search.has_value())
    out += ":search=" + *args.search;
  return out;
}

std::string read_key(const std::string &entity, const ListArgs &args,
                     const std::string &auth_scope) {
  auto scope = normalize_text(auth_scope);
  if (scope.empty())
    scope = "public";
  return join_segments(entity + ":list:role=" + scope,
                       normalize_list_args(args));
}
} // namespace

std::string controls_list_key(const ListArgs &args) {
  return join_segments("controls:list", args);
}

std::string faqs_list_key(const ListArgs &args) {
  return join_segments("faqs:list", args);
}

std::string controls_read_key(const ListArgs &args,
                              const std::string &auth_scope) {
  return read_key("controls", args, auth_scope);
}

std::string faqs_read_key(const ListArgs &args,
                          const std::string &auth_scope) {
  return read_key("faqs", args, auth_scope);
}

ListArgs normalize_list_args(const ListArgs &args) {
  ListArgs out;
  if (args.first.has_value())
    out.first = clamp_page_size(*args.first);
  if (args.after.has_value()) {
    auto after = trim(*args.after);
    if (!after.empty())
      out.after = std::move(after);
  }
  if (args.category.has_value()) {
    auto category = normalize_text(*args.category);
    if (!category.empty())
      out.category = std::move(category);
  }
  if (args.search.has_value()) {
    auto search = normalize_text(*args.search);
    if (!search.empty())
      out.search = std::move(search);
  }
  return out;
}

int clamp_page_size(int first) {
  if (first <= 0)
    return kDefaultPageSize;
  return std::min(first, kMaxPageSize);
}

std::string normalize_text(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  bool pending_space = false;
  for (unsigned char c : value) {
    if (std::isspace(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space)
      out.push_back(' ');
    pending_space = false;
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

} // namespace readcache
