#include "starclaim/util/strings.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace starclaim {

std::string to_lower(std::string s) {
  for (char& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

std::string trim_copy(const std::string& s) {
  const auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto b = std::find_if(s.begin(), s.end(), not_space);
  auto e = std::find_if(s.rbegin(), s.rend(), not_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

std::string format_duration_ms(double ms) {
  if (!std::isfinite(ms) || ms < 0.0) ms = 0.0;
  const long long tenths = static_cast<long long>(std::floor(ms / 100.0));
  const long long minutes = tenths / 600;
  const long long sec_tenths = tenths % 600;
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%lld:%02lld.%lld", minutes, sec_tenths / 10, sec_tenths % 10);
  return std::string(buf);
}

} // namespace starclaim
