#pragma once

#include <string>

namespace starclaim {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim_copy(const std::string& s);

// Formats a millisecond duration as "m:ss.t" (e.g. 83450 -> "1:23.4").
std::string format_duration_ms(double ms);

} // namespace starclaim
