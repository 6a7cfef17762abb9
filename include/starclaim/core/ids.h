#pragma once
#include <cstdint>

namespace starclaim {

using Id = std::uint64_t;

constexpr Id kInvalidId = 0;

} // namespace starclaim
