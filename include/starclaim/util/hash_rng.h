#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace starclaim::util {

// splitmix64: fast deterministic mixing / RNG step (Sebastiano Vigna).
//
// Every random decision in the simulation (node placement, capacity shuffles,
// AI exploration) draws from this generator so a seed reproduces a match.
//
// IMPORTANT: This is *not* a cryptographically secure RNG.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Top 53 bits of a 64-bit word as a double in [0,1).
inline double u01_from_u64(std::uint64_t x) {
  return static_cast<double>(x >> 11) * (1.0 / 9007199254740992.0);
}

class HashRng {
 public:
  explicit HashRng(std::uint64_t seed = 0) : s_(seed) {}

  std::uint64_t state() const { return s_; }

  std::uint64_t next_u64() {
    s_ = splitmix64(s_);
    return s_;
  }

  double next_u01() { return u01_from_u64(next_u64()); }

  // Uniform double in [lo, hi).
  double range(double lo, double hi) {
    if (hi < lo) std::swap(lo, hi);
    return lo + (hi - lo) * next_u01();
  }

  // Unbiased index in [0, n). Returns 0 for n <= 1.
  std::size_t index(std::size_t n) {
    if (n <= 1) return 0;
    const std::uint64_t bound = static_cast<std::uint64_t>(n);
    const std::uint64_t threshold = (std::uint64_t(0) - bound) % bound;
    for (;;) {
      const std::uint64_t r = next_u64();
      if (r >= threshold) return static_cast<std::size_t>(r % bound);
    }
  }

  // True with probability p (clamped to [0,1]).
  bool chance(double p) {
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    return next_u01() < p;
  }

  // In-place Fisher-Yates shuffle.
  template <typename T>
  void shuffle(std::vector<T>& v) {
    for (std::size_t i = v.size(); i > 1; --i) {
      const std::size_t j = index(i);
      std::swap(v[i - 1], v[j]);
    }
  }

 private:
  std::uint64_t s_{0};
};

} // namespace starclaim::util
