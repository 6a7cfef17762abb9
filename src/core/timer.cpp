#include "starclaim/core/timer.h"

#include <algorithm>

namespace starclaim {

void Timer::start() {
  active = true;
  elapsed_ms = 0.0;
}

void Timer::stop() { active = false; }

bool Timer::update(double delta_ms) {
  if (!active) return false;
  if (delta_ms > 0.0) elapsed_ms += delta_ms;
  if (elapsed_ms < duration_ms) return false;
  active = false;
  return true;
}

double Timer::progress() const {
  if (!active) return 0.0;
  if (duration_ms <= 0.0) return 1.0;
  return std::clamp(elapsed_ms / duration_ms, 0.0, 1.0);
}

double Timer::remaining_ms() const {
  if (!active) return 0.0;
  return std::max(0.0, duration_ms - elapsed_ms);
}

} // namespace starclaim
