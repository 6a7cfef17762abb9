#include <cmath>
#include <iostream>

#include "starclaim/core/timer.h"

#define SC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_timer() {
  using starclaim::Timer;

  Timer t(1000.0);
  SC_ASSERT(!t.active);
  // Inert until started.
  SC_ASSERT(!t.update(5000.0));
  SC_ASSERT(t.progress() == 0.0);

  t.start();
  SC_ASSERT(t.active);
  SC_ASSERT(!t.update(400.0));
  SC_ASSERT(std::fabs(t.progress() - 0.4) < 1e-12);
  SC_ASSERT(std::fabs(t.remaining_ms() - 600.0) < 1e-9);

  // Completion is reported exactly once.
  SC_ASSERT(t.update(600.0));
  SC_ASSERT(!t.active);
  SC_ASSERT(!t.update(100.0));
  SC_ASSERT(t.remaining_ms() == 0.0);

  // Overshooting still completes on the call that crosses the duration.
  t.start();
  SC_ASSERT(t.update(2500.0));

  // start() on a running timer restarts from zero.
  t.start();
  SC_ASSERT(!t.update(900.0));
  t.start();
  SC_ASSERT(!t.update(900.0));
  SC_ASSERT(t.update(100.0));

  // Negative deltas never move a timer backwards.
  t.start();
  SC_ASSERT(!t.update(300.0));
  SC_ASSERT(!t.update(-200.0));
  SC_ASSERT(std::fabs(t.elapsed_ms - 300.0) < 1e-12);

  t.stop();
  SC_ASSERT(!t.active);
  SC_ASSERT(!t.update(5000.0));

  Timer zero(0.0);
  zero.start();
  SC_ASSERT(zero.update(0.0));

  return 0;
}
