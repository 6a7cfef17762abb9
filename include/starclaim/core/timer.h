#pragma once

namespace starclaim {

// Fixed-duration countdown driven by elapsed simulation time.
//
// A timer is inert until start(). update() reports completion exactly once, on
// the call where the accumulated time first reaches the duration, and the timer
// deactivates itself at that point.
struct Timer {
  double duration_ms{0.0};
  double elapsed_ms{0.0};
  bool active{false};

  Timer() = default;
  explicit Timer(double duration) : duration_ms(duration) {}

  // (Re)starts from zero. Calling start() on a running timer restarts it.
  void start();
  void stop();

  // Returns true when the timer completes during this call.
  bool update(double delta_ms);

  // Fraction complete in [0,1]; 0 while inactive.
  double progress() const;
  double remaining_ms() const;
};

} // namespace starclaim
