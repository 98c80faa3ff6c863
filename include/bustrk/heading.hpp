#pragma once
#include <bustrk/tween.hpp>

namespace bustrk {

// Signed shortest rotation carrying `from_deg` onto `to_deg`, in (-180, 180].
// Inputs may lie outside [0, 360).
double shortest_heading_delta(double from_deg, double to_deg);

// Animates the displayed heading toward each new target along the
// shortest arc. The displayed value may leave [0, 360) while a rotation
// runs and is renormalized when it completes.
class HeadingSmoother {
public:
  explicit HeadingSmoother(double duration_ms = 400.0, double deadband_deg = 1.0)
    : duration_ms_(duration_ms), deadband_deg_(deadband_deg) {}

  // Place without animation (first fix).
  void reset(double heading_deg);

  // Returns true if a rotation was started; deltas under the deadband are ignored.
  bool set_target(double heading_deg);

  double advance(double elapsed_ms);

  double displayed() const { return displayed_; }
  bool animating() const { return job_.active(); }
  double last_delta() const { return last_delta_; }

  // End value of the running rotation, or the displayed value when idle.
  double target() const {
    const auto* j = job_.job();
    return j ? j->target() : displayed_;
  }

private:
  double duration_ms_;
  double deadband_deg_;
  double displayed_{0.0};
  double last_delta_{0.0};
  JobSlot<double> job_{};
};

} // namespace bustrk
