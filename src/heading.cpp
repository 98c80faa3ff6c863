#include <bustrk/heading.hpp>
#include <cmath>
#include <bustrk/geo.hpp>

namespace bustrk {

double shortest_heading_delta(double from_deg, double to_deg) {
  // ((to - from + 540) mod 360) - 180, with a non-negative modulo
  const double d = normalize_deg(to_deg - from_deg + 540.0) - 180.0;
  return d <= -180.0 ? 180.0 : d;
}

void HeadingSmoother::reset(double heading_deg) {
  job_.cancel();
  displayed_ = normalize_deg(heading_deg);
  last_delta_ = 0.0;
}

bool HeadingSmoother::set_target(double heading_deg) {
  const double delta = shortest_heading_delta(displayed_, heading_deg);
  last_delta_ = delta;
  if (std::fabs(delta) < deadband_deg_) return false;
  job_.replace(Tween<double>(displayed_, displayed_ + delta, duration_ms_, Easing::EaseOutCubic));
  return true;
}

double HeadingSmoother::advance(double elapsed_ms) {
  const bool had_job = job_.job() != nullptr;
  if (auto v = job_.advance(elapsed_ms)) {
    displayed_ = *v;
  }
  if (had_job && job_.job() == nullptr) {
    displayed_ = normalize_deg(displayed_);
  }
  return displayed_;
}

} // namespace bustrk
