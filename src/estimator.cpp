#include <bustrk/estimator.hpp>
#include <algorithm>
#include <cmath>

namespace bustrk {

const char* to_string(FixAction a) {
  switch (a) {
    case FixAction::Dropped: return "dropped";
    case FixAction::Snap:    return "snap";
    case FixAction::Glide:   return "glide";
  }
  return "unknown";
}

const char* to_string(TrackState s) {
  switch (s) {
    case TrackState::NoFix:      return "no fix";
    case TrackState::Snapped:    return "snapped";
    case TrackState::Projecting: return "projecting";
    case TrackState::Settled:    return "settled";
  }
  return "unknown";
}

double projection_duration_ms(double interval_ms, const EngineTuning& t) {
  const double want = std::isfinite(interval_ms) ? interval_ms * t.interval_buffer : t.max_projection_ms;
  return std::clamp(want, t.min_projection_ms, t.max_projection_ms);
}

FixAction classify_fix(const std::optional<RawFix>& prev,
                       const RawFix& fix,
                       double interval_ms,
                       const EngineTuning& t) {
  if (!has_position(fix)) return FixAction::Dropped;
  if (!prev.has_value()) return FixAction::Snap;
  const double d_lat = std::fabs(fix.lat - prev->lat);
  const double d_lng = std::fabs(fix.lng - prev->lng);
  if (d_lat > t.jump_threshold_deg || d_lng > t.jump_threshold_deg) return FixAction::Snap;
  if (interval_ms > t.silence_threshold_ms) return FixAction::Snap;
  return FixAction::Glide;
}

IngestResult PositionEstimator::ingest(const RawFix& fix, double now_ms) {
  IngestResult r{};
  if (!has_position(fix)) {
    ++dropped_;
    r.action = FixAction::Dropped;
    r.motion = motion_;
    return r;
  }

  r.interval_ms = last_fix_.has_value() ? now_ms - last_arrival_ms_ : tuning_.default_interval_ms;
  r.action = classify_fix(last_fix_, fix, r.interval_ms, tuning_);
  r.motion = motion_state(sane_speed(fix), tuning_.moving_speed_mps);

  last_fix_ = fix;
  last_arrival_ms_ = now_ms;
  motion_ = r.motion;

  job_.cancel();

  const GeoPoint raw = position_of(fix);
  if (surface_) surface_->recenter(raw);

  if (r.action == FixAction::Snap) {
    position_ = raw;
    state_ = TrackState::Snapped;
    // Keep a moving marker alive right after the jump.
    if (r.motion == MotionState::Moving) start_projection_(raw, fix, r.interval_ms, r);
    return r;
  }

  if (r.motion == MotionState::Moving) {
    // Starts from wherever the marker is now, so drift from the previous
    // projection is corrected along the way.
    start_projection_(position_, fix, r.interval_ms, r);
  } else {
    r.duration_ms = tuning_.settle_ms;
    job_.replace(Tween<GeoPoint>(position_, raw, tuning_.settle_ms, Easing::EaseInOutCubic));
    state_ = TrackState::Settled;
  }
  return r;
}

void PositionEstimator::start_projection_(const GeoPoint& from, const RawFix& fix,
                                          double interval_ms, IngestResult& r) {
  const double proj_ms = projection_duration_ms(interval_ms, tuning_);
  const GeoPoint target = project_position(position_of(fix), sane_speed(fix), sane_heading(fix),
                                           proj_ms / 1000.0, tuning_.meters_per_deg_lat);
  job_.replace(Tween<GeoPoint>(from, target, proj_ms, Easing::Linear));
  r.duration_ms = proj_ms;
  r.projection_target = target;
  state_ = TrackState::Projecting;
}

const GeoPoint& PositionEstimator::advance(double elapsed_ms) {
  if (auto v = job_.advance(elapsed_ms)) position_ = *v;
  return position_;
}

void PositionEstimator::reset() {
  job_.cancel();
  position_ = GeoPoint{};
  state_ = TrackState::NoFix;
  motion_ = MotionState::Stopped;
  last_fix_.reset();
  last_arrival_ms_ = 0.0;
  dropped_ = 0;
}

} // namespace bustrk
