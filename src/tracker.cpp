#include <bustrk/tracker.hpp>
#include <bustrk/geo.hpp>

namespace bustrk {

VehicleTracker::VehicleTracker(const EngineTuning& tuning)
  : estimator_(tuning),
    heading_(estimator_.tuning().heading_ms, estimator_.tuning().heading_deadband_deg) {}

IngestResult VehicleTracker::ingest(const RawFix& fix, double now_ms) {
  const bool first = !estimator_.has_fix();
  const IngestResult r = estimator_.ingest(fix, now_ms);
  if (r.action == FixAction::Dropped) return r;

  if (first) heading_.reset(sane_heading(fix));
  else       (void)heading_.set_target(sane_heading(fix));

  // A finished trip ends the clock; the next active fix starts a new one.
  if (!fix.trip_active)       trip_started_ms_.reset();
  else if (!trip_started_ms_) trip_started_ms_ = fix.recorded_at_ms;
  return r;
}

void VehicleTracker::advance(double elapsed_ms) {
  estimator_.advance(elapsed_ms);
  heading_.advance(elapsed_ms);
}

TrackerFrame VehicleTracker::frame(double now_ms) const {
  TrackerFrame f{};
  const auto& last = estimator_.last_fix();
  const auto& t = estimator_.tuning();

  f.has_fix = last.has_value();
  f.position = estimator_.position();
  f.heading_deg = heading_.displayed();
  f.motion = estimator_.motion();
  f.state = estimator_.state();
  f.status = bus_status(last, now_ms, t);
  f.tone = marker_tone(last, now_ms, t);
  if (last) {
    f.stale = is_stale(*last, now_ms, t);
    f.last_fix_ms = last->recorded_at_ms;
    f.raw_speed_mps = last->speed_mps;
    f.trip_active = last->trip_active;
  }
  f.trip_started_ms = trip_started_ms_;

  f.viewer = viewer_;
  if (viewer_ && f.has_fix) {
    f.distance_km = haversine_km(*viewer_, f.position);
  }
  return f;
}

void VehicleTracker::set_viewer_location(std::optional<GeoPoint> p) {
  if (p && !is_finite(*p)) p.reset();
  viewer_ = p;
}

void VehicleTracker::reset() {
  estimator_.reset();
  heading_.reset(0.0);
  trip_started_ms_.reset();
}

} // namespace bustrk
