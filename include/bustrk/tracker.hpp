#pragma once
#include <optional>
#include <bustrk/estimator.hpp>
#include <bustrk/heading.hpp>
#include <bustrk/staleness.hpp>

namespace bustrk {

// Everything a render surface needs for one vehicle on one frame.
struct TrackerFrame {
  bool has_fix{false};
  GeoPoint position{};                // smoothed
  double heading_deg{0.0};            // smoothed, for marker rotation
  MotionState motion{MotionState::Stopped};
  TrackState state{TrackState::NoFix};
  bool stale{false};
  BusStatus status{BusStatus::Inactive};
  MarkerTone tone{MarkerTone::Inactive};

  // Passthrough from the last raw fix, no smoothing.
  double last_fix_ms{0.0};
  double raw_speed_mps{0.0};
  bool trip_active{false};
  // Device time of the first accepted fix of the running trip.
  std::optional<double> trip_started_ms{};

  // Viewer's own location, absent when unavailable or not permitted.
  std::optional<GeoPoint> viewer{};
  std::optional<double> distance_km{};
};

// Per-vehicle tracking session: position estimator, heading smoother and
// staleness flags behind one ingest/advance/frame surface.
class VehicleTracker {
public:
  explicit VehicleTracker(const EngineTuning& tuning = EngineTuning{});

  void attach_surface(RenderSurface* surface) { estimator_.attach_surface(surface); }

  IngestResult ingest(const RawFix& fix, double now_ms);
  void advance(double elapsed_ms);
  TrackerFrame frame(double now_ms) const;

  // nullopt (or a non-finite point) hides the viewer marker and distance.
  void set_viewer_location(std::optional<GeoPoint> p);
  const std::optional<GeoPoint>& viewer_location() const { return viewer_; }

  // Tracking stopped: drop all estimated state. Viewer location is kept.
  void reset();

  const PositionEstimator& estimator() const { return estimator_; }
  const HeadingSmoother& heading() const { return heading_; }
  const EngineTuning& tuning() const { return estimator_.tuning(); }

private:
  PositionEstimator estimator_;
  HeadingSmoother heading_;
  std::optional<GeoPoint> viewer_{};
  std::optional<double> trip_started_ms_{};
};

} // namespace bustrk
