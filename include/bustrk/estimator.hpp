#pragma once
#include <cstdint>
#include <optional>
#include <bustrk/fix.hpp>
#include <bustrk/geo.hpp>
#include <bustrk/tuning.hpp>
#include <bustrk/tween.hpp>

namespace bustrk {

enum class FixAction { Dropped, Snap, Glide };
enum class TrackState { NoFix, Snapped, Projecting, Settled };

const char* to_string(FixAction a);
const char* to_string(TrackState s);

// Anything that shows the map; told to follow each raw fix.
class RenderSurface {
public:
  virtual ~RenderSurface() = default;
  virtual void recenter(const GeoPoint& center) = 0;
};

struct IngestResult {
  FixAction action{FixAction::Dropped};
  MotionState motion{MotionState::Stopped};
  double interval_ms{0.0};     // arrival gap used for the decision
  double duration_ms{0.0};     // length of the position job started (0 = none)
  std::optional<GeoPoint> projection_target{}; // set only when dead reckoning ran
};

// Projection length for an observed arrival gap, always inside
// [min_projection_ms, max_projection_ms].
double projection_duration_ms(double interval_ms, const EngineTuning& t);

// Snap/glide decision for `fix` given the previous raw fix (if any).
FixAction classify_fix(const std::optional<RawFix>& prev,
                       const RawFix& fix,
                       double interval_ms,
                       const EngineTuning& t);

// Owns the displayed position of one vehicle. Every accepted fix cancels
// the running position job and either snaps (first fix, big jump, long
// silence) or glides: dead reckoning ahead while moving, settling onto the
// raw fix while stopped.
class PositionEstimator {
public:
  explicit PositionEstimator(const EngineTuning& tuning = EngineTuning{})
    : tuning_(tuning.sanitized()) {}

  void attach_surface(RenderSurface* surface) { surface_ = surface; }

  // `now_ms` is the arrival clock; it need not match recorded_at_ms.
  IngestResult ingest(const RawFix& fix, double now_ms);

  // Step the running job; returns the displayed position.
  const GeoPoint& advance(double elapsed_ms);

  bool has_fix() const { return last_fix_.has_value(); }
  const GeoPoint& position() const { return position_; }
  TrackState state() const { return state_; }
  MotionState motion() const { return motion_; }
  bool animating() const { return job_.active(); }
  const Tween<GeoPoint>* job() const { return job_.job(); }
  const std::optional<RawFix>& last_fix() const { return last_fix_; }
  std::uint64_t dropped_fixes() const { return dropped_; }
  const EngineTuning& tuning() const { return tuning_; }

  // Forget everything (tracking stopped).
  void reset();

private:
  void start_projection_(const GeoPoint& from, const RawFix& fix, double interval_ms, IngestResult& r);

  EngineTuning tuning_;
  RenderSurface* surface_{nullptr};

  GeoPoint position_{};
  TrackState state_{TrackState::NoFix};
  MotionState motion_{MotionState::Stopped};
  std::optional<RawFix> last_fix_{};
  double last_arrival_ms_{0.0};
  std::uint64_t dropped_{0};
  JobSlot<GeoPoint> job_{};
};

} // namespace bustrk
