#include <bustrk/staleness.hpp>
#include <algorithm>

namespace bustrk {

bool is_stale(bool trip_active, double last_fix_ms, double now_ms, double inactive_threshold_sec) {
  if (!trip_active) return false;
  return (now_ms - last_fix_ms) > inactive_threshold_sec * 1000.0;
}

static double age_sec(const RawFix& f, double now_ms) {
  // Device clocks run slightly ahead at times; a fix is never younger than now.
  return std::max(0.0, (now_ms - f.recorded_at_ms) / 1000.0);
}

BusStatus bus_status(const std::optional<RawFix>& last, double now_ms, const EngineTuning& t) {
  if (!last) return BusStatus::Inactive;
  return age_sec(*last, now_ms) <= t.inactive_threshold_sec ? BusStatus::Active : BusStatus::Inactive;
}

MarkerTone marker_tone(const std::optional<RawFix>& last, double now_ms, const EngineTuning& t) {
  if (!last) return MarkerTone::Inactive;
  if (age_sec(*last, now_ms) > t.inactive_threshold_sec) return MarkerTone::Inactive;
  if (motion_state(sane_speed(*last), t.moving_speed_mps) == MotionState::Moving) return MarkerTone::Moving;
  return MarkerTone::Idle;
}

const char* to_string(BusStatus s) {
  switch (s) {
    case BusStatus::Active:   return "Active";
    case BusStatus::Inactive: return "Inactive";
  }
  return "Unknown";
}

const char* to_string(MarkerTone t) {
  switch (t) {
    case MarkerTone::Moving:   return "Moving";
    case MarkerTone::Idle:     return "Idle";
    case MarkerTone::Inactive: return "Inactive";
  }
  return "Unknown";
}

} // namespace bustrk
