#pragma once
#include <optional>
#include <bustrk/fix.hpp>
#include <bustrk/tuning.hpp>

namespace bustrk {

// Active trip whose last fix is older than the threshold.
bool is_stale(bool trip_active, double last_fix_ms, double now_ms,
              double inactive_threshold_sec = 300.0);

inline bool is_stale(const RawFix& last, double now_ms, const EngineTuning& t) {
  return is_stale(last.trip_active, last.recorded_at_ms, now_ms, t.inactive_threshold_sec);
}

// Card status on the live map: Active while fixes keep arriving.
enum class BusStatus { Active, Inactive };

// Marker colour class: grey when silent, green when moving, amber when idle.
enum class MarkerTone { Moving, Idle, Inactive };

BusStatus bus_status(const std::optional<RawFix>& last, double now_ms, const EngineTuning& t);
MarkerTone marker_tone(const std::optional<RawFix>& last, double now_ms, const EngineTuning& t);

const char* to_string(BusStatus s);
const char* to_string(MarkerTone t);

} // namespace bustrk
