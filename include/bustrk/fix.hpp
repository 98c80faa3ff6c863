#pragma once
#include <cmath>
#include <cstdint>
#include <string>
#include <bustrk/geo.hpp>

namespace bustrk {

using VehicleId = std::string;

// One telemetry report from a tracked vehicle. Immutable once received.
struct RawFix {
  double lat{};               // degrees; non-finite = missing
  double lng{};               // degrees; non-finite = missing
  double speed_mps{};         // ground speed (m/s)
  double heading_deg{};       // compass heading [0, 360)
  double recorded_at_ms{};    // device timestamp (ms)
  bool   trip_active{true};
};

enum class MotionState { Stopped, Moving };

inline bool has_position(const RawFix& f) {
  return std::isfinite(f.lat) && std::isfinite(f.lng);
}

inline GeoPoint position_of(const RawFix& f) { return GeoPoint{f.lat, f.lng}; }

// Missing or negative speed reads as stationary.
inline double sane_speed(const RawFix& f) {
  return (std::isfinite(f.speed_mps) && f.speed_mps > 0.0) ? f.speed_mps : 0.0;
}

// Missing heading reads as north.
inline double sane_heading(const RawFix& f) {
  return std::isfinite(f.heading_deg) ? normalize_deg(f.heading_deg) : 0.0;
}

inline MotionState motion_state(double speed_mps, double moving_speed_mps) {
  return speed_mps > moving_speed_mps ? MotionState::Moving : MotionState::Stopped;
}

// A fix tagged with the vehicle that sent it and its per-vehicle sequence.
struct VehicleFix {
  VehicleId id{};
  std::uint64_t seq{};
  RawFix fix{};
};

} // namespace bustrk
