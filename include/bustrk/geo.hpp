#pragma once
#include <cmath>
#include <numbers>

namespace bustrk {

// Constant naming convention (kCamelCase)
inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;
inline constexpr double kDegToRad = kPI / 180.0;
inline constexpr double kRadToDeg = 180.0 / kPI;

inline constexpr double kEarthRadiusKm   = 6371.0;
inline constexpr double kMetersPerDegLat = 111320.0;

struct GeoPoint {
  double lat{};
  double lng{};
};

// Planar point in meters (x = east, y = north) around a local origin.
struct Vec2 {
  double x{};
  double y{};
};

inline bool is_finite(const GeoPoint& p) {
  return std::isfinite(p.lat) && std::isfinite(p.lng);
}

// Wrap any angle in degrees into [0, 360).
inline double normalize_deg(double deg) {
  double d = std::fmod(deg, 360.0);
  if (d < 0.0) d += 360.0;
  if (d >= 360.0) d -= 360.0; // fmod of tiny negatives can round up to 360
  return d;
}

// Constant-velocity dead reckoning from `from` along a compass heading
// (0 = north, 90 = east) for `seconds`.
GeoPoint project_position(const GeoPoint& from,
                          double speed_mps,
                          double heading_deg,
                          double seconds,
                          double meters_per_deg_lat = kMetersPerDegLat);

// Great-circle distance (haversine), kilometres.
double haversine_km(const GeoPoint& a, const GeoPoint& b);

// Equirectangular conversion around `origin`; good to a few cm over a city.
Vec2     to_local_m(const GeoPoint& origin, const GeoPoint& p,
                    double meters_per_deg_lat = kMetersPerDegLat);
GeoPoint from_local_m(const GeoPoint& origin, const Vec2& m,
                      double meters_per_deg_lat = kMetersPerDegLat);

// Planar heading (radians, CCW from +x/east) -> compass bearing in [0, 360).
inline double bearing_from_planar(double heading_rad) {
  return normalize_deg(90.0 - heading_rad * kRadToDeg);
}

} // namespace bustrk
