#include <bustrk/geo.hpp>
#include <algorithm>

namespace bustrk {

GeoPoint project_position(const GeoPoint& from,
                          double speed_mps,
                          double heading_deg,
                          double seconds,
                          double meters_per_deg_lat) {
  const double h = heading_deg * kDegToRad;
  const double dist = speed_mps * seconds;
  const double d_lat = (dist * std::cos(h)) / meters_per_deg_lat;
  const double d_lng = (dist * std::sin(h)) /
                       (meters_per_deg_lat * std::cos(from.lat * kDegToRad));
  return GeoPoint{from.lat + d_lat, from.lng + d_lng};
}

double haversine_km(const GeoPoint& a, const GeoPoint& b) {
  const double d_lat = (b.lat - a.lat) * kDegToRad;
  const double d_lng = (b.lng - a.lng) * kDegToRad;
  const double s_lat = std::sin(d_lat / 2.0);
  const double s_lng = std::sin(d_lng / 2.0);
  const double h = s_lat * s_lat +
                   std::cos(a.lat * kDegToRad) * std::cos(b.lat * kDegToRad) * s_lng * s_lng;
  // Rounding can push h a hair above 1 for antipodal points.
  const double hc = std::clamp(h, 0.0, 1.0);
  return kEarthRadiusKm * 2.0 * std::atan2(std::sqrt(hc), std::sqrt(1.0 - hc));
}

Vec2 to_local_m(const GeoPoint& origin, const GeoPoint& p, double meters_per_deg_lat) {
  const double k = meters_per_deg_lat * std::cos(origin.lat * kDegToRad);
  return Vec2{ (p.lng - origin.lng) * k, (p.lat - origin.lat) * meters_per_deg_lat };
}

GeoPoint from_local_m(const GeoPoint& origin, const Vec2& m, double meters_per_deg_lat) {
  const double k = meters_per_deg_lat * std::cos(origin.lat * kDegToRad);
  return GeoPoint{ origin.lat + m.y / meters_per_deg_lat,
                   origin.lng + (k != 0.0 ? m.x / k : 0.0) };
}

} // namespace bustrk
