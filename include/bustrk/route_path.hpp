#pragma once
#include <cstddef>
#include <vector>
#include <bustrk/geo.hpp>

namespace bustrk {

// Where a bus is on its route: local position and compass bearing of travel.
struct RoutePose {
  Vec2 at{};
  double bearing_deg{};
};

// Closed bus route in local meters, stored as straight legs tagged with
// their distance from the route start. Zero-length legs are dropped.
class RoutePath {
public:
  RoutePath() = default;
  explicit RoutePath(const std::vector<Vec2>& vertices);

  // Loop through `waypoints` along a tension-0 cardinal spline, with
  // `samples_per_leg` straight pieces between consecutive waypoints.
  // Fewer than three waypoints give an empty route.
  static RoutePath smoothed(const std::vector<Vec2>& waypoints, int samples_per_leg = 16);

  bool empty() const { return legs_.empty(); }
  double length() const { return length_; }
  std::size_t leg_count() const { return legs_.size(); }

  // Distance along the route folded into [0, length).
  double wrap(double s) const;

  RoutePose pose_at(double s) const;

  // Leg start points plus the start repeated at the end, for drawing.
  std::vector<Vec2> outline() const;

private:
  struct Leg {
    Vec2 from;
    Vec2 to;
    double start_m;
    double length_m;
    double bearing_deg;
  };

  const Leg& leg_at_(double s) const;

  std::vector<Leg> legs_{};
  double length_{0.0};
};

} // namespace bustrk
