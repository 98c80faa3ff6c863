#include <bustrk/route_path.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <bustrk/tween.hpp>

namespace bustrk {

RoutePath::RoutePath(const std::vector<Vec2>& vertices) {
  const std::size_t n = vertices.size();
  if (n < 2) return;
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& a = vertices[i];
    const Vec2& b = vertices[(i + 1) % n]; // last vertex joins back to the first
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double len = std::hypot(dx, dy);
    if (len <= 0.0) continue;
    legs_.push_back(Leg{a, b, length_, len, bearing_from_planar(std::atan2(dy, dx))});
    length_ += len;
  }
}

RoutePath RoutePath::smoothed(const std::vector<Vec2>& waypoints, int samples_per_leg) {
  const std::size_t n = waypoints.size();
  if (n < 3 || samples_per_leg <= 0) return RoutePath{};

  auto wp = [&](std::size_t i) -> const Vec2& { return waypoints[i % n]; };

  std::vector<Vec2> pts;
  pts.reserve(n * static_cast<std::size_t>(samples_per_leg));
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& p0 = wp(i);
    const Vec2& p1 = wp(i + 1);
    // Tangents from the neighbouring waypoints.
    const Vec2 m0{(p1.x - wp(i + n - 1).x) * 0.5, (p1.y - wp(i + n - 1).y) * 0.5};
    const Vec2 m1{(wp(i + 2).x - p0.x) * 0.5, (wp(i + 2).y - p0.y) * 0.5};

    for (int k = 0; k < samples_per_leg; ++k) {
      const double t  = double(k) / double(samples_per_leg);
      const double t2 = t * t;
      const double t3 = t2 * t;
      const double h00 =  2.0 * t3 - 3.0 * t2 + 1.0;
      const double h10 =        t3 - 2.0 * t2 + t;
      const double h01 = -2.0 * t3 + 3.0 * t2;
      const double h11 =        t3 -       t2;
      pts.push_back(Vec2{h00 * p0.x + h10 * m0.x + h01 * p1.x + h11 * m1.x,
                         h00 * p0.y + h10 * m0.y + h01 * p1.y + h11 * m1.y});
    }
  }
  return RoutePath{pts};
}

double RoutePath::wrap(double s) const {
  if (length_ <= 0.0 || !std::isfinite(s)) return 0.0;
  double w = std::fmod(s, length_);
  if (w < 0.0) w += length_;
  return w >= length_ ? 0.0 : w;
}

const RoutePath::Leg& RoutePath::leg_at_(double s) const {
  // Last leg starting at or before s.
  auto it = std::upper_bound(legs_.begin(), legs_.end(), s,
                             [](double v, const Leg& leg){ return v < leg.start_m; });
  return it == legs_.begin() ? legs_.front() : *std::prev(it);
}

RoutePose RoutePath::pose_at(double s) const {
  if (legs_.empty()) return RoutePose{};
  const double w = wrap(s);
  const Leg& leg = leg_at_(w);
  const double f = std::clamp((w - leg.start_m) / leg.length_m, 0.0, 1.0);
  return RoutePose{lerp(leg.from, leg.to, f), leg.bearing_deg};
}

std::vector<Vec2> RoutePath::outline() const {
  std::vector<Vec2> out;
  if (legs_.empty()) return out;
  out.reserve(legs_.size() + 1);
  for (const auto& leg : legs_) out.push_back(leg.from);
  out.push_back(legs_.front().from);
  return out;
}

} // namespace bustrk
