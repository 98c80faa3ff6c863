#include <bustrk/route_sim.hpp>
#include <algorithm>
#include <cmath>

namespace bustrk {

// Closer than this to a stop counts as arrived.
static constexpr double kArriveEpsM = 0.5;
// Same limit for pulling away and braking.
static constexpr double kAccelMps2 = 1.2;

void RouteSim::set_route(RoutePath route, GeoPoint origin) {
  route_ = std::move(route);
  origin_ = origin;
  set_stops(stops_);
}

void RouteSim::set_stops(std::vector<RouteStop> stops) {
  for (auto& st : stops) {
    st.s_m = route_.wrap(st.s_m);
    if (st.dwell_s < 0.0) st.dwell_s = 0.0;
  }
  std::sort(stops.begin(), stops.end(), [](const RouteStop& a, const RouteStop& b){ return a.s_m < b.s_m; });
  stops_ = std::move(stops);
  for (auto& b : buses_) b.next_stop = 0;
}

void RouteSim::add_bus(VehicleId id, double cruise_mps, double s0) {
  BusState b;
  b.id = std::move(id);
  b.cruise_mps = cruise_mps > 0.0 ? cruise_mps : 0.0;
  b.s = route_.wrap(s0);
  // First stop ahead of the start position.
  for (std::size_t i = 0; i < stops_.size(); ++i) {
    if (stops_[i].s_m > b.s) { b.next_stop = i; break; }
  }
  buses_.push_back(std::move(b));
}

const BusState* RouteSim::bus_by_index(std::size_t idx) const {
  if (idx >= buses_.size()) return nullptr;
  return &buses_[idx];
}

const BusState* RouteSim::bus_by_id(const VehicleId& id) const {
  for (const auto& b : buses_) if (b.id == id) return &b;
  return nullptr;
}

double RouteSim::forward_distance_(double from_s, double to_s) const {
  const double L = route_.length();
  double d = to_s - from_s;
  if (d <= 0.0) d += L;
  return d;
}

void RouteSim::step(double dt_sec) {
  if (route_.empty() || dt_sec <= 0.0) return;
  for (auto& b : buses_) step_bus_(b, dt_sec);
}

void RouteSim::step_bus_(BusState& b, double dt_sec) {
  const double L = route_.length();

  if (b.dwell_left_s > 0.0) {
    b.speed_mps = 0.0;
    b.dwell_left_s -= dt_sec;
    if (b.dwell_left_s <= 0.0) {
      b.dwell_left_s = 0.0;
      if (!stops_.empty()) b.next_stop = (b.next_stop + 1) % stops_.size();
    }
    return;
  }

  const bool has_stop = !stops_.empty();
  const double to_stop = has_stop ? forward_distance_(b.s, stops_[b.next_stop].s_m) : L;

  // Brake when the stopping distance reaches the next stop.
  const double brake_m = (b.speed_mps * b.speed_mps) / (2.0 * kAccelMps2);
  const double target = (has_stop && to_stop <= brake_m + kArriveEpsM) ? 0.0 : b.cruise_mps;
  const double dv = std::clamp(target - b.speed_mps, -kAccelMps2 * dt_sec, kAccelMps2 * dt_sec);
  b.speed_mps = std::max(0.0, b.speed_mps + dv);

  const double ds = b.speed_mps * dt_sec;
  if (has_stop && (ds >= to_stop || to_stop <= kArriveEpsM)) {
    // Land exactly on the stop so the next leg measures a full lap to it.
    const RouteStop& st = stops_[b.next_stop];
    if (st.s_m < b.s) ++b.laps;
    b.s = st.s_m;
    b.speed_mps = 0.0;
    b.dwell_left_s = st.dwell_s;
    if (b.dwell_left_s <= 0.0) b.next_stop = (b.next_stop + 1) % stops_.size();
    return;
  }

  b.s += ds;
  while (b.s >= L) {
    b.s -= L;
    ++b.laps;
  }
}

GeoPoint RouteSim::bus_position(const BusState& b) const {
  return from_local_m(origin_, route_.pose_at(b.s).at);
}

std::size_t RouteSim::collect_reports(double sim_time_s, std::mt19937& rng, std::vector<VehicleFix>& out) {
  const double lo = std::max(0.0, profile_.min_interval_s);
  const double hi = std::max(lo, profile_.max_interval_s);
  std::uniform_real_distribution<double> gap(lo, hi);
  std::uniform_real_distribution<double> U(0.0, 1.0);
  std::normal_distribution<double> noise(0.0, profile_.position_noise_m > 0.0 ? profile_.position_noise_m : 1.0);

  std::size_t n = 0;
  for (auto& b : buses_) {
    if (sim_time_s < b.next_report_s) continue;
    b.next_report_s = sim_time_s + gap(rng);
    if (profile_.dropout_prob > 0.0 && U(rng) < profile_.dropout_prob) continue;

    const RoutePose pose = route_.pose_at(b.s);
    Vec2 at = pose.at;
    if (profile_.position_noise_m > 0.0) {
      at.x += noise(rng);
      at.y += noise(rng);
    }
    const GeoPoint p = from_local_m(origin_, at);

    RawFix f{};
    f.lat = p.lat;
    f.lng = p.lng;
    f.speed_mps = b.speed_mps;
    f.heading_deg = pose.bearing_deg;
    f.recorded_at_ms = sim_time_s * 1000.0;
    f.trip_active = true;

    b.last_fix = f;
    ++b.seq;
    out.push_back(VehicleFix{b.id, b.seq, f});
    ++n;
  }
  return n;
}

} // namespace bustrk
