#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>
#include <bustrk/fix.hpp>
#include <bustrk/geo.hpp>
#include <bustrk/route_path.hpp>

namespace bustrk {

struct RouteStop {
  double s_m = 0.0;      // arc position along the route
  double dwell_s = 20.0; // time spent stopped
};

struct BusState {
  VehicleId id{};
  double s = 0.0;             // arc position [0, length)
  double speed_mps = 0.0;
  double cruise_mps = 9.0;
  std::uint64_t laps = 0;
  double dwell_left_s = 0.0;
  std::size_t next_stop = 0;
  double next_report_s = 0.0;
  std::uint64_t seq = 0;      // reports emitted
  RawFix last_fix{};
};

// How a simulated GPS unit reports.
struct ReportProfile {
  double min_interval_s = 3.0;
  double max_interval_s = 5.0;
  double dropout_prob = 0.0;     // chance a due report is lost
  double position_noise_m = 0.0; // gaussian sigma per axis
};

// Buses driving a closed route with stops, producing RawFix reports.
class RouteSim {
public:
  RouteSim() = default;
  RouteSim(RoutePath route, GeoPoint origin) { set_route(std::move(route), origin); }

  void set_route(RoutePath route, GeoPoint origin);
  const RoutePath& route() const { return route_; }
  const GeoPoint& origin() const { return origin_; }

  // Stops are kept sorted by arc position and wrapped into the route.
  void set_stops(std::vector<RouteStop> stops);
  const std::vector<RouteStop>& stops() const { return stops_; }

  void set_profile(const ReportProfile& p) { profile_ = p; }
  const ReportProfile& profile() const { return profile_; }

  // --- Bus management
  void clear_buses() { buses_.clear(); }
  void add_bus(VehicleId id, double cruise_mps, double s0 = 0.0);
  std::size_t bus_count() const { return buses_.size(); }
  const BusState* bus_by_index(std::size_t idx) const;
  const BusState* bus_by_id(const VehicleId& id) const;

  // --- Simulation
  void step(double dt_sec);

  // Emit every report due at `sim_time_s`. Returns how many were appended.
  std::size_t collect_reports(double sim_time_s, std::mt19937& rng, std::vector<VehicleFix>& out);

  // True position of a bus (no noise).
  GeoPoint bus_position(const BusState& b) const;

private:
  double forward_distance_(double from_s, double to_s) const;
  void step_bus_(BusState& b, double dt_sec);

  RoutePath route_{};
  GeoPoint origin_{};
  std::vector<RouteStop> stops_{};
  ReportProfile profile_{};
  std::vector<BusState> buses_{};
};

} // namespace bustrk
