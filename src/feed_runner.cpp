#include <bustrk/feed_runner.hpp>
#include <chrono>
#include <cstdio>
#include <random>
#include <string>

namespace bustrk {

RoutePath FeedRunner::make_preset(RoutePreset p) {
  // Control polygon in local meters (x east, y north) around the origin.
  std::vector<Vec2> ctrl;
  auto add = [&](double x, double y){ ctrl.push_back({x,y}); };

  switch (p) {
    case RoutePreset::Crosstown:
      // Long east-west run with a northern return leg
      add(-1400, -200); add(-700, -260); add(   0, -180); add( 700, -240);
      add( 1400, -150); add(1500,  150); add( 900,  320); add(   0,  260);
      add( -800,  340); add(-1500, 120);
      return RoutePath::smoothed(ctrl, 20);

    case RoutePreset::SchoolLoop:
    default:
      // Residential loop: school gate at the origin side, two estates north
      add(   0, -300); add( 450, -320); add( 700,  -50); add( 650,  350);
      add( 300,  600); add(-150,  520); add(-450,  650); add(-700,  300);
      add(-600, -100); add(-300, -280);
      return RoutePath::smoothed(ctrl, 20);
  }
}

std::vector<RouteStop> FeedRunner::preset_stops(RoutePreset p, double route_length) {
  std::vector<RouteStop> stops;
  if (route_length <= 0.0) return stops;
  switch (p) {
    case RoutePreset::Crosstown:
      for (double f : {0.0, 0.3, 0.55, 0.8}) stops.push_back({f * route_length, 25.0});
      break;
    case RoutePreset::SchoolLoop:
    default:
      stops.push_back({0.0, 45.0}); // school gate
      for (double f : {0.2, 0.4, 0.6, 0.8}) stops.push_back({f * route_length, 15.0});
      break;
  }
  return stops;
}

const char* FeedRunner::preset_name() const {
  switch (current_preset()) {
    case RoutePreset::SchoolLoop: return "School loop";
    case RoutePreset::Crosstown:  return "Crosstown";
    default: return "Unknown";
  }
}

void FeedRunner::configure_default_world() {
  preset_.store(RoutePreset::SchoolLoop);
  set_default_buses(3);
}

void FeedRunner::set_default_buses(std::size_t n) {
  if (n == 0) n = 1;
  initial_buses_.clear();
  for (std::size_t i = 0; i < n; ++i) {
    const double base = 8.0;                   // ~29 km/h
    const double jitter = 1.5 * double(i % 3); // 0, 1.5, 3.0
    initial_buses_.push_back(BusInit{
      "BUS-" + std::to_string(i + 1),
      base + jitter,
      double(i) / double(n) // even spacing along the route
    });
  }
}

void FeedRunner::request_reseed(std::size_t n) {
  pending_reset_n_.store(n, std::memory_order_relaxed);
  pending_reset_.store(true, std::memory_order_release);
}

void FeedRunner::request_route_preset(RoutePreset p) {
  pending_preset_.store(static_cast<int>(p), std::memory_order_relaxed);
  pending_preset_change_.store(true, std::memory_order_release);
}

std::vector<Vec2> FeedRunner::route_points() const {
  (void)route_buf_.try_consume_latest(route_cursor_, route_cache_); // keeps the cache when nothing new
  return route_cache_;
}

std::size_t FeedRunner::poll(std::vector<VehicleFix>& out) {
  std::size_t n = 0;
  while (buffer_.try_consume_latest(cursor_, frame_)) {
    if (frame_.epoch != seen_epoch_) {
      seen_.clear();
      seen_epoch_ = frame_.epoch;
    }
    n += seen_.take_new(frame_, out);
  }
  return n;
}

void FeedRunner::start() {
  if (running_.load()) return;
  if (initial_buses_.empty()) set_default_buses(3);
  running_.store(true);
  th_ = std::thread(&FeedRunner::thread_main_, this);
}

void FeedRunner::stop() {
  if (!running_.load()) return;
  running_.store(false);
  if (th_.joinable()) th_.join();
  std::printf("[feed] stopped at t=%.1fs\n", clock_ms() / 1000.0);
}

void FeedRunner::rebuild_world_(RouteSim& sim, RoutePreset p) {
  RoutePath path = make_preset(p);
  const double L = path.length();
  sim.set_route(std::move(path), origin_);
  sim.set_stops(preset_stops(p, L));
  sim.set_profile(profile_);
  sim.clear_buses();
  for (const auto& b : initial_buses_) sim.add_bus(b.id, b.cruise_mps, b.s_frac * L);
  ++epoch_;
  route_buf_.publish(sim.route().outline());
  std::printf("[feed] route '%s' %.0f m, %zu stops, %zu buses\n",
              preset_name(), L, sim.stops().size(), sim.bus_count());
}

void FeedRunner::thread_main_() {
  RouteSim sim;
  std::mt19937 rng(seed_);
  rebuild_world_(sim, current_preset());

  using clock = std::chrono::steady_clock;
  const double base_dt = 1.0 / 60.0; // 60 Hz wall cadence
  const auto   tick_ns = std::chrono::nanoseconds((long long)(base_dt * 1e9));
  auto next = clock::now();
  double sim_time = 0.0;
  std::uint64_t tick = 0;
  std::vector<VehicleFix> due;

  while (running_.load(std::memory_order_relaxed)) {
    if (pending_preset_change_.load(std::memory_order_acquire)) {
      pending_preset_change_.store(false, std::memory_order_relaxed);
      const int ip = pending_preset_.load(std::memory_order_relaxed);
      if (ip >= 0 && ip < static_cast<int>(RoutePreset::Count)) {
        preset_.store(static_cast<RoutePreset>(ip));
        rebuild_world_(sim, current_preset());
      }
    }

    if (pending_reset_.load(std::memory_order_acquire)) {
      pending_reset_.store(false, std::memory_order_relaxed);
      set_default_buses(pending_reset_n_.load(std::memory_order_relaxed));
      rebuild_world_(sim, current_preset());
    }

    const double warp = time_scale_.load(std::memory_order_relaxed);
    const double dt_eff = base_dt * (warp < 0.0 ? 0.0 : warp);
    if (dt_eff > 0.0) {
      sim.step(dt_eff);
      sim_time += dt_eff;
    }
    ++tick; // heartbeat even when paused

    due.clear();
    sim.collect_reports(sim_time, rng, due);

    FeedFrame f{};
    f.clock_ms = sim_time * 1000.0;
    f.tick = tick;
    f.epoch = epoch_;
    f.latest.reserve(sim.bus_count());
    for (std::size_t i = 0; i < sim.bus_count(); ++i) {
      const auto* b = sim.bus_by_index(i);
      if (b && b->seq > 0) f.latest.push_back(VehicleFix{b->id, b->seq, b->last_fix});
    }

    clock_ms_.store(f.clock_ms, std::memory_order_release);
    buffer_.publish(f);

    next += tick_ns;
    std::this_thread::sleep_until(next);
  }
}

} // namespace bustrk
