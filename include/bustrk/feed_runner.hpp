#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>
#include <vector>
#include <bustrk/feed.hpp>
#include <bustrk/fix_buffer.hpp>
#include <bustrk/route_sim.hpp>

namespace bustrk {

enum class RoutePreset : int {
  SchoolLoop = 0,
  Crosstown = 1,
  Count
};

// Owns the simulation thread and publishes feed frames. The FixFeed side
// (clock_ms, poll) is meant for the render thread only.
class FeedRunner : public FixFeed {
public:
  FeedRunner() = default;
  ~FeedRunner() override { stop(); }
  FeedRunner(const FeedRunner&) = delete;
  FeedRunner& operator=(const FeedRunner&) = delete;

  void start();
  void stop();

  // World setup (call before start)
  void configure_default_world();          // school loop, 3 buses
  void set_default_buses(std::size_t n);
  void set_profile(const ReportProfile& p) { profile_ = p; }
  void set_seed(std::uint32_t seed) { seed_ = seed; }

  // Hot changes while running (safe from the UI thread)
  void request_reseed(std::size_t n);
  void request_route_preset(RoutePreset p);

  RoutePreset current_preset() const { return preset_.load(std::memory_order_relaxed); }
  const char* preset_name() const;
  GeoPoint origin() const { return origin_; }

  // Local-meter polyline of the route in use, sampled at start/preset change.
  std::vector<Vec2> route_points() const;

  // FixFeed
  double clock_ms() const override { return clock_ms_.load(std::memory_order_acquire); }
  void pump(double) override {}
  std::size_t poll(std::vector<VehicleFix>& out) override;
  double time_scale() const override { return time_scale_.load(std::memory_order_relaxed); }
  void set_time_scale(double scale) override { time_scale_.store(scale < 0.0 ? 0.0 : scale); }
  const char* name() const override { return "simulated"; }

  LatestBuffer<FeedFrame>& buffer() { return buffer_; }

  static RoutePath make_preset(RoutePreset p);
  static std::vector<RouteStop> preset_stops(RoutePreset p, double route_length);

private:
  void thread_main_();
  void rebuild_world_(RouteSim& sim, RoutePreset p);

  std::uint64_t epoch_{0}; // sim thread only

  std::thread th_;
  std::atomic<bool> running_{false};

  // Sim & data sharing
  LatestBuffer<FeedFrame> buffer_;
  std::atomic<double> clock_ms_{0.0};
  std::atomic<double> time_scale_{1.0}; // 0.0 = paused

  // Consumer side
  std::uint64_t cursor_{0};
  FeedFrame frame_{};
  FrameCursor seen_{};
  std::uint64_t seen_epoch_{0};

  // World setup used by the thread
  GeoPoint origin_{12.9716, 77.5946};
  ReportProfile profile_{3.0, 5.0, 0.05, 3.0};
  std::uint32_t seed_{12345};
  std::atomic<RoutePreset> preset_{RoutePreset::SchoolLoop};
  struct BusInit { VehicleId id; double cruise_mps; double s_frac; };
  std::vector<BusInit> initial_buses_{};

  // Route polyline handed to the render thread on every (re)build
  LatestBuffer<std::vector<Vec2>> route_buf_;
  mutable std::uint64_t route_cursor_{0};
  mutable std::vector<Vec2> route_cache_{};

  // Hot reseed / preset change control
  std::atomic<bool> pending_reset_{false};
  std::atomic<std::size_t> pending_reset_n_{0};
  std::atomic<bool> pending_preset_change_{false};
  std::atomic<int>  pending_preset_{-1};
};

} // namespace bustrk
