#pragma once
#include <deque>
#include <optional>
#include <string>
#include <vector>
#include <bustrk/estimator.hpp>
#include <bustrk/feed.hpp>
#include <bustrk/fleet.hpp>

namespace bustrk {

class FeedRunner;

// RAII application that renders the smoothed fleet and HUD. Acts as the
// render surface for the selected bus, following its raw fixes.
class ViewerApp : public RenderSurface {
public:
  ViewerApp(FixFeed& feed, const EngineTuning& tuning, GeoPoint origin);
  int run(); // returns 0 on normal exit

  // Static route polyline (local meters) when the feed is not a FeedRunner.
  void set_route_points(std::vector<Vec2> pts) { route_pts_ = std::move(pts); }
  void set_runner(FeedRunner* runner) { runner_ = runner; }

  void recenter(const GeoPoint& center) override;

private:
  // Input & data flow
  void process_input_();
  void pump_fixes_(double wall_elapsed_ms);
  void select_(std::size_t idx);
  // Rendering
  void render_frame_();
  void draw_route_();
  void draw_fixes_();
  void draw_bus_(const VehicleId& id, const TrackerFrame& f, bool selected);
  void draw_viewer_(const TrackerFrame& f);
  void draw_hud_();

  // Helpers
  struct Vec2f { float x; float y; };
  Vec2f worldToScreen_(const GeoPoint& p) const;
  Vec2f localToScreen_(double x, double y) const;

  // Dependencies
  FixFeed& feed_;
  FeedRunner* runner_{nullptr};
  GeoPoint origin_;
  FleetTracker fleet_;

  // Raw fix trail per vehicle (most recent last)
  struct TrailFix { VehicleId id; GeoPoint p; };
  std::deque<TrailFix> trail_{};
  std::vector<Vec2> route_pts_{};

  // UI state
  std::vector<VehicleId> ids_{};
  std::size_t selected_{0};
  VehicleTracker* attached_{nullptr};
  double clock_ms_{0.0};
  float scale_px_per_m_{0.35f};
  Vec2 camera_m_{};            // screen center in local meters
  JobSlot<Vec2> camera_job_{};
  bool follow_{true};
  bool viewer_enabled_{true};
  GeoPoint viewer_loc_{};
  std::string last_event_{};
};

} // namespace bustrk
