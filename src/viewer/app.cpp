#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include <bustrk/viewer/app.hpp>
#include <bustrk/display.hpp>
#include <bustrk/feed_runner.hpp>
#include <bustrk/geo.hpp>

namespace bustrk {

namespace {

static constexpr std::size_t kTrailMax = 90;     // raw fixes kept on screen
static constexpr double kCameraMs = 1200.0;      // camera glide on recenter

static const char* warpLabel(double w) {
  if (w == 0.0)  return "Paused";
  if (w == 0.5)  return "0.5x";
  if (w == 1.0)  return "1x";
  if (w == 4.0)  return "4x";
  if (w == 10.0) return "10x";
  if (w == 30.0) return "30x";
  return "custom";
}

static Color toneColor(MarkerTone t) {
  switch (t) {
    case MarkerTone::Moving: return Color{ 22,163, 74,255}; // green
    case MarkerTone::Idle:   return Color{245,158, 11,255}; // amber
    case MarkerTone::Inactive:
    default:                 return Color{156,163,175,255}; // grey
  }
}

// --- HUD layout (keep in sync with draw_hud_) ---
static constexpr int kHUD_LINE1_Y = 20;  // size 20
static constexpr int kHUD_LINE2_Y = 46;  // size 18
static constexpr int kHUD_LINE3_Y = 70;  // size 18
static constexpr int kHUD_LINE4_Y = 94;  // size 16
static constexpr int kHUD_KEYS_PAD = 24; // from bottom

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(FixFeed& feed, const EngineTuning& tuning, GeoPoint origin)
  : feed_(feed), origin_(origin), fleet_(tuning) {
  viewer_loc_ = from_local_m(origin_, Vec2{150.0, -420.0}); // a parent near the school gate
  fleet_.set_viewer_location(viewer_loc_);
  clock_ms_ = feed_.clock_ms();
}

ViewerApp::Vec2f ViewerApp::localToScreen_(double x, double y) const {
  const float cx = GetScreenWidth()  * 0.5f;
  const float cy = GetScreenHeight() * 0.5f;
  return { cx + float((x - camera_m_.x) * scale_px_per_m_),
           cy - float((y - camera_m_.y) * scale_px_per_m_) };
}

ViewerApp::Vec2f ViewerApp::worldToScreen_(const GeoPoint& p) const {
  const Vec2 m = to_local_m(origin_, p);
  return localToScreen_(m.x, m.y);
}

void ViewerApp::recenter(const GeoPoint& center) {
  if (!follow_) return;
  const Vec2 target = to_local_m(origin_, center);
  camera_job_.replace(Tween<Vec2>(camera_m_, target, kCameraMs, Easing::EaseInOutCubic));
}

int ViewerApp::run() {
  const int W = 1100, H = 800;
  InitWindow(W, H, "bustrk - Live Bus Viewer");
  SetTargetFPS(60);
  TraceLog(LOG_INFO, "[viewer] feed=%s", feed_.name());

  while (!WindowShouldClose()) {
    process_input_();
    pump_fixes_(double(GetFrameTime()) * 1000.0);
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  // Time warp controls
  if (IsKeyPressed(KEY_SPACE)) {
    const double cur = feed_.time_scale();
    feed_.set_time_scale(cur == 0.0 ? 1.0 : 0.0);
  }
  if (IsKeyPressed(KEY_ONE))   feed_.set_time_scale(0.5);
  if (IsKeyPressed(KEY_TWO))   feed_.set_time_scale(1.0);
  if (IsKeyPressed(KEY_THREE)) feed_.set_time_scale(4.0);
  if (IsKeyPressed(KEY_FOUR))  feed_.set_time_scale(10.0);
  if (IsKeyPressed(KEY_FIVE))  feed_.set_time_scale(30.0);

  // Zoom
  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_KP_ADD))      scale_px_per_m_ *= 1.01f;
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_KP_SUBTRACT)) scale_px_per_m_ *= 0.99f;

  // Manual pan drops follow mode
  const double pan_step = 4.0 / scale_px_per_m_; // meters per frame while key held
  bool panned = false;
  if (IsKeyDown(KEY_LEFT))  { camera_m_.x -= pan_step; panned = true; }
  if (IsKeyDown(KEY_RIGHT)) { camera_m_.x += pan_step; panned = true; }
  if (IsKeyDown(KEY_UP))    { camera_m_.y += pan_step; panned = true; }
  if (IsKeyDown(KEY_DOWN))  { camera_m_.y -= pan_step; panned = true; }
  if (panned && follow_) {
    follow_ = false;
    camera_job_.cancel();
  }
  if (IsKeyPressed(KEY_F)) {
    follow_ = !follow_;
    if (!follow_) camera_job_.cancel();
  }

  if (IsKeyPressed(KEY_TAB) && !ids_.empty()) select_((selected_ + 1) % ids_.size());

  // Simulate the viewer granting / revoking location permission
  if (IsKeyPressed(KEY_L)) {
    viewer_enabled_ = !viewer_enabled_;
    if (viewer_enabled_) fleet_.set_viewer_location(viewer_loc_);
    else                 fleet_.set_viewer_location(std::nullopt);
    TraceLog(LOG_INFO, "[viewer] own location %s", viewer_enabled_ ? "available" : "denied");
  }

  if (runner_) {
    // Cycle bus count 1 -> 2 -> 3 -> 5 -> 1
    if (IsKeyPressed(KEY_N)) {
      static const std::size_t N_CYCLE[4] = {1, 2, 3, 5};
      static int n_idx = 2;
      n_idx = (n_idx + 1) % 4;
      runner_->request_reseed(N_CYCLE[n_idx]);
      // every trip restarts, so drop all tracked state
      fleet_.retain_only({});
      trail_.clear();
      attached_ = nullptr;
    }
    if (IsKeyPressed(KEY_T)) {
      const int next = (static_cast<int>(runner_->current_preset()) + 1) % static_cast<int>(RoutePreset::Count);
      runner_->request_route_preset(static_cast<RoutePreset>(next));
      fleet_.retain_only({});
      trail_.clear();
      attached_ = nullptr;
    }
  }
}

void ViewerApp::select_(std::size_t idx) {
  if (ids_.empty()) return;
  selected_ = idx % ids_.size();
  VehicleTracker* t = fleet_.find(ids_[selected_]);
  if (t == attached_) return;
  if (attached_) attached_->attach_surface(nullptr);
  if (t) t->attach_surface(this);
  attached_ = t;
  TraceLog(LOG_INFO, "[viewer] following %s", ids_[selected_].c_str());
}

void ViewerApp::pump_fixes_(double wall_elapsed_ms) {
  feed_.pump(wall_elapsed_ms);
  const double now = feed_.clock_ms();
  const double elapsed = std::max(0.0, now - clock_ms_);
  clock_ms_ = now;

  // Step running animations first so new jobs start from the current frame.
  fleet_.advance(elapsed);
  if (auto v = camera_job_.advance(wall_elapsed_ms)) camera_m_ = *v;

  std::vector<VehicleFix> fresh;
  feed_.poll(fresh);
  for (const auto& vf : fresh) {
    const IngestResult r = fleet_.ingest(vf.id, vf.fix, now);
    if (r.action == FixAction::Dropped) {
      TraceLog(LOG_WARNING, "[viewer] dropped malformed fix from %s", vf.id.c_str());
      continue;
    }
    trail_.push_back(TrailFix{vf.id, position_of(vf.fix)});
    while (trail_.size() > kTrailMax) trail_.pop_front();
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%s %s (%.1fs gap)", vf.id.c_str(), to_string(r.action), r.interval_ms / 1000.0);
    last_event_ = buf;
  }

  const auto ids = fleet_.ids();
  if (ids != ids_) {
    const VehicleId keep = (selected_ < ids_.size()) ? ids_[selected_] : VehicleId{};
    ids_ = ids;
    auto it = std::find(ids_.begin(), ids_.end(), keep);
    attached_ = nullptr; // trackers may have been dropped; re-attach below
    for (const auto& id : ids_) if (auto* t = fleet_.find(id)) t->attach_surface(nullptr);
    select_(it != ids_.end() ? std::size_t(it - ids_.begin()) : 0);
  }
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{236,232,224,255}); // map paper

  draw_route_();
  draw_fixes_();

  const double now = clock_ms_;
  for (std::size_t i = 0; i < ids_.size(); ++i) {
    if (auto f = fleet_.frame(ids_[i], now)) draw_bus_(ids_[i], *f, i == selected_);
  }
  if (selected_ < ids_.size()) {
    if (auto f = fleet_.frame(ids_[selected_], now)) draw_viewer_(*f);
  }

  draw_hud_();
  EndDrawing();
}

void ViewerApp::draw_route_() {
  std::vector<Vec2> pts = runner_ ? runner_->route_points() : route_pts_;
  if (pts.size() < 2) return;
  const float road_px = std::max(3.0f, 14.0f * scale_px_per_m_);
  for (std::size_t i = 1; i < pts.size(); ++i) {
    auto a = localToScreen_(pts[i-1].x, pts[i-1].y);
    auto b = localToScreen_(pts[i].x,   pts[i].y);
    DrawLineEx({a.x,a.y}, {b.x,b.y}, road_px, Color{255,255,255,255});
  }
  for (std::size_t i = 1; i < pts.size(); ++i) {
    auto a = localToScreen_(pts[i-1].x, pts[i-1].y);
    auto b = localToScreen_(pts[i].x,   pts[i].y);
    DrawLineEx({a.x,a.y}, {b.x,b.y}, 1.5f, Color{190,185,175,255});
  }
  // School gate
  auto g = localToScreen_(0.0, 0.0);
  DrawRectangle(int(g.x) - 5, int(g.y) - 5, 10, 10, Color{29,78,216,255});
}

void ViewerApp::draw_fixes_() {
  for (const auto& tf : trail_) {
    auto p = worldToScreen_(tf.p);
    DrawCircleV({p.x, p.y}, 2.5f, Color{120,120,130,160});
  }
}

void ViewerApp::draw_bus_(const VehicleId& id, const TrackerFrame& f, bool selected) {
  if (!f.has_fix) return;
  auto s = worldToScreen_(f.position);
  Vector2 pos = { s.x, s.y };
  const Color col = toneColor(f.tone);

  // compass heading: 0 = north (screen up), 90 = east (screen right)
  const float h = float(f.heading_deg * kDegToRad);
  const float c = std::cos(h), sn = std::sin(h);
  const float len = 14.0f, wid = 8.0f;
  Vector2 nose  = { pos.x + sn*len,              pos.y - c*len };
  Vector2 tailL = { pos.x - sn*len*0.6f - c*wid, pos.y + c*len*0.6f - sn*wid };
  Vector2 tailR = { pos.x - sn*len*0.6f + c*wid, pos.y + c*len*0.6f + sn*wid };

  if (selected) DrawCircleLines(int(pos.x), int(pos.y), 20.0f, Color{29,78,216,255});
  DrawCircleV(pos, 12.0f, Color{255,255,255,255});
  DrawTriangle(nose, tailR, tailL, col);
  DrawCircleV(pos, 5.0f, col);
  DrawText(id.c_str(), int(pos.x) + 16, int(pos.y) - 8, 14, Color{40,40,50,255});
}

void ViewerApp::draw_viewer_(const TrackerFrame& f) {
  if (!f.viewer) return;
  auto v = worldToScreen_(*f.viewer);
  DrawCircleV({v.x, v.y}, 9.0f, Color{59,130,246,80});
  DrawCircleV({v.x, v.y}, 5.0f, Color{59,130,246,255});
  if (f.has_fix) {
    auto b = worldToScreen_(f.position);
    DrawLineEx({v.x, v.y}, {b.x, b.y}, 1.0f, Color{59,130,246,120});
  }
}

void ViewerApp::draw_hud_() {
  const double warp = feed_.time_scale();
  const char* route = runner_ ? runner_->preset_name() : "recorded";

  DrawText(TextFormat("feed=%s  route=%s  buses=%d  t=%.1fs  warp=%s  %s",
                      feed_.name(), route, (int)ids_.size(), clock_ms_ / 1000.0,
                      warpLabel(warp), follow_ ? "follow" : "free"),
           20, kHUD_LINE1_Y, 20, Color{30,30,40,255});

  if (selected_ < ids_.size()) {
    const auto f = fleet_.frame(ids_[selected_], clock_ms_);
    const auto* t = fleet_.find(ids_[selected_]);
    if (f && t) {
      const std::string speed = format_speed(f->has_fix ? std::optional<double>(f->raw_speed_mps) : std::nullopt);
      const std::string since = format_time_since(f->has_fix ? std::optional<double>(f->last_fix_ms) : std::nullopt, clock_ms_);
      DrawText(TextFormat("%s  %s  %s  %s  updated %s  hdg %.0f  state=%s  dropped=%llu",
                          ids_[selected_].c_str(), to_string(f->status), to_string(f->tone),
                          speed.c_str(), since.c_str(), normalize_deg(f->heading_deg),
                          to_string(f->state),
                          (unsigned long long)t->estimator().dropped_fixes()),
               20, kHUD_LINE2_Y, 18, Color{40,40,55,255});

      const std::string dist = f->distance_km ? ("You are " + format_distance(*f->distance_km) + " away")
                                              : std::string("Your location is unavailable");
      DrawText(dist.c_str(), 20, kHUD_LINE3_Y, 18, Color{29,78,216,255});
      if (f->trip_started_ms) {
        const std::string trip = "on trip " + format_elapsed(*f->trip_started_ms, clock_ms_);
        DrawText(trip.c_str(), 20 + MeasureText(dist.c_str(), 18) + 24, kHUD_LINE3_Y, 18, Color{40,40,55,255});
      }

      if (f->stale) {
        const int bw = GetScreenWidth() - 40;
        DrawRectangle(20, kHUD_LINE4_Y + 22, bw, 28, Color{254,226,226,255});
        const std::string banner = format_no_signal(t->tuning().inactive_threshold_sec) + " - trip still active";
        DrawText(banner.c_str(), 30, kHUD_LINE4_Y + 27, 18, Color{185,28,28,255});
      }
    }
  }

  if (!last_event_.empty()) DrawText(last_event_.c_str(), 20, kHUD_LINE4_Y, 16, Color{90,90,100,255});

  DrawText("Space: Pause | 1..5: 0.5x 1x 4x 10x 30x | W/S: Zoom | Arrows: Pan | F: Follow | Tab: Next bus | L: My location | N: Buses | T: Route",
           20, GetScreenHeight() - kHUD_KEYS_PAD, 14, Color{80,80,90,255});
}

} // namespace bustrk
