#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <random>

#include <bustrk/estimator.hpp>
#include <bustrk/tracker.hpp>

using Catch::Approx;
using namespace bustrk;

namespace {
RawFix make_fix(double lat, double lng, double speed, double heading, double t) {
  RawFix f{};
  f.lat = lat; f.lng = lng; f.speed_mps = speed; f.heading_deg = heading; f.recorded_at_ms = t;
  return f;
}
}

TEST_CASE("Stopped bus settles on the new fix without projecting") {
  PositionEstimator est;
  est.ingest(make_fix(10.0, 10.0, 0.0, 0.0, 0.0), 0.0);
  const auto r = est.ingest(make_fix(10.0, 10.0, 0.0, 0.0, 4000.0), 4000.0);
  REQUIRE(r.action == FixAction::Glide);
  REQUIRE(r.motion == MotionState::Stopped);
  REQUIRE_FALSE(r.projection_target.has_value());
  est.advance(500.0);
  REQUIRE(est.position().lat == Approx(10.0));
  REQUIRE(est.position().lng == Approx(10.0));
}

TEST_CASE("Moving bus glides toward a point due east of the fix") {
  PositionEstimator est;
  est.ingest(make_fix(10.0, 10.0, 10.0, 90.0, 0.0), 0.0);
  const RawFix b = make_fix(10.00003, 10.00003, 10.0, 90.0, 4000.0);
  const auto r = est.ingest(b, 4000.0);
  REQUIRE(r.action == FixAction::Glide);
  REQUIRE(r.duration_ms == Approx(5200.0));
  REQUIRE(r.projection_target.has_value());

  const GeoPoint& target = *r.projection_target;
  REQUIRE(target.lat == Approx(b.lat).margin(1e-12));
  REQUIRE(target.lng > b.lng);
  const Vec2 off = to_local_m(position_of(b), target);
  REQUIRE(off.x == Approx(52.0).margin(1e-6));
  REQUIRE(off.y == Approx(0.0).margin(1e-9));
}

TEST_CASE("Long silence snaps even without movement") {
  PositionEstimator est;
  est.ingest(make_fix(10.0, 10.0, 0.0, 0.0, 0.0), 0.0);
  const auto r = est.ingest(make_fix(10.0, 10.0, 0.0, 0.0, 20000.0), 20000.0);
  REQUIRE(r.action == FixAction::Snap);
  REQUIRE(est.state() == TrackState::Snapped);
  REQUIRE_FALSE(est.animating());
}

TEST_CASE("Heading 350 to 5 turns 15 degrees through north") {
  VehicleTracker vt;
  vt.ingest(make_fix(10.0, 10.0, 5.0, 350.0, 0.0), 0.0);
  vt.ingest(make_fix(10.0001, 10.0, 5.0, 5.0, 3000.0), 3000.0);
  REQUIRE(vt.heading().last_delta() == Approx(15.0));
  REQUIRE(vt.heading().target() == Approx(365.0));

  double prev = vt.frame(3000.0).heading_deg;
  for (int i = 0; i < 7; ++i) {
    vt.advance(50.0);
    const double h = vt.heading().displayed();
    REQUIRE(h >= prev);
    REQUIRE(h <= 365.0);
    prev = h;
  }
  vt.advance(50.0);
  REQUIRE(vt.frame(3400.0).heading_deg == Approx(5.0));
}

TEST_CASE("Silent active trip goes stale and recovers on the next fix") {
  VehicleTracker vt;
  vt.ingest(make_fix(10.0, 10.0, 0.0, 0.0, 0.0), 0.0);
  REQUIRE(vt.frame(310000.0).stale);
  vt.ingest(make_fix(10.0, 10.0, 0.0, 0.0, 310000.0), 310000.0);
  REQUIRE_FALSE(vt.frame(310000.0).stale);
}

TEST_CASE("Glide converges on the projection target") {
  PositionEstimator est;
  double lat = 12.97;
  double t = 0.0;
  est.ingest(make_fix(lat, 77.59, 9.0, 30.0, t), t);
  for (int i = 0; i < 6; ++i) {
    t += 3000.0 + 250.0 * i;
    lat += 0.0002;
    const auto r = est.ingest(make_fix(lat, 77.5901 + 0.0001 * i, 9.0, 30.0, t), t);
    REQUIRE(r.action == FixAction::Glide);
    REQUIRE(r.projection_target.has_value());
    est.advance(r.duration_ms);
    REQUIRE(est.position().lat == Approx(r.projection_target->lat).margin(1e-9));
    REQUIRE(est.position().lng == Approx(r.projection_target->lng).margin(1e-9));
  }
}

TEST_CASE("Projection duration never leaves its bounds") {
  const EngineTuning tuning{};
  std::mt19937 rng(42);
  std::uniform_real_distribution<double> exp10(-3.0, 7.0);
  for (int i = 0; i < 500; ++i) {
    const double interval = std::pow(10.0, exp10(rng));
    const double d = projection_duration_ms(interval, tuning);
    REQUIRE(d >= 2000.0);
    REQUIRE(d <= 8000.0);
  }
}

TEST_CASE("First contact is placed at once whatever the motion") {
  for (double speed : {0.0, 0.4, 3.0, 25.0}) {
    PositionEstimator est;
    est.ingest(make_fix(12.97, 77.59, speed, 200.0, 5000.0), 5000.0);
    REQUIRE(est.position().lat == Approx(12.97).margin(1e-12));
    REQUIRE(est.position().lng == Approx(77.59).margin(1e-12));
    REQUIRE(est.state() != TrackState::NoFix);
  }
}

TEST_CASE("A jump past the threshold snaps at any interval") {
  for (double gap : {100.0, 1000.0, 5000.0, 9999.0}) {
    PositionEstimator est;
    est.ingest(make_fix(12.97, 77.59, 10.0, 0.0, 0.0), 0.0);
    const auto r = est.ingest(make_fix(12.98, 77.59, 10.0, 0.0, gap), gap);
    REQUIRE(r.action == FixAction::Snap);
    REQUIRE(est.position().lat == Approx(12.98).margin(1e-12));
  }
}
