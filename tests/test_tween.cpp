#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <bustrk/tween.hpp>

using Catch::Approx;
using namespace bustrk;

TEST_CASE("easing curves hit their endpoints") {
  for (Easing e : {Easing::Linear, Easing::EaseOutCubic, Easing::EaseInOutCubic}) {
    REQUIRE(apply_easing(e, 0.0) == Approx(0.0).margin(1e-12));
    REQUIRE(apply_easing(e, 1.0) == Approx(1.0));
    REQUIRE(apply_easing(e, 2.0) == Approx(1.0)); // clamped
  }
  REQUIRE(apply_easing(Easing::Linear, 0.25) == Approx(0.25));
  REQUIRE(apply_easing(Easing::EaseOutCubic, 0.5) == Approx(0.875));
  REQUIRE(apply_easing(Easing::EaseInOutCubic, 0.25) == Approx(0.0625));
  REQUIRE(apply_easing(Easing::EaseInOutCubic, 0.5) == Approx(0.5));
}

TEST_CASE("Tween advances by elapsed time and finishes on target") {
  Tween<double> tw(0.0, 10.0, 100.0);
  REQUIRE(tw.running());
  REQUIRE(tw.advance(50.0) == Approx(5.0));
  REQUIRE(tw.elapsed_ms() == Approx(50.0));
  REQUIRE(tw.advance(-20.0) == Approx(5.0)); // time never runs backwards
  REQUIRE(tw.advance(60.0) == Approx(10.0));
  REQUIRE(tw.finished());
  REQUIRE(tw.elapsed_ms() == Approx(100.0));
  REQUIRE(tw.advance(100.0) == Approx(10.0));
}

TEST_CASE("Tween with no duration lands immediately") {
  Tween<double> tw(3.0, 7.0, 0.0);
  REQUIRE(tw.finished());
  REQUIRE(tw.value() == Approx(7.0));

  Tween<double> neg(3.0, 7.0, -5.0);
  REQUIRE(neg.finished());
  REQUIRE(neg.duration_ms() == Approx(0.0));
}

TEST_CASE("Cancelled tween freezes where it was") {
  Tween<GeoPoint> tw(GeoPoint{0.0, 0.0}, GeoPoint{1.0, 2.0}, 1000.0);
  tw.advance(250.0);
  tw.cancel();
  REQUIRE(tw.cancelled());
  REQUIRE_FALSE(tw.running());
  const GeoPoint v = tw.advance(1000.0);
  REQUIRE(v.lat == Approx(0.25));
  REQUIRE(v.lng == Approx(0.5));
}

TEST_CASE("JobSlot keeps at most one job") {
  JobSlot<double> slot;
  REQUIRE_FALSE(slot.active());
  REQUIRE(slot.job() == nullptr);
  REQUIRE_FALSE(slot.advance(10.0).has_value());

  slot.replace(Tween<double>(0.0, 100.0, 100.0));
  REQUIRE(slot.active());
  REQUIRE(slot.generation() == 1);
  auto v = slot.advance(40.0);
  REQUIRE(v.has_value());
  REQUIRE(*v == Approx(40.0));

  // New job drops the old one; the old target is never reached.
  slot.replace(Tween<double>(*v, -50.0, 100.0));
  REQUIRE(slot.generation() == 2);
  REQUIRE(slot.job()->from() == Approx(40.0));
  REQUIRE(slot.job()->target() == Approx(-50.0));

  v = slot.advance(200.0);
  REQUIRE(v.has_value());
  REQUIRE(*v == Approx(-50.0));
  REQUIRE(slot.job() == nullptr); // released once finished
  REQUIRE_FALSE(slot.active());
}

TEST_CASE("JobSlot cancel releases the job") {
  JobSlot<Vec2> slot;
  slot.replace(Tween<Vec2>(Vec2{0,0}, Vec2{10,10}, 100.0));
  slot.cancel();
  REQUIRE(slot.job() == nullptr);
  REQUIRE_FALSE(slot.advance(50.0).has_value());
}
