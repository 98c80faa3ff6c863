#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <bustrk/heading.hpp>

using Catch::Approx;
using namespace bustrk;

TEST_CASE("shortest_heading_delta picks the short way round") {
  REQUIRE(shortest_heading_delta(350.0, 10.0) == Approx(20.0));
  REQUIRE(shortest_heading_delta(10.0, 350.0) == Approx(-20.0));
  REQUIRE(shortest_heading_delta(90.0, 90.0) == Approx(0.0).margin(1e-12));
  REQUIRE(shortest_heading_delta(720.0, 10.0) == Approx(10.0));
  REQUIRE(shortest_heading_delta(-90.0, 90.0) == Approx(180.0));
}

TEST_CASE("shortest_heading_delta reports a half turn as +180") {
  REQUIRE(shortest_heading_delta(0.0, 180.0) == Approx(180.0));
  REQUIRE(shortest_heading_delta(180.0, 0.0) == Approx(180.0));
}

TEST_CASE("shortest_heading_delta stays in (-180, 180]") {
  for (int a = -360; a <= 720; a += 17) {
    for (int b = 0; b < 360; b += 13) {
      const double d = shortest_heading_delta(a, b);
      REQUIRE(d > -180.0);
      REQUIRE(d <= 180.0);
    }
  }
}

TEST_CASE("HeadingSmoother crosses north without unwinding") {
  HeadingSmoother hs(400.0, 1.0);
  hs.reset(350.0);
  REQUIRE(hs.set_target(5.0));
  REQUIRE(hs.last_delta() == Approx(15.0));
  REQUIRE(hs.target() == Approx(365.0));

  // Ease-out cubic at half time covers 87.5% of the turn.
  REQUIRE(hs.advance(200.0) == Approx(350.0 + 15.0 * 0.875));
  REQUIRE(hs.animating());

  REQUIRE(hs.advance(200.0) == Approx(5.0)); // renormalized on completion
  REQUIRE_FALSE(hs.animating());
}

TEST_CASE("HeadingSmoother ignores changes under the deadband") {
  HeadingSmoother hs(400.0, 1.0);
  hs.reset(100.0);
  REQUIRE_FALSE(hs.set_target(100.5));
  REQUIRE_FALSE(hs.animating());
  REQUIRE(hs.advance(400.0) == Approx(100.0));
}

TEST_CASE("HeadingSmoother retargets from the value on screen") {
  HeadingSmoother hs(400.0, 1.0);
  hs.reset(0.0);
  REQUIRE(hs.set_target(90.0));
  const double mid = hs.advance(200.0);
  REQUIRE(mid == Approx(78.75));

  REQUIRE(hs.set_target(180.0));
  REQUIRE(hs.last_delta() == Approx(180.0 - 78.75));
  REQUIRE(hs.target() == Approx(180.0));
  REQUIRE(hs.advance(400.0) == Approx(180.0));
}

TEST_CASE("HeadingSmoother with zero duration jumps") {
  HeadingSmoother hs(0.0, 1.0);
  hs.reset(270.0);
  REQUIRE(hs.set_target(0.0));
  REQUIRE(hs.advance(0.0) == Approx(0.0).margin(1e-9));
  REQUIRE_FALSE(hs.animating());
}
