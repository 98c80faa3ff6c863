#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <bustrk/feed.hpp>

using Catch::Approx;
using namespace bustrk;

namespace {
RawFix fix_at(double t, double lat) {
  RawFix f{};
  f.lat = lat; f.lng = 77.59; f.speed_mps = 5.0; f.recorded_at_ms = t;
  return f;
}
}

TEST_CASE("ReplayFeed releases fixes as its clock passes them") {
  ReplayFeed feed("BUS-7", {fix_at(4000.0, 12.972), fix_at(1000.0, 12.970), fix_at(8000.0, 12.974)});
  REQUIRE(feed.size() == 3);
  REQUIRE(feed.clock_ms() == Approx(1000.0)); // starts at the earliest fix

  std::vector<VehicleFix> out;
  REQUIRE(feed.poll(out) == 1);
  REQUIRE(out[0].id == "BUS-7");
  REQUIRE(out[0].seq == 1);
  REQUIRE(out[0].fix.lat == Approx(12.970));

  feed.pump(2000.0);
  REQUIRE(feed.poll(out) == 0);
  feed.pump(1000.0);
  REQUIRE(feed.poll(out) == 1);
  REQUIRE(out.back().seq == 2);
  REQUIRE(out.back().fix.recorded_at_ms == Approx(4000.0));
  REQUIRE_FALSE(feed.done());
}

TEST_CASE("ReplayFeed time scale warps and pauses the clock") {
  ReplayFeed feed("BUS-7", {fix_at(0.0, 12.97), fix_at(10000.0, 12.98)});
  feed.set_time_scale(0.0);
  feed.pump(5000.0);
  REQUIRE(feed.clock_ms() == Approx(0.0));

  feed.set_time_scale(-3.0);
  REQUIRE(feed.time_scale() == Approx(0.0));

  feed.set_time_scale(10.0);
  feed.pump(1000.0);
  std::vector<VehicleFix> out;
  REQUIRE(feed.poll(out) == 2);
  REQUIRE(feed.done());
}

TEST_CASE("ReplayFeed with no fixes is done at once") {
  ReplayFeed feed("BUS-0", {});
  std::vector<VehicleFix> out;
  REQUIRE(feed.done());
  REQUIRE(feed.poll(out) == 0);
}

TEST_CASE("FrameCursor only passes fixes with a newer sequence") {
  FrameCursor cur;
  FeedFrame f{};
  f.latest.push_back(VehicleFix{"BUS-1", 1, fix_at(0.0, 12.97)});
  f.latest.push_back(VehicleFix{"BUS-2", 3, fix_at(0.0, 12.98)});

  std::vector<VehicleFix> out;
  REQUIRE(cur.take_new(f, out) == 2);
  REQUIRE(cur.take_new(f, out) == 0); // same frame again

  f.latest[0].seq = 2;
  REQUIRE(cur.take_new(f, out) == 1);
  REQUIRE(out.back().id == "BUS-1");

  cur.clear();
  REQUIRE(cur.take_new(f, out) == 2);
  REQUIRE(out.size() == 5);
}
