#include <catch2/catch_test_macros.hpp>
#include <optional>
#include <string>

#include <bustrk/staleness.hpp>

using namespace bustrk;

namespace {
RawFix fix_at(double t, double speed = 0.0, bool trip_active = true) {
  RawFix f{};
  f.lat = 12.97; f.lng = 77.59; f.speed_mps = speed; f.recorded_at_ms = t; f.trip_active = trip_active;
  return f;
}
}

TEST_CASE("is_stale needs an active trip and an old fix") {
  REQUIRE_FALSE(is_stale(true, 0.0, 300000.0));
  REQUIRE(is_stale(true, 0.0, 300001.0));
  REQUIRE_FALSE(is_stale(false, 0.0, 3600000.0));
  REQUIRE(is_stale(true, 0.0, 61000.0, 60.0));
}

TEST_CASE("is_stale overload reads threshold from tuning") {
  EngineTuning t{};
  REQUIRE(is_stale(fix_at(0.0), 310000.0, t));
  t.inactive_threshold_sec = 600.0;
  REQUIRE_FALSE(is_stale(fix_at(0.0), 310000.0, t));
}

TEST_CASE("bus_status follows fix age") {
  const EngineTuning t{};
  REQUIRE(bus_status(std::nullopt, 0.0, t) == BusStatus::Inactive);
  REQUIRE(bus_status(fix_at(0.0), 10000.0, t) == BusStatus::Active);
  REQUIRE(bus_status(fix_at(0.0), 300000.0, t) == BusStatus::Active);
  REQUIRE(bus_status(fix_at(0.0), 301000.0, t) == BusStatus::Inactive);
  // Device clock slightly ahead of ours.
  REQUIRE(bus_status(fix_at(5000.0), 0.0, t) == BusStatus::Active);
}

TEST_CASE("marker_tone: moving, idle, silent") {
  const EngineTuning t{};
  REQUIRE(marker_tone(std::nullopt, 0.0, t) == MarkerTone::Inactive);
  REQUIRE(marker_tone(fix_at(0.0, 6.0), 1000.0, t) == MarkerTone::Moving);
  REQUIRE(marker_tone(fix_at(0.0, 0.3), 1000.0, t) == MarkerTone::Idle);
  REQUIRE(marker_tone(fix_at(0.0, 6.0), 400000.0, t) == MarkerTone::Inactive);
}

TEST_CASE("status and tone names") {
  REQUIRE(std::string(to_string(BusStatus::Active)) == "Active");
  REQUIRE(std::string(to_string(BusStatus::Inactive)) == "Inactive");
  REQUIRE(std::string(to_string(MarkerTone::Idle)) == "Idle");
}
