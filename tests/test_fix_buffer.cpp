#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <thread>

#include <bustrk/feed.hpp>
#include <bustrk/fix_buffer.hpp>

using namespace bustrk;

TEST_CASE("LatestBuffer hands out only the newest value") {
  LatestBuffer<FeedFrame> buf;
  std::uint64_t cursor = 0;
  FeedFrame out{};
  REQUIRE_FALSE(buf.try_consume_latest(cursor, out));

  FeedFrame a{}; a.tick = 1;
  FeedFrame b{}; b.tick = 2;
  buf.publish(a);
  buf.publish(b);
  REQUIRE(buf.try_consume_latest(cursor, out));
  REQUIRE(out.tick == 2);
  REQUIRE_FALSE(buf.try_consume_latest(cursor, out));
}

TEST_CASE("LatestBuffer across a producer thread") {
  LatestBuffer<FeedFrame> buf;
  std::thread producer([&]{
    for (std::uint64_t i = 1; i <= 500; ++i) {
      FeedFrame f{};
      f.tick = i;
      f.clock_ms = double(i) * 16.0;
      buf.publish(f);
    }
  });
  producer.join();

  std::uint64_t cursor = 0;
  FeedFrame out{};
  REQUIRE(buf.try_consume_latest(cursor, out));
  REQUIRE(out.tick == 500);
  REQUIRE(out.clock_ms == 8000.0);
}
