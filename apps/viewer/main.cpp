#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <bustrk/feed.hpp>
#include <bustrk/feed_runner.hpp>
#include <bustrk/fix_log.hpp>
#include <bustrk/tuning.hpp>
#include <bustrk/viewer/app.hpp>

using namespace bustrk;

static void usage(const char* argv0) {
  std::printf("usage: %s [--tuning tuning.csv] [--replay fixes.csv]\n", argv0);
}

int main(int argc, char** argv) {
  std::string tuning_path;
  std::string replay_path;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--tuning") == 0 && i + 1 < argc) {
      tuning_path = argv[++i];
    } else if (std::strcmp(argv[i], "--replay") == 0 && i + 1 < argc) {
      replay_path = argv[++i];
    } else {
      usage(argv[0]);
      return 2;
    }
  }

  EngineTuning tuning{};
  if (!tuning_path.empty()) {
    auto t = load_tuning_csv(tuning_path, tuning);
    if (!t) {
      std::fprintf(stderr, "[viewer] cannot open tuning file %s\n", tuning_path.c_str());
      return 1;
    }
    tuning = *t;
    std::printf("[viewer] tuning loaded from %s\n", tuning_path.c_str());
  }

  if (!replay_path.empty()) {
    auto fixes = load_fix_log_csv(replay_path);
    if (!fixes) {
      std::fprintf(stderr, "[viewer] cannot open fix log %s\n", replay_path.c_str());
      return 1;
    }
    if (fixes->empty()) {
      std::fprintf(stderr, "[viewer] fix log %s has no rows\n", replay_path.c_str());
      return 1;
    }

    // Centre the map on the first fix that has a position.
    GeoPoint origin{};
    for (const auto& f : *fixes) {
      if (has_position(f)) { origin = position_of(f); break; }
    }
    std::vector<Vec2> path;
    for (const auto& f : *fixes) {
      if (has_position(f)) path.push_back(to_local_m(origin, position_of(f)));
    }

    std::printf("[viewer] replaying %zu fixes from %s\n", fixes->size(), replay_path.c_str());
    ReplayFeed feed("REPLAY", std::move(*fixes));
    ViewerApp app(feed, tuning, origin);
    app.set_route_points(std::move(path));
    return app.run();
  }

  FeedRunner sim;
  sim.configure_default_world();
  sim.start();

  ViewerApp app(sim, tuning, sim.origin());
  app.set_runner(&sim);
  const int code = app.run();

  sim.stop();
  return code;
}
