#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include <bustrk/fix.hpp>

namespace bustrk {

// Latest fix of every vehicle on the feed at one feed tick.
struct FeedFrame {
  double clock_ms{};
  std::uint64_t tick{};
  std::uint64_t epoch{};   // bumped when the world is rebuilt; sequences restart
  std::vector<VehicleFix> latest{};
};

// Source of fixes for the render loop. All calls come from one thread.
class FixFeed {
public:
  virtual ~FixFeed() = default;

  // Feed clock in the same base as RawFix::recorded_at_ms.
  virtual double clock_ms() const = 0;

  // Advance caller-driven clocks by real elapsed time (scaled internally).
  virtual void pump(double wall_elapsed_ms) = 0;

  // Append fixes that arrived since the last poll; returns how many.
  virtual std::size_t poll(std::vector<VehicleFix>& out) = 0;

  virtual double time_scale() const = 0;
  virtual void set_time_scale(double scale) = 0;
  virtual const char* name() const = 0;
};

// Picks out of a FeedFrame the fixes whose per-vehicle sequence moved.
class FrameCursor {
public:
  std::size_t take_new(const FeedFrame& frame, std::vector<VehicleFix>& out) {
    std::size_t n = 0;
    for (const auto& vf : frame.latest) {
      auto it = seen_.find(vf.id);
      if (it != seen_.end() && it->second >= vf.seq) continue;
      seen_[vf.id] = vf.seq;
      out.push_back(vf);
      ++n;
    }
    return n;
  }
  void clear() { seen_.clear(); }

private:
  std::unordered_map<VehicleId, std::uint64_t> seen_;
};

// Replays a recorded fix log for one vehicle against its own clock, which
// starts at the first fix's timestamp.
class ReplayFeed : public FixFeed {
public:
  ReplayFeed(VehicleId id, std::vector<RawFix> fixes);

  double clock_ms() const override { return clock_ms_; }
  void pump(double wall_elapsed_ms) override;
  std::size_t poll(std::vector<VehicleFix>& out) override;
  double time_scale() const override { return scale_; }
  void set_time_scale(double scale) override { scale_ = scale < 0.0 ? 0.0 : scale; }
  const char* name() const override { return "replay"; }

  bool done() const { return next_ >= fixes_.size(); }
  std::size_t size() const { return fixes_.size(); }

private:
  VehicleId id_;
  std::vector<RawFix> fixes_;
  std::size_t next_{0};
  std::uint64_t seq_{0};
  double clock_ms_{0.0};
  double scale_{1.0};
};

} // namespace bustrk
