#include <bustrk/feed.hpp>
#include <algorithm>

namespace bustrk {

ReplayFeed::ReplayFeed(VehicleId id, std::vector<RawFix> fixes)
  : id_(std::move(id)), fixes_(std::move(fixes)) {
  std::stable_sort(fixes_.begin(), fixes_.end(), [](const RawFix& a, const RawFix& b){
    return a.recorded_at_ms < b.recorded_at_ms;
  });
  if (!fixes_.empty()) clock_ms_ = fixes_.front().recorded_at_ms;
}

void ReplayFeed::pump(double wall_elapsed_ms) {
  if (wall_elapsed_ms <= 0.0) return;
  clock_ms_ += wall_elapsed_ms * scale_;
}

std::size_t ReplayFeed::poll(std::vector<VehicleFix>& out) {
  std::size_t n = 0;
  while (next_ < fixes_.size() && fixes_[next_].recorded_at_ms <= clock_ms_) {
    out.push_back(VehicleFix{id_, ++seq_, fixes_[next_]});
    ++next_;
    ++n;
  }
  return n;
}

} // namespace bustrk
