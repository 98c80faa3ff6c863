#include <bustrk/fleet.hpp>
#include <algorithm>

namespace bustrk {

IngestResult FleetTracker::ingest(const VehicleId& id, const RawFix& fix, double now_ms) {
  auto it = trackers_.find(id);
  if (it == trackers_.end()) {
    // Nothing to show for a vehicle whose first report has no position.
    if (!has_position(fix)) return IngestResult{};
    it = trackers_.emplace(id, VehicleTracker{tuning_}).first;
    it->second.set_viewer_location(viewer_);
  }
  return it->second.ingest(fix, now_ms);
}

void FleetTracker::advance(double elapsed_ms) {
  for (auto& kv : trackers_) kv.second.advance(elapsed_ms);
}

std::optional<TrackerFrame> FleetTracker::frame(const VehicleId& id, double now_ms) const {
  const auto* t = find(id);
  if (!t) return std::nullopt;
  return t->frame(now_ms);
}

bool FleetTracker::remove(const VehicleId& id) {
  return trackers_.erase(id) > 0;
}

std::size_t FleetTracker::retain_only(const std::vector<VehicleId>& live) {
  std::size_t dropped = 0;
  for (auto it = trackers_.begin(); it != trackers_.end(); ) {
    if (std::find(live.begin(), live.end(), it->first) == live.end()) {
      it = trackers_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  return dropped;
}

void FleetTracker::set_viewer_location(std::optional<GeoPoint> p) {
  if (p && !is_finite(*p)) p.reset();
  viewer_ = p;
  for (auto& kv : trackers_) kv.second.set_viewer_location(viewer_);
}

VehicleTracker* FleetTracker::find(const VehicleId& id) {
  auto it = trackers_.find(id);
  return it == trackers_.end() ? nullptr : &it->second;
}

const VehicleTracker* FleetTracker::find(const VehicleId& id) const {
  auto it = trackers_.find(id);
  return it == trackers_.end() ? nullptr : &it->second;
}

std::vector<VehicleId> FleetTracker::ids() const {
  std::vector<VehicleId> out;
  out.reserve(trackers_.size());
  for (const auto& kv : trackers_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace bustrk
