#pragma once
#include <optional>
#include <unordered_map>
#include <vector>
#include <bustrk/tracker.hpp>

namespace bustrk {

// One VehicleTracker per vehicle on an active trip, created on its first
// fix and discarded when the trip leaves the live list.
class FleetTracker {
public:
  explicit FleetTracker(const EngineTuning& tuning = EngineTuning{}) : tuning_(tuning) {}

  IngestResult ingest(const VehicleId& id, const RawFix& fix, double now_ms);
  void advance(double elapsed_ms);

  std::optional<TrackerFrame> frame(const VehicleId& id, double now_ms) const;

  // Returns false if the id was not tracked.
  bool remove(const VehicleId& id);

  // Keep only the listed ids (live list refresh). Returns how many were dropped.
  std::size_t retain_only(const std::vector<VehicleId>& live);

  // Applies to every current and future tracker.
  void set_viewer_location(std::optional<GeoPoint> p);

  VehicleTracker*       find(const VehicleId& id);
  const VehicleTracker* find(const VehicleId& id) const;

  std::vector<VehicleId> ids() const; // sorted
  std::size_t size() const { return trackers_.size(); }

private:
  EngineTuning tuning_;
  std::optional<GeoPoint> viewer_{};
  std::unordered_map<VehicleId, VehicleTracker> trackers_;
};

} // namespace bustrk
