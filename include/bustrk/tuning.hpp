#pragma once
#include <istream>
#include <optional>
#include <string>

namespace bustrk {

// Every empirically chosen constant of the estimator, overridable at runtime.
struct EngineTuning {
  double default_interval_ms    = 4000.0;   // assumed gap before the first fix
  double min_projection_ms      = 2000.0;
  double max_projection_ms      = 8000.0;
  double interval_buffer        = 1.3;      // project slightly past the next fix
  double settle_ms              = 500.0;    // stopped: ease onto the raw fix
  double heading_ms             = 400.0;
  double moving_speed_mps       = 0.5;      // above = Moving
  double inactive_threshold_sec = 300.0;
  double jump_threshold_deg     = 0.005;    // ~500 m
  double silence_threshold_ms   = 10000.0;
  double heading_deadband_deg   = 1.0;
  double meters_per_deg_lat     = 111320.0;

  // Copy with negative values zeroed, projection bounds ordered and a
  // usable meters-per-degree.
  EngineTuning sanitized() const;
};

// Set a field by its member name. Returns false for an unknown key.
bool apply_tuning_value(EngineTuning& t, const std::string& key, double value);

// Stream-based loader of `key,value` rows on top of `base`.
// Accepts an optional header row; ignores '#' comments and blank lines.
// Unknown keys and unparsable values are skipped. Result is sanitized.
EngineTuning tuning_from_csv_stream(std::istream& in, const EngineTuning& base = EngineTuning{});

// Filesystem wrapper; returns nullopt if the file cannot be opened.
std::optional<EngineTuning> load_tuning_csv(const std::string& path,
                                            const EngineTuning& base = EngineTuning{});

} // namespace bustrk
