#include <bustrk/tuning.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>
#include <fstream>
#include <bustrk/csv.hpp>

namespace bustrk {

namespace {

struct Field { const char* name; double EngineTuning::* member; };

const Field kFields[] = {
  {"default_interval_ms",    &EngineTuning::default_interval_ms},
  {"min_projection_ms",      &EngineTuning::min_projection_ms},
  {"max_projection_ms",      &EngineTuning::max_projection_ms},
  {"interval_buffer",        &EngineTuning::interval_buffer},
  {"settle_ms",              &EngineTuning::settle_ms},
  {"heading_ms",             &EngineTuning::heading_ms},
  {"moving_speed_mps",       &EngineTuning::moving_speed_mps},
  {"inactive_threshold_sec", &EngineTuning::inactive_threshold_sec},
  {"jump_threshold_deg",     &EngineTuning::jump_threshold_deg},
  {"silence_threshold_ms",   &EngineTuning::silence_threshold_ms},
  {"heading_deadband_deg",   &EngineTuning::heading_deadband_deg},
  {"meters_per_deg_lat",     &EngineTuning::meters_per_deg_lat},
};

} // namespace

EngineTuning EngineTuning::sanitized() const {
  static const EngineTuning kDefaults{};
  EngineTuning t = *this;
  // inf and nan fall back to the default, then negatives clamp to zero.
  for (const auto& f : kFields) {
    double& v = t.*(f.member);
    if (!std::isfinite(v)) v = kDefaults.*(f.member);
    if (v < 0.0) v = 0.0;
  }
  if (t.max_projection_ms < t.min_projection_ms) std::swap(t.min_projection_ms, t.max_projection_ms);
  if (!(t.meters_per_deg_lat > 0.0)) t.meters_per_deg_lat = kDefaults.meters_per_deg_lat;
  return t;
}

bool apply_tuning_value(EngineTuning& t, const std::string& key, double value) {
  auto it = std::find_if(std::begin(kFields), std::end(kFields),
                         [&](const Field& f){ return key == f.name; });
  if (it == std::end(kFields)) return false;
  t.*(it->member) = value;
  return true;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  return cols.size() >= 2 && (cols[0] == "key" || cols[0] == "Key");
}

EngineTuning tuning_from_csv_stream(std::istream& in, const EngineTuning& base) {
  EngineTuning out = base;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = csv::trim(line);
    if (csv::is_skippable(raw)) continue;

    const auto cols = csv::split_line(raw);
    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }
    if (cols.size() < 2 || cols[0].empty()) continue;

    bool ok = false;
    const double v = csv::to_double_safe(cols[1], ok);
    if (!ok) continue;
    (void)apply_tuning_value(out, cols[0], v); // unknown keys are skipped
  }
  return out.sanitized();
}

std::optional<EngineTuning> load_tuning_csv(const std::string& path, const EngineTuning& base) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return tuning_from_csv_stream(f, base);
}

} // namespace bustrk
