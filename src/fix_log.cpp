#include <bustrk/fix_log.hpp>
#include <cctype>
#include <fstream>
#include <limits>
#include <bustrk/csv.hpp>

namespace bustrk {

static bool is_header_row(const std::vector<std::string>& cols) {
  return !cols.empty() && (cols[0] == "recorded_at_ms" || cols[0] == "t");
}

static double field_or(const std::vector<std::string>& cols, std::size_t i, double fallback) {
  if (i >= cols.size()) return fallback;
  bool ok = false;
  const double v = csv::to_double_safe(cols[i], ok);
  return ok ? v : fallback;
}

static bool parse_flag(const std::vector<std::string>& cols, std::size_t i) {
  if (i >= cols.size() || cols[i].empty()) return true;
  std::string v = cols[i];
  for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return !(v == "0" || v == "false" || v == "no");
}

static std::optional<RawFix> parse_fix_row(const std::vector<std::string>& cols) {
  if (cols.size() < 3) return std::nullopt;
  bool ok = false;
  const double t = csv::to_double_safe(cols[0], ok);
  if (!ok) return std::nullopt;

  const double nan = std::numeric_limits<double>::quiet_NaN();
  RawFix f{};
  f.recorded_at_ms = t;
  f.lat = field_or(cols, 1, nan);
  f.lng = field_or(cols, 2, nan);
  f.speed_mps = field_or(cols, 3, 0.0);
  f.heading_deg = field_or(cols, 4, 0.0);
  f.trip_active = parse_flag(cols, 5);
  return f;
}

std::vector<RawFix> fixes_from_csv_stream(std::istream& in) {
  std::vector<RawFix> out;
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
    if (auto row = parse_fix_row(cols); row.has_value()) {
      out.push_back(*row);
    }
  }
  return out;
}

std::optional<std::vector<RawFix>> load_fix_log_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return fixes_from_csv_stream(f);
}

} // namespace bustrk
