#include <bustrk/display.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace bustrk {

std::string format_speed(std::optional<double> speed_mps) {
  if (!speed_mps || !std::isfinite(*speed_mps) || *speed_mps < 0.0) return "--";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%ld km/h", std::lround(*speed_mps * 3.6));
  return buf;
}

std::string format_distance(double km) {
  if (!std::isfinite(km) || km < 0.0) return "--";
  char buf[32];
  if (km < 1.0) std::snprintf(buf, sizeof(buf), "%ld m", std::lround(km * 1000.0));
  else          std::snprintf(buf, sizeof(buf), "%.1f km", km);
  return buf;
}

std::string format_time_since(std::optional<double> last_fix_ms, double now_ms) {
  if (!last_fix_ms) return "No data";
  const long diff_sec = std::max(0L, std::lround((now_ms - *last_fix_ms) / 1000.0));
  char buf[32];
  if (diff_sec < 10) return "Just now";
  if (diff_sec < 60) {
    std::snprintf(buf, sizeof(buf), "%lds ago", diff_sec);
    return buf;
  }
  const long mins = diff_sec / 60;
  if (mins < 60) std::snprintf(buf, sizeof(buf), "%ldm ago", mins);
  else           std::snprintf(buf, sizeof(buf), "%ldh %ldm ago", mins / 60, mins % 60);
  return buf;
}

std::string format_elapsed(double started_ms, double now_ms) {
  const long diff_ms = static_cast<long>(std::max(0.0, now_ms - started_ms));
  const long hrs  = diff_ms / 3600000L;
  const long mins = (diff_ms % 3600000L) / 60000L;
  char buf[32];
  if (hrs > 0) std::snprintf(buf, sizeof(buf), "%ldh %ldm", hrs, mins);
  else         std::snprintf(buf, sizeof(buf), "%ldm", mins);
  return buf;
}

std::string format_no_signal(double threshold_sec) {
  const long secs = std::isfinite(threshold_sec) ? std::max(0L, std::lround(threshold_sec)) : 0L;
  char buf[48];
  if (secs >= 60) std::snprintf(buf, sizeof(buf), "No signal for %ld+ min", secs / 60);
  else            std::snprintf(buf, sizeof(buf), "No signal for %ld+ s", secs);
  return buf;
}

} // namespace bustrk
