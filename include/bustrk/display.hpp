#pragma once
#include <optional>
#include <string>

namespace bustrk {

// "36 km/h" from m/s; "--" when unknown or negative.
std::string format_speed(std::optional<double> speed_mps);

// "850 m" under 1 km, "2.3 km" above.
std::string format_distance(double km);

// Age of the last fix: "Just now", "42s ago", "5m ago", "1h 5m ago", "No data".
std::string format_time_since(std::optional<double> last_fix_ms, double now_ms);

// Trip duration: "1h 5m" or "12m".
std::string format_elapsed(double started_ms, double now_ms);

// Stale banner text: "No signal for 5+ min", or seconds under a minute.
std::string format_no_signal(double threshold_sec);

} // namespace bustrk
