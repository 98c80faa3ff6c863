#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <bustrk/fix.hpp>

namespace bustrk {

// Recorded fix logs, one row per report:
//   recorded_at_ms,lat,lng,speed_mps,heading_deg,trip_active
// Optional header row, '#' comments and blank lines are ignored. An empty
// or unparsable lat/lng is kept as NaN (the estimator drops it); empty
// speed/heading read as 0; trip_active defaults to true ("0", "false",
// "no" clear it). Rows with fewer than three columns or an unparsable
// timestamp are skipped.
std::vector<RawFix> fixes_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if the file cannot be opened.
std::optional<std::vector<RawFix>> load_fix_log_csv(const std::string& path);

} // namespace bustrk
