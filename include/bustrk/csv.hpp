#pragma once
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace bustrk::csv {

inline std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

// Simple CSV: no quoted fields. Each column is trimmed.
inline std::vector<std::string> split_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

// Whole-field parse; ok is false on empty input, trailing junk or overflow.
inline double to_double_safe(const std::string& s, bool& ok) {
  ok = false;
  if (s.empty()) return 0.0;
  try {
    std::size_t idx = 0;
    const double v = std::stod(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::invalid_argument&) {
    return 0.0;
  } catch (const std::out_of_range&) {
    return 0.0;
  }
}

// Blank lines and '#' comments carry no data.
inline bool is_skippable(const std::string& trimmed) {
  return trimmed.empty() || trimmed[0] == '#';
}

} // namespace bustrk::csv
