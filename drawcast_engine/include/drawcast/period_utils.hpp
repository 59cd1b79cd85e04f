#pragma once

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace drawcast {

// Utilities for draw period identifiers.
//
// Convention:
//   a period id is a decimal digit string of the form
//     YYYYMMDD <game code> NNNN
//   e.g. "20250101100010001": draw date, game code "10001", draw index 0001.
//   Ids are compared and incremented as unbounded decimal integers, so the
//   helpers below never parse into a fixed-width integer.

// True if `id` is non-empty and made only of ASCII digits.
inline bool is_period_id(const std::string& id) {
  return !id.empty() &&
         std::all_of(id.begin(), id.end(),
                     [](char c) { return c >= '0' && c <= '9'; });
}

// Decimal increment with carry: "0999" -> "1000", "999" -> "1000".
inline std::string NextPeriod(const std::string& id) {
  if (!is_period_id(id)) {
    throw std::invalid_argument("NextPeriod: not a period id: '" + id + "'");
  }

  std::string out = id;
  for (std::size_t i = out.size(); i-- > 0;) {
    if (out[i] != '9') {
      ++out[i];
      return out;
    }
    out[i] = '0';
  }
  // All nines: grow by one digit.
  return "1" + out;
}

// Numeric order of two period ids (ignores leading zeros only through length,
// so ids are expected to be zero-padded to a common width).
inline bool PeriodLess(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return a.size() < b.size();
  return a < b;
}

// Leading YYYYMMDD of a period id, 0 when the id is too short.
inline uint32_t PeriodDay(const std::string& id) {
  if (id.size() < 8 || !is_period_id(id)) return 0;
  return static_cast<uint32_t>(std::stoul(id.substr(0, 8)));
}

}  // namespace drawcast
