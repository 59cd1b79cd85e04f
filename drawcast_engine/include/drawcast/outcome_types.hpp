#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace drawcast {

// Binary label of a draw outcome. Digits 5-9 are BIG, 0-4 are SMALL.
enum class Label { Small = 0, Big = 1 };

constexpr int kBigThreshold = 5;

// One resolved draw from the feed. Immutable once created; period_id is the
// uniqueness key inside DataBuffer.
struct OutcomeRecord {
  std::string period_id;        // Opaque ordered identifier (digit string)
  int digit = 0;                // Outcome in [0, 9]
  Label label = Label::Small;   // BIG iff digit >= 5
  int bit = 0;                  // 1 iff digit >= 5
  uint64_t observed_at_ms = 0;  // Wall clock at ingestion (ms since epoch)
};

inline Label LabelOf(int digit) {
  return digit >= kBigThreshold ? Label::Big : Label::Small;
}

inline int BitOf(int digit) { return digit >= kBigThreshold ? 1 : 0; }

inline Label Opposite(Label l) {
  return l == Label::Big ? Label::Small : Label::Big;
}

inline const char* LabelName(Label l) {
  return l == Label::Big ? "BIG" : "SMALL";
}

// Build a record with label/bit derived from the digit.
inline OutcomeRecord MakeOutcome(std::string period_id,
                                 int digit,
                                 uint64_t observed_at_ms = 0) {
  if (digit < 0 || digit > 9) {
    throw std::invalid_argument("outcome digit out of range: " +
                                std::to_string(digit));
  }
  OutcomeRecord r;
  r.period_id      = std::move(period_id);
  r.digit          = digit;
  r.label          = LabelOf(digit);
  r.bit            = BitOf(digit);
  r.observed_at_ms = observed_at_ms;
  return r;
}

}  // namespace drawcast
