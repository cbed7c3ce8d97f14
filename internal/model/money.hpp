#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace settle::model {

/*
  Money handling.

  Postings are accumulated as double EUR. A net position is rounded exactly
  once into integer cents; everything after that point is integer math.
*/

using Cents = std::int64_t;

enum class RoundingMode : std::uint8_t {
  kHalfUp,   // ties away from zero
  kHalfEven, // ties to even cent
};

std::optional<RoundingMode> ParseRoundingMode(std::string_view value);
std::string_view            ToString(RoundingMode mode);

// Throws util::ValidationError for non-finite or out-of-range input.
Cents RoundToCents(double eur, RoundingMode mode);

inline double ToEur(Cents cents) {
  return static_cast<double>(cents) / 100.0;
}

// Fixed two decimals: "2.80", "-0.05".
std::string FormatEur(Cents cents);

} // namespace settle::model
