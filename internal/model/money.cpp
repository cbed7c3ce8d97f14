#include "money.hpp"

#include <cmath>
#include <cstdlib>

#include <spdlog/fmt/fmt.h>

#include "internal/util/errors.hpp"

namespace settle::model {

namespace {

// Largest magnitude (in cents) that a double still represents exactly.
constexpr double kMaxCents = 9.0e15;

} // namespace

std::optional<RoundingMode> ParseRoundingMode(std::string_view value) {
  if (value == "half_up") return RoundingMode::kHalfUp;
  if (value == "half_even") return RoundingMode::kHalfEven;
  return std::nullopt;
}

std::string_view ToString(RoundingMode mode) {
  return mode == RoundingMode::kHalfEven ? "half_even" : "half_up";
}

Cents RoundToCents(double eur, RoundingMode mode) {
  if (!std::isfinite(eur)) {
    throw util::ValidationError("cannot round non-finite amount");
  }

  const double scaled = eur * 100.0;
  if (std::fabs(scaled) > kMaxCents) {
    throw util::ValidationError(fmt::format("amount {} EUR out of range", eur));
  }

  // Snap away binary noise below a millionth of a cent so 2.675 EUR rounds like
  // the decimal literal it was written as.
  const double snapped = std::round(scaled * 1e6) / 1e6;
  const double lower   = std::floor(snapped);
  const double frac    = snapped - lower;

  double rounded = lower;
  if (frac > 0.5) {
    rounded = lower + 1.0;
  } else if (frac == 0.5) {
    if (mode == RoundingMode::kHalfUp) {
      rounded = snapped > 0.0 ? lower + 1.0 : lower;
    } else {
      rounded = std::fmod(lower, 2.0) == 0.0 ? lower : lower + 1.0;
    }
  }
  return static_cast<Cents>(rounded);
}

std::string FormatEur(Cents cents) {
  const bool         negative = cents < 0;
  const std::int64_t magnitude = negative ? -cents : cents;
  return fmt::format("{}{}.{:02}", negative ? "-" : "", magnitude / 100, magnitude % 100);
}

} // namespace settle::model
