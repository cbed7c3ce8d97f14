#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>

namespace settlectl {

// Batch ids are positive; anything but a whole decimal number is rejected.
inline std::optional<std::int64_t> ParseBatchId(std::string_view text) {
  std::int64_t id          = 0;
  const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), id);
  if (text.empty() || error != std::errc{} || end != text.data() + text.size() || id <= 0) {
    return std::nullopt;
  }
  return id;
}

} // namespace settlectl
