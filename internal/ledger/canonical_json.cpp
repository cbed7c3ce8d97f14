#include "canonical_json.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/util/errors.hpp"

namespace settle::ledger {

std::string Canonicalize(const nlohmann::json& value) {
  try {
    return value.dump(-1, ' ', /*ensure_ascii=*/true);
  } catch (const nlohmann::json::type_error& e) {
    throw util::ValidationError(fmt::format("cannot encode canonical JSON: {}", e.what()));
  }
}

} // namespace settle::ledger
