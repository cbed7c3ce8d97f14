#pragma once

#include <cstdint>
#include <string>

#include "internal/model/participant.hpp"

namespace settle::db::model {

/*
  Persistent participant row. external_id is unique; role never changes.
*/
struct ParticipantRecord {
  std::int64_t        id = 0;
  std::string         external_id;
  std::string         name;
  settle::model::Role role = settle::model::Role::kUnspecified;
};

} // namespace settle::db::model
