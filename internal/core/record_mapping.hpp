#pragma once

#include <string_view>

#include "internal/db/api/result.hpp"
#include "internal/db/model/participant_record.hpp"
#include "internal/db/model/settlement_batch_record.hpp"
#include "internal/db/model/settlement_line_record.hpp"
#include "internal/db/model/usage_event_record.hpp"
#include "internal/model/settlement.hpp"

namespace settle::core {

// Repository result -> typed exception (util/errors.hpp). No-op on OK.
void ThrowIfDbError(const db::Result& result, std::string_view context);

model::Participant ToModel(const db::model::ParticipantRecord& record);
model::UsageEvent  ToModel(const db::model::UsageEventRecord& record);
model::SettlementBatch ToModel(const db::model::SettlementBatchRecord& record);
model::SettlementLine  ToModel(const db::model::SettlementLineRecord& record);

db::model::ParticipantRecord     ToRecord(const model::Participant& participant);
db::model::UsageEventRecord      ToRecord(const model::UsageEvent& event);
db::model::SettlementBatchRecord ToRecord(const model::SettlementBatch& batch);
db::model::SettlementLineRecord  ToRecord(const model::SettlementLine& line);

} // namespace settle::core
