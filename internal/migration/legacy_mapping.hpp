#pragma once

#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/db/model/ledger_record.hpp"
#include "internal/db/model/material_record.hpp"
#include "internal/db/model/photo_record.hpp"
#include "internal/db/model/site_record.hpp"
#include "internal/db/model/worker_record.hpp"
#include "legacy/legacy.pb.h"

namespace sitely::migration {

/*
  Legacy element -> relational record.

  One independent function per entity. Each throws util::MigrationRecordError
  when the element cannot be represented (missing id, token outside its
  domain, malformed date). Nothing here touches storage.
*/

// Parses a blob that must be a JSON array. Throws MigrationRecordError otherwise.
std::vector<google::protobuf::Value> ParseJsonArray(const std::string& blob);

// Re-reads one array element as a typed legacy message; unknown keys are ignored.
void ParseElement(const google::protobuf::Value& element, google::protobuf::Message* out);

db::model::SiteRecord          MapSite(const legacy::v1::LegacySite& site);
db::model::WorkerRecord        MapWorker(const legacy::v1::LegacyWorker& worker);
db::model::WageRecord          MapWage(const legacy::v1::LegacyLedgerEntry& entry);
db::model::ExpenseRecord       MapExpense(const legacy::v1::LegacyLedgerEntry& entry);
db::model::PaymentRecord       MapPayment(const legacy::v1::LegacyLedgerEntry& entry);
db::model::PhotoRecord         MapPhoto(const legacy::v1::LegacyPhoto& photo);
db::model::MaterialRecord      MapMaterial(const legacy::v1::LegacyMaterial& material);
db::model::MaterialUsageRecord MapMaterialUsage(const legacy::v1::LegacyMaterialUsage& usage);

} // namespace sitely::migration
