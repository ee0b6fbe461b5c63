#include "legacy_mapping.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <google/protobuf/util/json_util.h>

#include "internal/model/enums.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace sitely::migration {

namespace {

using util::MigrationRecordError;

void RequireId(const std::string& id, const char* entity) {
  if (id.empty()) {
    throw MigrationRecordError(std::string(entity) + " without id");
  }
}

// Legacy rows carry either a bare date or a full ISO timestamp.
void RequireDate(const std::string& date, const std::string& context) {
  const bool timestamp = date.size() > 10 && date[10] == 'T';
  if (!util::IsIsoDate(timestamp ? date.substr(0, 10) : date)) {
    throw MigrationRecordError(context + ": malformed date '" + date + "'");
  }
}

void RequireAmount(double value, const std::string& context) {
  if (!std::isfinite(value) || value < 0) {
    throw MigrationRecordError(context + ": negative or non-finite amount");
  }
}

template <typename Enum, typename Parse>
Enum ParseToken(const std::string& token, Parse parse, const std::string& context) {
  auto parsed = parse(token);
  if (!parsed) {
    throw MigrationRecordError(context + ": token '" + token + "' outside its domain");
  }
  return *parsed;
}

std::optional<std::string> NonEmpty(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::string UpperCase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

void MapLedgerBase(const legacy::v1::LegacyLedgerEntry& entry, db::model::LedgerRowBase& row, const char* entity) {
  RequireId(entry.id(), entity);
  const std::string context = std::string(entity) + " " + entry.id();
  if (entry.site_id().empty() || entry.worker_id().empty()) {
    throw MigrationRecordError(context + ": missing site or worker id");
  }
  RequireDate(entry.date(), context);
  RequireAmount(entry.amount(), context);

  row.id          = entry.id();
  row.site_id     = entry.site_id();
  row.worker_id   = entry.worker_id();
  row.worker_name = entry.worker_name();
  row.amount      = entry.amount();
  row.date        = entry.date().substr(0, 10);
  row.time        = entry.time();

  // Snapshot categories are normalized to the persisted tokens.
  if (!entry.worker_category().empty()) {
    row.worker_category = std::string(
        sitely::model::ToString(ParseToken<sitely::model::WorkerCategory>(entry.worker_category(), sitely::model::ParseWorkerCategory, context)));
  }
}

} // namespace

std::vector<google::protobuf::Value> ParseJsonArray(const std::string& blob) {
  google::protobuf::ListValue list;
  auto                        status = google::protobuf::util::JsonStringToMessage(blob, &list);
  if (!status.ok()) {
    throw MigrationRecordError("blob is not a JSON array: " + std::string(status.message()));
  }
  return std::vector<google::protobuf::Value>(list.values().begin(), list.values().end());
}

void ParseElement(const google::protobuf::Value& element, google::protobuf::Message* out) {
  if (element.kind_case() != google::protobuf::Value::kStructValue) {
    throw MigrationRecordError("array element is not an object");
  }

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(element, &json);
  if (!to_json.ok()) {
    throw MigrationRecordError("array element: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, out, options);
  if (!status.ok()) {
    throw MigrationRecordError("array element: " + std::string(status.message()));
  }
}

db::model::SiteRecord MapSite(const legacy::v1::LegacySite& site) {
  RequireId(site.id(), "site");
  const std::string context = "site " + site.id();

  db::model::SiteRecord r;
  r.id         = site.id();
  r.name       = site.name();
  r.type       = ParseToken<sitely::model::SiteType>(site.type(), sitely::model::ParseSiteType, context);
  r.location   = site.location();
  r.start_date = site.start_date();
  r.is_running = site.is_running();
  r.end_date   = r.is_running ? std::string() : site.end_date();
  r.owner_name = site.owner_name();
  r.contact    = site.contact();
  r.created_at = site.created_at();
  if (!site.site_code().empty()) {
    r.site_code = UpperCase(site.site_code());
  }
  return r;
}

db::model::WorkerRecord MapWorker(const legacy::v1::LegacyWorker& worker) {
  RequireId(worker.id(), "worker");
  const std::string context = "worker " + worker.id();
  if (worker.site_id().empty()) {
    throw MigrationRecordError(context + ": missing site id");
  }

  db::model::WorkerRecord r;
  r.id           = worker.id();
  r.site_id      = worker.site_id();
  r.name         = worker.name();
  r.age          = worker.age();
  r.contact      = worker.contact();
  r.village      = worker.village();
  r.category     = ParseToken<sitely::model::WorkerCategory>(worker.category(), sitely::model::ParseWorkerCategory, context);
  r.photo_uri    = NonEmpty(worker.photo_uri());
  r.joining_date = worker.joining_date();
  r.is_active    = worker.has_is_active() ? worker.is_active() : true;
  return r;
}

db::model::WageRecord MapWage(const legacy::v1::LegacyLedgerEntry& entry) {
  db::model::WageRecord r;
  MapLedgerBase(entry, r, "hajari");
  RequireAmount(entry.overtime(), "hajari " + entry.id() + " overtime");
  r.overtime = entry.overtime();
  return r;
}

db::model::ExpenseRecord MapExpense(const legacy::v1::LegacyLedgerEntry& entry) {
  db::model::ExpenseRecord r;
  MapLedgerBase(entry, r, "expense");
  r.description = entry.description();
  return r;
}

db::model::PaymentRecord MapPayment(const legacy::v1::LegacyLedgerEntry& entry) {
  db::model::PaymentRecord r;
  MapLedgerBase(entry, r, "payment");
  if (!entry.method().empty()) {
    r.method = ParseToken<sitely::model::PaymentMethod>(entry.method(), sitely::model::ParsePaymentMethod, "payment " + entry.id());
  }
  return r;
}

db::model::PhotoRecord MapPhoto(const legacy::v1::LegacyPhoto& photo) {
  RequireId(photo.id(), "photo");
  if (photo.site_id().empty() || photo.uri().empty()) {
    throw MigrationRecordError("photo " + photo.id() + ": missing site id or uri");
  }

  // The legacy store kept no photo groups, so a group reference cannot resolve.
  db::model::PhotoRecord r;
  r.id          = photo.id();
  r.site_id     = photo.site_id();
  r.uri         = photo.uri();
  r.description = photo.description();
  r.date        = photo.date();
  r.time        = photo.time();
  return r;
}

db::model::MaterialRecord MapMaterial(const legacy::v1::LegacyMaterial& material) {
  RequireId(material.id(), "material");
  const std::string context = "material " + material.id();
  RequireAmount(material.quantity(), context + " quantity");
  RequireAmount(material.rate_per_unit(), context + " rate");
  RequireAmount(material.amount_paid(), context + " amount paid");

  db::model::MaterialRecord r;
  r.id             = material.id();
  r.site_id        = material.site_id();
  r.name           = material.name();
  r.vendor_name    = material.vendor_name();
  r.vendor_phone   = material.vendor_phone();
  r.quantity       = material.quantity();
  r.unit           = ParseToken<sitely::model::MaterialUnit>(material.unit(), sitely::model::ParseMaterialUnit, context);
  r.rate_per_unit  = material.rate_per_unit();
  r.total_amount   = material.quantity() * material.rate_per_unit();
  r.amount_paid    = material.amount_paid();
  r.bill_photo_uri = NonEmpty(material.bill_photo_url());
  r.purchased_at   = material.purchased_at();
  return r;
}

db::model::MaterialUsageRecord MapMaterialUsage(const legacy::v1::LegacyMaterialUsage& usage) {
  RequireId(usage.id(), "material usage");
  RequireAmount(usage.quantity_used(), "material usage " + usage.id());

  db::model::MaterialUsageRecord r;
  r.id            = usage.id();
  r.material_id   = usage.material_id();
  r.site_id       = usage.site_id();
  r.quantity_used = usage.quantity_used();
  r.description   = usage.description();
  r.date          = usage.date();
  return r;
}

} // namespace sitely::migration
