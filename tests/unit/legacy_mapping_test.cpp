#include "internal/migration/legacy_mapping.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using namespace sitely::migration;
using sitely::util::MigrationRecordError;

template <typename Message>
Message ParseOne(const std::string& json_array) {
  auto elements = ParseJsonArray(json_array);
  assert(elements.size() == 1);
  Message message;
  ParseElement(elements[0], &message);
  return message;
}

template <typename Fn>
bool ThrowsRecordError(Fn fn) {
  try {
    fn();
  } catch (const MigrationRecordError&) {
    return true;
  }
  return false;
}

void TestSiteMappingUpperCasesCodeAndIgnoresUnknownKeys() {
  auto legacy = ParseOne<sitely::legacy::v1::LegacySite>(
      R"([{"id":"1700000000000abc","name":"Shanti Nagar","type":"rowhouse","location":"Surat","startDate":"2023-01-10",
           "endDate":"2023-12-01","isRunning":true,"ownerName":"Patel","contact":"99","createdAt":"2023-01-10T00:00:00.000Z",
           "siteCode":"ab12cd","somethingNew":42}])");

  auto site = MapSite(legacy);
  assert(site.id == "1700000000000abc");
  assert(site.type == sitely::model::SiteType::kRowHouse);
  assert(site.site_code == std::optional<std::string>("AB12CD"));
  // running sites carry no end date
  assert(site.end_date.empty());
  assert(!site.user_id);
}

void TestWorkerDefaultsToActive() {
  auto legacy = ParseOne<sitely::legacy::v1::LegacyWorker>(
      R"([{"id":"w1","siteId":"s1","name":"Ramesh","age":"34","category":"karigar","joiningDate":"2024-01-01"}])");
  auto worker = MapWorker(legacy);
  assert(worker.is_active);
  assert(worker.category == sitely::model::WorkerCategory::kSkilled);
  assert(!worker.photo_uri);

  auto inactive = ParseOne<sitely::legacy::v1::LegacyWorker>(
      R"([{"id":"w2","siteId":"s1","name":"Suresh","category":"majdur","joiningDate":"2024-01-01","isActive":false}])");
  assert(!MapWorker(inactive).is_active);
}

void TestLedgerEntriesAreValidated() {
  auto wage = MapWage(ParseOne<sitely::legacy::v1::LegacyLedgerEntry>(
      R"([{"id":"h1","siteId":"s1","workerId":"w1","workerName":"Ramesh","workerCategory":"skilled","amount":500,"overtime":50,
           "date":"2024-06-01","time":"09:00"}])"));
  assert(wage.amount == 500);
  assert(wage.overtime == 50);
  assert(wage.worker_category == "karigar");

  auto payment = MapPayment(ParseOne<sitely::legacy::v1::LegacyLedgerEntry>(
      R"([{"id":"p1","siteId":"s1","workerId":"w1","amount":300,"date":"2024-06-03"}])"));
  assert(payment.method == sitely::model::PaymentMethod::kCash);

  auto bad_date = ParseOne<sitely::legacy::v1::LegacyLedgerEntry>(R"([{"id":"e1","siteId":"s1","workerId":"w1","amount":1,"date":"yesterday"}])");
  assert(ThrowsRecordError([&] { MapExpense(bad_date); }));

  auto stamped = MapExpense(ParseOne<sitely::legacy::v1::LegacyLedgerEntry>(
      R"([{"id":"e3","siteId":"s1","workerId":"w1","amount":1,"date":"2024-06-01T09:30:00.000Z"}])"));
  assert(stamped.date == "2024-06-01");

  auto trailing = ParseOne<sitely::legacy::v1::LegacyLedgerEntry>(R"([{"id":"e4","siteId":"s1","workerId":"w1","amount":1,"date":"2024-06-01junk"}])");
  assert(ThrowsRecordError([&] { MapExpense(trailing); }));

  auto negative = ParseOne<sitely::legacy::v1::LegacyLedgerEntry>(R"([{"id":"e2","siteId":"s1","workerId":"w1","amount":-5,"date":"2024-06-01"}])");
  assert(ThrowsRecordError([&] { MapExpense(negative); }));

  auto bad_method = ParseOne<sitely::legacy::v1::LegacyLedgerEntry>(
      R"([{"id":"p2","siteId":"s1","workerId":"w1","amount":5,"date":"2024-06-01","method":"cheque"}])");
  assert(ThrowsRecordError([&] { MapPayment(bad_method); }));
}

void TestMaterialTotalIsRecomputed() {
  auto material = MapMaterial(ParseOne<sitely::legacy::v1::LegacyMaterial>(
      R"([{"id":"m1","siteId":"s1","name":"Cement","quantity":10,"unit":"bag","ratePerUnit":380,"totalAmount":1,"amountPaid":0,
           "billPhotoUrl":"file:///bill.jpg","purchasedAt":"2024-06-01T00:00:00.000Z"}])"));
  assert(material.total_amount == 3800);
  assert(material.unit == sitely::model::MaterialUnit::kBag);
  assert(material.bill_photo_uri == std::optional<std::string>("file:///bill.jpg"));
}

void TestPhotoDropsGroupReference() {
  auto photo = MapPhoto(ParseOne<sitely::legacy::v1::LegacyPhoto>(
      R"([{"id":"ph1","siteId":"s1","groupId":"g-gone","uri":"file:///a.jpg","date":"2024-06-01","time":"10:00"}])"));
  assert(!photo.group_id);
}

void TestMalformedBlobs() {
  assert(ThrowsRecordError([] { ParseJsonArray(R"({"id":"not-an-array"})"); }));
  assert(ThrowsRecordError([] { ParseJsonArray("[{"); }));

  auto elements = ParseJsonArray(R"([42])");
  assert(elements.size() == 1);
  sitely::legacy::v1::LegacySite site;
  assert(ThrowsRecordError([&] { ParseElement(elements[0], &site); }));

  assert(ThrowsRecordError([] { MapSite(sitely::legacy::v1::LegacySite()); }));
}

} // namespace

int main() {
  TestSiteMappingUpperCasesCodeAndIgnoresUnknownKeys();
  TestWorkerDefaultsToActive();
  TestLedgerEntriesAreValidated();
  TestMaterialTotalIsRecomputed();
  TestPhotoDropsGroupReference();
  TestMalformedBlobs();

  std::cout << "sitely_unit_legacy_mapping: pass\n";
  return 0;
}
