#include "enums.hpp"

#include <initializer_list>

namespace sitely::model {

std::optional<SiteType> ParseSiteType(std::string_view token) {
  if (token == "residential") return SiteType::kResidential;
  if (token == "commercial") return SiteType::kCommercial;
  if (token == "rowhouse" || token == "row-house") return SiteType::kRowHouse;
  if (token == "tenament" || token == "tenement") return SiteType::kTenement;
  if (token == "shop") return SiteType::kShop;
  if (token == "other") return SiteType::kOther;
  return std::nullopt;
}

std::optional<WorkerCategory> ParseWorkerCategory(std::string_view token) {
  if (token == "karigar" || token == "skilled") return WorkerCategory::kSkilled;
  if (token == "majdur" || token == "unskilled") return WorkerCategory::kUnskilled;
  return std::nullopt;
}

std::optional<PaymentMethod> ParsePaymentMethod(std::string_view token) {
  if (token == "cash") return PaymentMethod::kCash;
  if (token == "upi") return PaymentMethod::kUpi;
  if (token == "bank") return PaymentMethod::kBank;
  return std::nullopt;
}

std::optional<MaterialUnit> ParseMaterialUnit(std::string_view token) {
  for (auto unit : {MaterialUnit::kKg, MaterialUnit::kBag, MaterialUnit::kPiece, MaterialUnit::kTon, MaterialUnit::kLitre, MaterialUnit::kSqft,
                    MaterialUnit::kCft, MaterialUnit::kNos, MaterialUnit::kOther}) {
    if (token == ToString(unit)) {
      return unit;
    }
  }
  return std::nullopt;
}

std::optional<TodoType> ParseTodoType(std::string_view token) {
  if (token == "daily") return TodoType::kDaily;
  if (token == "monthly") return TodoType::kMonthly;
  return std::nullopt;
}

std::optional<TodoPriority> ParseTodoPriority(std::string_view token) {
  if (token == "high") return TodoPriority::kHigh;
  if (token == "medium") return TodoPriority::kMedium;
  if (token == "low") return TodoPriority::kLow;
  return std::nullopt;
}

} // namespace sitely::model
