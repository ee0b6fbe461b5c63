#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace sitely::model {

/*
  Closed value domains persisted as text tokens.

  Tokens are the ones written by the legacy key/value store, so migrated rows
  and native rows share one representation. Parse* returns nullopt for tokens
  outside the domain; callers turn that into a ConstraintViolation.
*/

enum class SiteType : std::uint8_t {
  kResidential = 0,
  kCommercial  = 1,
  kRowHouse    = 2,
  kTenement    = 3,
  kShop        = 4,
  kOther       = 5,
};

// Exactly two categories: karigar (skilled) and majdur (unskilled).
enum class WorkerCategory : std::uint8_t {
  kSkilled   = 0,
  kUnskilled = 1,
};

enum class PaymentMethod : std::uint8_t {
  kCash = 0,
  kUpi  = 1,
  kBank = 2,
};

enum class MaterialUnit : std::uint8_t {
  kKg    = 0,
  kBag   = 1,
  kPiece = 2,
  kTon   = 3,
  kLitre = 4,
  kSqft  = 5,
  kCft   = 6,
  kNos   = 7,
  kOther = 8,
};

enum class TodoType : std::uint8_t {
  kDaily   = 0,
  kMonthly = 1,
};

enum class TodoPriority : std::uint8_t {
  kHigh   = 0,
  kMedium = 1,
  kLow    = 2,
};

constexpr std::string_view ToString(SiteType type) {
  switch (type) {
    case SiteType::kResidential:
      return "residential";
    case SiteType::kCommercial:
      return "commercial";
    case SiteType::kRowHouse:
      return "rowhouse";
    case SiteType::kTenement:
      return "tenament";
    case SiteType::kShop:
      return "shop";
    case SiteType::kOther:
    default:
      return "other";
  }
}

constexpr std::string_view ToString(WorkerCategory category) {
  switch (category) {
    case WorkerCategory::kSkilled:
      return "karigar";
    case WorkerCategory::kUnskilled:
    default:
      return "majdur";
  }
}

constexpr std::string_view ToString(PaymentMethod method) {
  switch (method) {
    case PaymentMethod::kUpi:
      return "upi";
    case PaymentMethod::kBank:
      return "bank";
    case PaymentMethod::kCash:
    default:
      return "cash";
  }
}

constexpr std::string_view ToString(MaterialUnit unit) {
  switch (unit) {
    case MaterialUnit::kKg:
      return "kg";
    case MaterialUnit::kBag:
      return "bag";
    case MaterialUnit::kPiece:
      return "piece";
    case MaterialUnit::kTon:
      return "ton";
    case MaterialUnit::kLitre:
      return "litre";
    case MaterialUnit::kSqft:
      return "sqft";
    case MaterialUnit::kCft:
      return "cft";
    case MaterialUnit::kNos:
      return "nos";
    case MaterialUnit::kOther:
    default:
      return "other";
  }
}

constexpr std::string_view ToString(TodoType type) {
  return type == TodoType::kMonthly ? "monthly" : "daily";
}

constexpr std::string_view ToString(TodoPriority priority) {
  switch (priority) {
    case TodoPriority::kHigh:
      return "high";
    case TodoPriority::kLow:
      return "low";
    case TodoPriority::kMedium:
    default:
      return "medium";
  }
}

std::optional<SiteType>       ParseSiteType(std::string_view token);
std::optional<WorkerCategory> ParseWorkerCategory(std::string_view token);
std::optional<PaymentMethod>  ParsePaymentMethod(std::string_view token);
std::optional<MaterialUnit>   ParseMaterialUnit(std::string_view token);
std::optional<TodoType>       ParseTodoType(std::string_view token);
std::optional<TodoPriority>   ParseTodoPriority(std::string_view token);

} // namespace sitely::model
