#pragma once

#include <optional>
#include <string>

#include "internal/model/enums.hpp"

namespace sitely::db::model {

/*
  total_amount is quantity * rate_per_unit, computed when the row is written
  and persisted; it is never recomputed on read.
*/
struct MaterialRecord {
  std::string id;
  std::string site_id;
  std::string name;
  std::string vendor_name;
  std::string vendor_phone;
  double      quantity = 0;

  sitely::model::MaterialUnit unit = sitely::model::MaterialUnit::kOther;

  double                     rate_per_unit = 0;
  double                     total_amount  = 0;
  double                     amount_paid   = 0;
  std::optional<std::string> bill_photo_uri;
  std::string                purchased_at;
};

struct MaterialUpdate {
  std::optional<std::string>                  name;
  std::optional<std::string>                  vendor_name;
  std::optional<std::string>                  vendor_phone;
  std::optional<double>                       quantity;
  std::optional<sitely::model::MaterialUnit> unit;
  std::optional<double>                       rate_per_unit;
  std::optional<double>                       amount_paid;
  std::optional<std::string>                  bill_photo_uri;

  bool Empty() const {
    return !name && !vendor_name && !vendor_phone && !quantity && !unit && !rate_per_unit && !amount_paid && !bill_photo_uri;
  }
};

struct MaterialUsageRecord {
  std::string id;
  std::string material_id;
  std::string site_id;
  double      quantity_used = 0;
  std::string description;
  std::string date;
};

// raw_remaining may go negative to signal over-consumption; remaining is
// clamped at zero for display.
struct MaterialStock {
  std::string material_id;
  double      quantity      = 0;
  double      used          = 0;
  double      raw_remaining = 0;
  double      remaining     = 0;

  bool OverConsumed() const {
    return raw_remaining < 0;
  }
};

} // namespace sitely::db::model
