#pragma once

#include <optional>
#include <string>

#include "internal/model/enums.hpp"

namespace sitely::db::model {

/*
  Persistent site row.

  - end_date is only meaningful when is_running == false; the store writes an
    empty end date for running sites.
  - user_id == nullopt marks a pre-multi-user site visible to every user.
*/

struct SiteRecord {
  std::string id;
  std::string name;

  sitely::model::SiteType type = sitely::model::SiteType::kResidential;

  std::string location;
  std::string start_date;
  std::string end_date;
  bool        is_running = true;
  std::string owner_name;
  std::string contact;

  // 6 upper-case [A-Z0-9] characters; longer only for fallback codes
  std::optional<std::string> site_code;
  std::optional<std::string> user_id;

  std::string created_at;
};

// Partial update: only engaged fields are written.
struct SiteUpdate {
  std::optional<std::string>              name;
  std::optional<sitely::model::SiteType> type;
  std::optional<std::string>              location;
  std::optional<std::string>              start_date;
  std::optional<std::string>              end_date;
  std::optional<bool>                     is_running;
  std::optional<std::string>              owner_name;
  std::optional<std::string>              contact;

  bool Empty() const {
    return !name && !type && !location && !start_date && !end_date && !is_running && !owner_name && !contact;
  }
};

} // namespace sitely::db::model
