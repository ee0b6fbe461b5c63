#pragma once

#include <optional>
#include <string>

#include "internal/model/enums.hpp"

namespace sitely::db::model {

struct WorkerRecord {
  std::string id;
  std::string site_id;
  std::string name;
  std::string age;
  std::string contact;
  std::string village;

  sitely::model::WorkerCategory category = sitely::model::WorkerCategory::kUnskilled;

  std::optional<std::string> photo_uri;
  std::string                joining_date; // YYYY-MM-DD
  bool                       is_active = true;
};

// Partial update. An engaged but empty photo_uri clears the photo.
struct WorkerUpdate {
  std::optional<std::string>                    name;
  std::optional<std::string>                    age;
  std::optional<std::string>                    contact;
  std::optional<std::string>                    village;
  std::optional<sitely::model::WorkerCategory> category;
  std::optional<std::string>                    photo_uri;
  std::optional<bool>                           is_active;

  bool Empty() const {
    return !name && !age && !contact && !village && !category && !photo_uri && !is_active;
  }
};

} // namespace sitely::db::model
