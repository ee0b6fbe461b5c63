#pragma once

#include <optional>
#include <string>

#include "internal/model/enums.hpp"

namespace sitely::db::model {

struct TodoRecord {
  std::string id;
  std::string title;
  std::string description;

  sitely::model::TodoType     type     = sitely::model::TodoType::kDaily;
  sitely::model::TodoPriority priority = sitely::model::TodoPriority::kMedium;

  std::optional<std::string> deadline;
  bool                       is_completed = false;
  std::optional<std::string> completed_at;
  std::optional<std::string> site_id;
  std::string                created_at;
};

struct TodoUpdate {
  std::optional<std::string>                  title;
  std::optional<std::string>                  description;
  std::optional<sitely::model::TodoType>     type;
  std::optional<sitely::model::TodoPriority> priority;
  std::optional<std::string>                  deadline;

  bool Empty() const {
    return !title && !description && !type && !priority && !deadline;
  }
};

} // namespace sitely::db::model
