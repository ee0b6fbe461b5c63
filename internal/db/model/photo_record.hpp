#pragma once

#include <optional>
#include <string>

namespace sitely::db::model {

struct PhotoGroupRecord {
  std::string id;
  std::string site_id;
  std::string name;
  std::string created_at;
};

struct PhotoRecord {
  std::string                id;
  std::string                site_id;
  std::optional<std::string> group_id;
  std::string                uri;
  std::string                description;
  std::string                date;
  std::string                time;
};

} // namespace sitely::db::model
