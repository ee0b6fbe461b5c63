#pragma once

#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "legacy_store.hpp"

namespace sitely::legacy {

/*
  AsyncStorage-compatible store: one table of (key TEXT PRIMARY KEY, value TEXT).
  A file without the table reads as empty; the table is only created by the
  first SetItem.
*/
class SqliteLegacyStore final : public LegacyStore {
 public:
  SqliteLegacyStore(std::shared_ptr<db::sqlite::SqliteDB> db, std::string table);

  std::optional<std::string> GetItem(const std::string& key) override;
  void                       SetItem(const std::string& key, const std::string& value) override;
  std::vector<std::string>   Keys() override;

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
  std::string                           table_;
  bool                                  table_exists_ = false;
};

} // namespace sitely::legacy
