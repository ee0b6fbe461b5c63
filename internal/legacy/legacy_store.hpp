#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sitely::legacy {

/*
  Flat key/value store written by earlier releases. Values are JSON text.

  The migration engine only reads it, apart from the completion flag.
*/
class LegacyStore {
 public:
  virtual ~LegacyStore() = default;

  virtual std::optional<std::string> GetItem(const std::string& key) = 0;

  virtual void SetItem(const std::string& key, const std::string& value) = 0;

  virtual std::vector<std::string> Keys() = 0;
};

} // namespace sitely::legacy
