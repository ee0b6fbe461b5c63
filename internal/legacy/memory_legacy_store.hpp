#pragma once

#include <map>
#include <mutex>

#include "legacy_store.hpp"

namespace sitely::legacy {

class MemoryLegacyStore final : public LegacyStore {
 public:
  std::optional<std::string> GetItem(const std::string& key) override;
  void                       SetItem(const std::string& key, const std::string& value) override;
  std::vector<std::string>   Keys() override;

 private:
  std::mutex                         mutex_;
  std::map<std::string, std::string> items_;
};

} // namespace sitely::legacy
