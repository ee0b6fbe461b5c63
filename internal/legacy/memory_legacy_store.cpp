#include "memory_legacy_store.hpp"

namespace sitely::legacy {

std::optional<std::string> MemoryLegacyStore::GetItem(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = items_.find(key);
  if (it == items_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryLegacyStore::SetItem(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  items_[key] = value;
}

std::vector<std::string> MemoryLegacyStore::Keys() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string>    keys;
  keys.reserve(items_.size());
  for (const auto& [key, value] : items_) {
    keys.push_back(key);
  }
  return keys;
}

} // namespace sitely::legacy
