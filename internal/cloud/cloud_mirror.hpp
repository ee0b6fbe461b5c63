#pragma once

#include <string>
#include <vector>

#include "internal/db/model/site_record.hpp"
#include "internal/db/model/worker_record.hpp"

namespace sitely::cloud {

// A site an owner bookmarked by its join code.
struct SavedSiteRef {
  std::string site_id;
  std::string site_code;
  std::string saved_at;
};

/*
  Remote mirror collaborator.

  Pushes are best-effort: the ledger store calls them after its own commit
  and logs failures. Implementations may throw.
*/
class CloudMirror {
 public:
  virtual ~CloudMirror() = default;

  virtual void UpsertSite(const db::model::SiteRecord& site) = 0;

  virtual void UpsertWorker(const db::model::WorkerRecord& worker) = 0;

  virtual std::vector<SavedSiteRef> SavedSiteRefs(const std::string& user_id) = 0;
};

} // namespace sitely::cloud
