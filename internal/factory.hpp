#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/cloud/cloud_mirror.hpp"
#include "internal/runtime/storage_runtime.hpp"

namespace sitely::factory {

/*
  BuildStorageRuntime

  Composition root. The only place that knows the concrete store types;
  everything downstream sees db::Repository and legacy::LegacyStore.

  Nothing is opened here: the runtime opens its stores on first
  Initialize().
*/
std::unique_ptr<runtime::StorageRuntime> BuildStorageRuntime(const sitely::runtime::config::RuntimeConfig& config,
                                                             std::shared_ptr<cloud::CloudMirror>           mirror = nullptr);

} // namespace sitely::factory
