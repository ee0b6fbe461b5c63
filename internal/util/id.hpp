#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace sitely::util {

/*
  Record id helpers

  Ids are opaque strings: epoch milliseconds followed by 9 random base-36
  characters. The same shape is produced by the legacy key/value store, so
  migrated and native ids sort together by creation time.
*/

std::string GenerateId();
std::string GenerateId(TimePoint now);

// Lower-case base-36 rendering of `value`.
std::string ToBase36(uint64_t value);

} // namespace sitely::util
