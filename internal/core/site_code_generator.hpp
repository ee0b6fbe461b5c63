#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "internal/util/time.hpp"

namespace sitely::core {

/*
  Six-character join codes for sites, drawn uniformly from [A-Z0-9].

  A candidate is retried while `exists` reports a site with that code. After
  kMaxAttempts the last candidate gets a two-character base-36 suffix from the
  clock. That fallback is best-effort and is logged; it does not guarantee
  uniqueness.
*/
class SiteCodeGenerator {
 public:
  static constexpr std::size_t kCodeLength  = 6;
  static constexpr int         kMaxAttempts = 20;
  static constexpr const char* kAlphabet    = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

  // Returns a uniformly distributed index in [0, bound).
  using RandomIndex = std::function<std::size_t(std::size_t bound)>;
  using ExistsCheck = std::function<bool(const std::string& code)>;

  explicit SiteCodeGenerator(ExistsCheck exists, RandomIndex random = {}, util::TimeSource now = {});

  std::string Generate();

 private:
  std::string Candidate();

  ExistsCheck      exists_;
  RandomIndex      random_;
  util::TimeSource now_;
};

} // namespace sitely::core
