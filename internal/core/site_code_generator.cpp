#include "site_code_generator.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <random>

#include "internal/observability/logging.hpp"
#include "internal/util/id.hpp"

namespace sitely::core {

namespace {

std::size_t DefaultRandomIndex(std::size_t bound) {
  thread_local std::mt19937_64           rng{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> dist(0, bound - 1);
  return dist(rng);
}

} // namespace

SiteCodeGenerator::SiteCodeGenerator(ExistsCheck exists, RandomIndex random, util::TimeSource now)
    : exists_(std::move(exists)), random_(random ? std::move(random) : RandomIndex(DefaultRandomIndex)),
      now_(now ? std::move(now) : util::TimeSource(util::Now)) {
}

std::string SiteCodeGenerator::Candidate() {
  const std::size_t alphabet_size = std::strlen(kAlphabet);

  std::string code;
  code.reserve(kCodeLength);
  for (std::size_t i = 0; i < kCodeLength; ++i) {
    code.push_back(kAlphabet[random_(alphabet_size) % alphabet_size]);
  }
  return code;
}

std::string SiteCodeGenerator::Generate() {
  std::string code;
  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    code = Candidate();
    if (!exists_(code)) {
      return code;
    }
  }

  auto suffix = util::ToBase36(util::ToUnixMillis(now_()));
  if (suffix.size() > 2) {
    suffix = suffix.substr(suffix.size() - 2);
  }
  std::transform(suffix.begin(), suffix.end(), suffix.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  SITELY_LOG_WARN("CodeGenerationExhausted", {observability::IntField("attempts", kMaxAttempts),
                                              observability::StringField("fallback_code", code + suffix)});
  return code + suffix;
}

} // namespace sitely::core
