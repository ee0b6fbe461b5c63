#include "id.hpp"

#include <algorithm>
#include <random>

namespace sitely::util {

namespace {

constexpr char kBase36[] = "0123456789abcdefghijklmnopqrstuvwxyz";

} // namespace

std::string GenerateId() {
  return GenerateId(Now());
}

std::string GenerateId(TimePoint now) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<int>  pick(0, 35);

  std::string id = std::to_string(ToUnixMillis(now));
  for (int i = 0; i < 9; ++i) {
    id.push_back(kBase36[pick(rng)]);
  }
  return id;
}

std::string ToBase36(uint64_t value) {
  if (value == 0) {
    return "0";
  }

  std::string out;
  while (value > 0) {
    out.push_back(kBase36[value % 36]);
    value /= 36;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

} // namespace sitely::util
