#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace dx::detail {

inline std::uint64_t advance_rng(std::uint64_t& state) {
  if (state == 0) {
    state = 0x2545F4914F6CDD1DULL;
  }
  std::uint64_t x = state;
  x ^= x << 13;
  x ^= x >> 7;
  x ^= x << 17;
  state = x;
  return x;
}

// Record ids of the form "<prefix>-<16 hex digits>". Not thread-safe.
class IdGenerator {
public:
  explicit IdGenerator(std::uint64_t seed) : state_(seed) {}

  std::string next(const char* prefix) {
    std::ostringstream oss;
    oss << prefix << '-' << std::hex << std::setw(16) << std::setfill('0') << advance_rng(state_);
    return oss.str();
  }

private:
  std::uint64_t state_;
};

} // namespace dx::detail
