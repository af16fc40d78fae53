#pragma once

#include "dx/errors.hpp"
#include "debug_log.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace dx::detail {

// `stored` is nullopt when the record does not exist yet.
inline void check_write_version(const char* kind, const std::string& id,
                                std::optional<std::uint64_t> stored, std::uint64_t incoming) {
  const std::uint64_t expected = stored.has_value() ? stored.value() + 1 : 1;
  if (incoming == expected) {
    return;
  }
  const std::string message = std::string(kind) + " " + id + ": version conflict (stored " +
                              (stored.has_value() ? std::to_string(stored.value()) : "none") +
                              ", write " + std::to_string(incoming) + ")";
  debug_log("store", message);
  throw PersistenceFailure(message);
}

} // namespace dx::detail
