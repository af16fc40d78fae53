#include "debug_log.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>

namespace dx::detail {

bool debug_enabled() {
  static bool enabled = [] {
    const char* env = std::getenv("DX_DEBUG_ENGINE");
    if (!env) {
      env = std::getenv("DX_DEBUG_SESSION");
    }
    if (!env) {
      return false;
    }
    std::string value(env);
    return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
  }();
  return enabled;
}

void debug_log(std::string_view channel, const std::string& message) {
  if (!debug_enabled()) {
    return;
  }
  static std::mutex mutex;
  std::scoped_lock guard(mutex);
  std::cerr << "[" << channel << "] " << message << std::endl;
}

} // namespace dx::detail
