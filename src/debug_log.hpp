#pragma once

#include <string>
#include <string_view>

namespace dx::detail {

// Enabled by DX_DEBUG_ENGINE or DX_DEBUG_SESSION.
bool debug_enabled();

void debug_log(std::string_view channel, const std::string& message);

} // namespace dx::detail
