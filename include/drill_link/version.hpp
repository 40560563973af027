// === Version Metadata ========================================================
//
// Exposes the bridge's semantic version string used in logs.

#pragma once

#include <string_view>

namespace drill_link {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace drill_link
