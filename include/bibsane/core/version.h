#pragma once

namespace bibsane::core {

// kBuildVersion is the current software version string.
// Updated once per release.
constexpr const char* kBuildVersion = "0.2";

}  // namespace bibsane::core
