#pragma once

#define LS8_VERSION_MAJOR 1
#define LS8_VERSION_MINOR 0
#define LS8_VERSION_PATCH 0
#define LS8_VERSION_STRING "1.0.0"

namespace ls8 {

inline constexpr const char* kProgramName = "LS-8 Simulator";

} // namespace ls8
