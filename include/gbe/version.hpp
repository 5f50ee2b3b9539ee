#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define GBE_VERSION_MAJOR 0
#define GBE_VERSION_MINOR 3
#define GBE_VERSION_PATCH 0
#define GBE_VERSION_STRING "0.3.0"

namespace gbe {

/// Engine version information at compile time.
struct Version {
    static constexpr int major = GBE_VERSION_MAJOR;
    static constexpr int minor = GBE_VERSION_MINOR;
    static constexpr int patch = GBE_VERSION_PATCH;
    static constexpr const char* string = GBE_VERSION_STRING;
};

} // namespace gbe
