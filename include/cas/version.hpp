#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define CAS_VERSION_MAJOR 0
#define CAS_VERSION_MINOR 3
#define CAS_VERSION_PATCH 0
#define CAS_VERSION_STRING "0.3.0"

namespace cas {

/// Project version information at compile time.
struct Version {
    static constexpr int major = CAS_VERSION_MAJOR;
    static constexpr int minor = CAS_VERSION_MINOR;
    static constexpr int patch = CAS_VERSION_PATCH;
    static constexpr const char* string = CAS_VERSION_STRING;
};

} // namespace cas
