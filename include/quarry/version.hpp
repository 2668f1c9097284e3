/*
 * Version macros for quarry.
 *
 * The build passes QUARRY_VERSION_* as compile definitions taken from the
 * CMake project version; these defaults apply when it does not.
 */

#pragma once

#ifndef QUARRY_VERSION_MAJOR
#define QUARRY_VERSION_MAJOR 0
#endif

#ifndef QUARRY_VERSION_MINOR
#define QUARRY_VERSION_MINOR 1
#endif

#ifndef QUARRY_VERSION_PATCH
#define QUARRY_VERSION_PATCH 0
#endif

#ifndef QUARRY_VERSION_STRING
#define QUARRY_VERSION_STRING "0.1.0+dev"
#endif

#if defined(__cplusplus)
namespace quarry {
namespace version {
constexpr int major_v = QUARRY_VERSION_MAJOR;
constexpr int minor_v = QUARRY_VERSION_MINOR;
constexpr int patch_v = QUARRY_VERSION_PATCH;
constexpr const char* string_v = QUARRY_VERSION_STRING;
} // namespace version
} // namespace quarry
#endif
