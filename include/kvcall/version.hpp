/*
 * Fallback version header for kvcall
 *
 * The build system passes the real version through compile definitions; these defaults keep
 * the headers usable when they are consumed without it.
 */

#pragma once

// Semantic version components (fallback to 0.0.0)
#ifndef KVCALL_VERSION_MAJOR
#define KVCALL_VERSION_MAJOR 0
#endif

#ifndef KVCALL_VERSION_MINOR
#define KVCALL_VERSION_MINOR 0
#endif

#ifndef KVCALL_VERSION_PATCH
#define KVCALL_VERSION_PATCH 0
#endif

// Combined version string (fallback)
#ifndef KVCALL_VERSION_STRING
#define KVCALL_VERSION_STRING "0.0.0+dev"
#endif

#if defined(__cplusplus)
namespace kvcall {
namespace version {
constexpr int major_v = KVCALL_VERSION_MAJOR;
constexpr int minor_v = KVCALL_VERSION_MINOR;
constexpr int patch_v = KVCALL_VERSION_PATCH;
constexpr const char* string_v = KVCALL_VERSION_STRING;
} // namespace version
} // namespace kvcall
#endif
