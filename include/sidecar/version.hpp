/*
 * Fallback version header for sidecar
 *
 * The build system passes the real values as compile definitions; these defaults keep the
 * code compiling when it does not.
 */

#pragma once

#ifndef SIDECAR_VERSION_MAJOR
#define SIDECAR_VERSION_MAJOR 0
#endif

#ifndef SIDECAR_VERSION_MINOR
#define SIDECAR_VERSION_MINOR 0
#endif

#ifndef SIDECAR_VERSION_PATCH
#define SIDECAR_VERSION_PATCH 0
#endif

#ifndef SIDECAR_VERSION_STRING
#define SIDECAR_VERSION_STRING "0.0.0+dev"
#endif

#ifndef SIDECAR_GIT_COMMIT
#define SIDECAR_GIT_COMMIT "unknown"
#endif

#ifndef SIDECAR_BUILD_DATE
#define SIDECAR_BUILD_DATE __DATE__ " " __TIME__
#endif

// "X.Y.Z+qual (commit: abcdef1, built: YYYY-MM-DD HH:MM:SS)"
#ifndef SIDECAR_VERSION_LONG_STRING
#define SIDECAR_VERSION_LONG_STRING                                                                \
    SIDECAR_VERSION_STRING " (commit: " SIDECAR_GIT_COMMIT ", built: " SIDECAR_BUILD_DATE ")"
#endif

#if defined(__cplusplus)
namespace sidecar {
namespace version {
constexpr int major_v = SIDECAR_VERSION_MAJOR;
constexpr int minor_v = SIDECAR_VERSION_MINOR;
constexpr int patch_v = SIDECAR_VERSION_PATCH;
constexpr const char* string_v = SIDECAR_VERSION_STRING;
constexpr const char* long_string_v = SIDECAR_VERSION_LONG_STRING;
} // namespace version
} // namespace sidecar
#endif
