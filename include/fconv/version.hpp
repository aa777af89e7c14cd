/*
 * Fallback version header for fconv
 *
 * The build system passes the real values as compile definitions; these
 * defaults keep the code compiling when it does not.
 */

#pragma once

#ifndef FCONV_VERSION_MAJOR
#define FCONV_VERSION_MAJOR 0
#endif

#ifndef FCONV_VERSION_MINOR
#define FCONV_VERSION_MINOR 0
#endif

#ifndef FCONV_VERSION_PATCH
#define FCONV_VERSION_PATCH 0
#endif

#ifndef FCONV_VERSION_STRING
#define FCONV_VERSION_STRING "0.0.0+dev"
#endif

#ifndef FCONV_BUILD_DATE
#define FCONV_BUILD_DATE __DATE__ " " __TIME__
#endif

#ifndef FCONV_VERSION_LONG_STRING
#define FCONV_VERSION_LONG_STRING FCONV_VERSION_STRING " (built: " FCONV_BUILD_DATE ")"
#endif

#if defined(__cplusplus)
namespace fconv {
namespace version {
constexpr int major_v = FCONV_VERSION_MAJOR;
constexpr int minor_v = FCONV_VERSION_MINOR;
constexpr int patch_v = FCONV_VERSION_PATCH;
constexpr const char* string_v = FCONV_VERSION_STRING;
constexpr const char* long_string_v = FCONV_VERSION_LONG_STRING;
} // namespace version
} // namespace fconv
#endif
