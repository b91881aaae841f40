/*
 * Fallback version header for docdrop
 *
 * The build system defines these macros on the command line; the defaults below keep the
 * sources compiling when it does not.
 */

#pragma once

#ifndef DOCDROP_VERSION_MAJOR
#define DOCDROP_VERSION_MAJOR 0
#endif

#ifndef DOCDROP_VERSION_MINOR
#define DOCDROP_VERSION_MINOR 0
#endif

#ifndef DOCDROP_VERSION_PATCH
#define DOCDROP_VERSION_PATCH 0
#endif

#ifndef DOCDROP_VERSION_STRING
#define DOCDROP_VERSION_STRING "0.0.0+dev"
#endif

#ifndef DOCDROP_BUILD_DATE
#define DOCDROP_BUILD_DATE __DATE__ " " __TIME__
#endif

#define DOCDROP_VERSION_LONG_STRING DOCDROP_VERSION_STRING " (built: " DOCDROP_BUILD_DATE ")"

namespace docdrop::version {
constexpr int major_v = DOCDROP_VERSION_MAJOR;
constexpr int minor_v = DOCDROP_VERSION_MINOR;
constexpr int patch_v = DOCDROP_VERSION_PATCH;
constexpr const char* string_v = DOCDROP_VERSION_STRING;
constexpr const char* long_string_v = DOCDROP_VERSION_LONG_STRING;
} // namespace docdrop::version
