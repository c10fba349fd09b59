#pragma once

// Build/version info.
//
// CMake defines ZIMP_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef ZIMP_VERSION
#define ZIMP_VERSION "dev"
#endif

#ifndef ZIMP_APPNAME
#define ZIMP_APPNAME "ZombiePocket"
#endif
