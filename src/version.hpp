#pragma once

// Build/version info.
//
// CMake defines GRIDCRAWL_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef GRIDCRAWL_VERSION
#define GRIDCRAWL_VERSION "dev"
#endif

#ifndef GRIDCRAWL_APPNAME
#define GRIDCRAWL_APPNAME "GridCrawl"
#endif
