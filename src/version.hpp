#pragma once

// Build/version info.
//
// CMake defines MAZERUNNER_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef MAZERUNNER_VERSION
#define MAZERUNNER_VERSION "dev"
#endif

#ifndef MAZERUNNER_APPNAME
#define MAZERUNNER_APPNAME "MazeRunner"
#endif

// Bumped whenever the progress file layout changes incompatibly.
#define MAZERUNNER_PROGRESS_VERSION 1
