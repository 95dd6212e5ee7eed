#pragma once

#define TEXTSCRUB_VERSION_MAJOR 0
#define TEXTSCRUB_VERSION_MINOR 1
#define TEXTSCRUB_VERSION_PATCH 0

#define TEXTSCRUB_VERSION_STRING "0.1.0"

// For compile-time version checks
#define TEXTSCRUB_VERSION \
  (TEXTSCRUB_VERSION_MAJOR * 10000 + TEXTSCRUB_VERSION_MINOR * 100 + TEXTSCRUB_VERSION_PATCH)

namespace textscrub {

inline const char* Version() { return TEXTSCRUB_VERSION_STRING; }

}  // namespace textscrub
