#pragma once

#define PEERREC_VERSION_MAJOR 0
#define PEERREC_VERSION_MINOR 3
#define PEERREC_VERSION_PATCH 0

#define PEERREC_VERSION_STRING "0.3.0"

// For compile-time version checks
#define PEERREC_VERSION \
  (PEERREC_VERSION_MAJOR * 10000 + PEERREC_VERSION_MINOR * 100 + PEERREC_VERSION_PATCH)

namespace peerrec {

inline const char* Version() { return PEERREC_VERSION_STRING; }

}  // namespace peerrec
