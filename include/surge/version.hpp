#pragma once

// Keep in sync with project(VERSION) in CMakeLists.txt.
#define SURGE_VERSION_MAJOR 0
#define SURGE_VERSION_MINOR 1
#define SURGE_VERSION_PATCH 0

#define SURGE_DETAIL_STR2(x) #x
#define SURGE_DETAIL_STR(x) SURGE_DETAIL_STR2(x)

#define SURGE_VERSION_CODE \
  ((SURGE_VERSION_MAJOR << 16) | (SURGE_VERSION_MINOR << 8) | (SURGE_VERSION_PATCH))

#define SURGE_VERSION_STRING              \
  SURGE_DETAIL_STR(SURGE_VERSION_MAJOR) "." \
  SURGE_DETAIL_STR(SURGE_VERSION_MINOR) "." \
  SURGE_DETAIL_STR(SURGE_VERSION_PATCH)

// #if SURGE_VERSION_AT_LEAST(0, 2, 0)
#define SURGE_VERSION_AT_LEAST(ma, mi, pa) \
  (SURGE_VERSION_CODE >= (((ma) << 16) | ((mi) << 8) | (pa)))

namespace surge {
// "major"/"minor" are macros on some libc headers, hence the suffixes.
struct version {
  static constexpr int major_number = SURGE_VERSION_MAJOR;
  static constexpr int minor_number = SURGE_VERSION_MINOR;
  static constexpr int patch_number = SURGE_VERSION_PATCH;
  static constexpr int code = SURGE_VERSION_CODE;
  static constexpr const char* string = SURGE_VERSION_STRING;
};
} // namespace surge
