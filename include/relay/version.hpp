#pragma once

#define RELAY_VERSION_MAJOR 0
#define RELAY_VERSION_MINOR 2
#define RELAY_VERSION_PATCH 0

#define RELAY_VERSION_CODE \
  ((RELAY_VERSION_MAJOR << 16) | (RELAY_VERSION_MINOR << 8) | (RELAY_VERSION_PATCH))

#define RELAY_VERSION_STRING "0.2.0"

namespace relay {
struct version {
  static constexpr int major = RELAY_VERSION_MAJOR;
  static constexpr int minor = RELAY_VERSION_MINOR;
  static constexpr int patch = RELAY_VERSION_PATCH;
  static constexpr const char* string = RELAY_VERSION_STRING;
};
}
