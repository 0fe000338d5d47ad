#pragma once

#include <string>

namespace boolstab {

// Project version string as defined by CMake's project(VERSION ...).
//
// CMake defines BOOLSTAB_VERSION_STRING for all targets that link against the
// core boolstab library.
#ifndef BOOLSTAB_VERSION_STRING
  #define BOOLSTAB_VERSION_STRING "0.0.0"
#endif

inline const char* version_cstr() {
  return BOOLSTAB_VERSION_STRING;
}

inline std::string version_string() {
  return std::string(version_cstr());
}

} // namespace boolstab
