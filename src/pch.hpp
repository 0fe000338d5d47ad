#pragma once

// Precompiled headers (PCH) for faster local builds.
//
// Only stable standard library headers belong here, never project headers.
//
// Enabled via CMake option: BOOLSTAB_ENABLE_PCH=ON

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
