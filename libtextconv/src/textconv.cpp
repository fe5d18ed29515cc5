/**
 * @file textconv.cpp
 * @brief Library-level definitions
 */

#include "textconv/textconv.h"

namespace textconv {

VersionInfo get_version() { return VersionInfo{}; }

} // namespace textconv
