/**
 * @file types.h
 * @brief Core type definitions for textconv
 */

#ifndef TEXTCONV_TYPES_H
#define TEXTCONV_TYPES_H

#include "platform.h"
#include <functional>
#include <string>
#include <string_view>

namespace textconv {

// ============================================================================
// Basic Types
// ============================================================================

/// Signature of a plain transformation function
using ConvertFunction = std::function<std::string(std::string_view)>;

// ============================================================================
// Output Naming
// ============================================================================

/// Suffix appended to the derived output path of a file conversion
constexpr const char *OUTPUT_SUFFIX = "_converted.md";

/// Character at which the input path is truncated
constexpr char OUTPUT_BASE_DELIMITER = '.';

} // namespace textconv

#endif // TEXTCONV_TYPES_H
