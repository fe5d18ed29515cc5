/**
 * @file textconv.h
 * @brief Main textconv API header
 *
 * textconv - pluggable text transformations with three entry points:
 * a string, the clipboard, or a file.
 *
 * Quick Start:
 * @code
 *   #include <textconv/textconv.h>
 *
 *   textconv::ReverseText reverse;
 *   std::string out = reverse.from_text("Hello World!");
 *
 *   auto result = reverse.try_from_file("notes.txt");
 *   if (!result) {
 *       std::cerr << result.error().to_string() << std::endl;
 *   }
 * @endcode
 */

#ifndef TEXTCONV_TEXTCONV_H
#define TEXTCONV_TEXTCONV_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature modules (in dependency order)
#include "clipboard.h"
#include "config.h"
#include "converter.h"
#include "converters.h"
#include "file_io.h"
#include "logging.h"

namespace textconv {

// ============================================================================
// Version Information
// ============================================================================

/// textconv major version
constexpr int VERSION_MAJOR = 1;

/// textconv minor version
constexpr int VERSION_MINOR = 0;

/// textconv patch version
constexpr int VERSION_PATCH = 0;

/// textconv version string
constexpr const char *VERSION_STRING = "1.0.0";

/**
 * @brief Get version information
 */
struct VersionInfo {
  int major = VERSION_MAJOR;
  int minor = VERSION_MINOR;
  int patch = VERSION_PATCH;
  const char *version_string = VERSION_STRING;
};

TEXTCONV_API VersionInfo get_version();

} // namespace textconv

#endif // TEXTCONV_TEXTCONV_H
