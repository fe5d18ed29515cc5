/**
 * @file config.h
 * @brief Library configuration for textconv
 *
 * Configuration is a plain value owned by the embedding application.
 * Nothing is persisted; from_environment() applies the TEXTCONV_*
 * environment overrides on top of the defaults.
 */

#ifndef TEXTCONV_CONFIG_H
#define TEXTCONV_CONFIG_H

#include "clipboard.h"
#include "error.h"
#include "platform.h"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <plog/Severity.h>
#include <string>

namespace textconv {

// ============================================================================
// Environment Variables
// ============================================================================

/// "auto", "wayland", "x11" or "none"
constexpr const char *ENV_CLIPBOARD_BACKEND = "TEXTCONV_CLIPBOARD_BACKEND";

/// "none", "fatal", "error", "warning", "info", "debug" or "verbose"
constexpr const char *ENV_LOG_LEVEL = "TEXTCONV_LOG_LEVEL";

/// Path of the rolling log file
constexpr const char *ENV_LOG_FILE = "TEXTCONV_LOG_FILE";

// ============================================================================
// Logging Configuration
// ============================================================================

/**
 * @brief Where and how much the library logs
 */
struct LogConfig {
  /// Maximum severity written
  plog::Severity severity = plog::info;

  /// Rolling log file (empty = no file appender)
  std::filesystem::path file;

  /// Size at which the log file rolls over
  size_t max_file_size = 1024 * 1024;

  /// Number of rolled files kept
  int backup_count = 3;

  /// Also log to the console
  bool console = false;
};

/**
 * @brief Parse a severity name (case-insensitive)
 */
TEXTCONV_API std::optional<plog::Severity>
parse_log_severity(const std::string &name);

// ============================================================================
// Library Configuration
// ============================================================================

/**
 * @brief Complete configuration for textconv
 */
struct TextConvConfig {
  /// Clipboard access
  ClipboardConfig clipboard;

  /// Logging
  LogConfig logging;

  /// Reset every field to its default
  void load_defaults();

  /// Validate configuration
  Result<void> validate() const;

  /**
   * @brief Defaults with the TEXTCONV_* environment overrides applied
   * @return Configuration, or InvalidArgument naming the bad variable
   */
  static Result<TextConvConfig> from_environment();
};

} // namespace textconv

#endif // TEXTCONV_CONFIG_H
