/**
 * @file config.cpp
 * @brief Configuration implementation
 */

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

#include "textconv/config.h"

namespace textconv {

namespace {

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  if (value && value[0] != '\0') {
    return value;
  }
  return nullptr;
}

} // namespace

std::optional<plog::Severity> parse_log_severity(const std::string &name) {
  const std::string lower = to_lower(name);

  if (lower == "none") {
    return plog::none;
  }
  if (lower == "fatal") {
    return plog::fatal;
  }
  if (lower == "error") {
    return plog::error;
  }
  if (lower == "warning" || lower == "warn") {
    return plog::warning;
  }
  if (lower == "info") {
    return plog::info;
  }
  if (lower == "debug") {
    return plog::debug;
  }
  if (lower == "verbose") {
    return plog::verbose;
  }
  return std::nullopt;
}

// ============================================================================
// TextConvConfig Methods
// ============================================================================

void TextConvConfig::load_defaults() {
  clipboard.preferred_backend = ClipboardBackend::Auto;

  logging.severity = plog::info;
  logging.file.clear();
  logging.max_file_size = 1024 * 1024;
  logging.backup_count = 3;
  logging.console = false;
}

Result<void> TextConvConfig::validate() const {
  if (logging.severity < plog::none || logging.severity > plog::verbose) {
    return Error(ErrorCode::InvalidArgument, "Invalid log severity");
  }

  if (!logging.file.empty() && logging.max_file_size == 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Log file size limit must be greater than zero");
  }

  if (logging.backup_count < 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Log backup count cannot be negative");
  }

  return Result<void>::ok();
}

Result<TextConvConfig> TextConvConfig::from_environment() {
  TextConvConfig config;
  config.load_defaults();

  if (const char *backend = non_empty_env(ENV_CLIPBOARD_BACKEND)) {
    auto parsed = parse_clipboard_backend(backend);
    if (!parsed) {
      return Error(ErrorCode::InvalidArgument, "Unknown clipboard backend",
                   backend)
          .at(ENV_CLIPBOARD_BACKEND);
    }
    config.clipboard.preferred_backend = *parsed;
  }

  if (const char *level = non_empty_env(ENV_LOG_LEVEL)) {
    auto parsed = parse_log_severity(level);
    if (!parsed) {
      return Error(ErrorCode::InvalidArgument, "Unknown log level", level)
          .at(ENV_LOG_LEVEL);
    }
    config.logging.severity = *parsed;
  }

  if (const char *file = non_empty_env(ENV_LOG_FILE)) {
    config.logging.file = file;
  }

  TEXTCONV_TRY(config.validate());
  return config;
}

} // namespace textconv
