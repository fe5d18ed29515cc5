/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "textconv/error.h"
#include <cstdio>
#include <cstdlib>
#include <plog/Log.h>
#include <sstream>

namespace textconv {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";

  case ErrorCode::ClipboardUnavailable:
    return "ClipboardUnavailable";
  case ErrorCode::NoDisplayServer:
    return "NoDisplayServer";
  case ErrorCode::ClipboardToolNotFound:
    return "ClipboardToolNotFound";

  case ErrorCode::FileNotFound:
    return "FileNotFound";
  case ErrorCode::FileReadError:
    return "FileReadError";
  case ErrorCode::InvalidFileType:
    return "InvalidFileType";

  case ErrorCode::FileCreateError:
    return "FileCreateError";
  case ErrorCode::FileWriteError:
    return "FileWriteError";

  case ErrorCode::PlatformError:
    return "PlatformError";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";

  case ErrorCode::ClipboardUnavailable:
    return "Could not fetch the clipboard contents";
  case ErrorCode::NoDisplayServer:
    return "No display server detected";
  case ErrorCode::ClipboardToolNotFound:
    return "No clipboard tool found for the display server";

  case ErrorCode::FileNotFound:
    return "File not found";
  case ErrorCode::FileReadError:
    return "Failed to read file contents";
  case ErrorCode::InvalidFileType:
    return "File is not valid UTF-8 text";

  case ErrorCode::FileCreateError:
    return "Failed to create the output file";
  case ErrorCode::FileWriteError:
    return "Failed to write to the output file";

  case ErrorCode::PlatformError:
    return "Platform-specific error occurred";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Categories
// ============================================================================

ErrorCategory error_category(ErrorCode code) {
  const int value = static_cast<int>(code);

  if (code == ErrorCode::Success) {
    return ErrorCategory::None;
  }
  if (value >= 100 && value < 200) {
    return ErrorCategory::ClipboardUnavailable;
  }
  if (value >= 300 && value < 350) {
    return ErrorCategory::FileUnreadable;
  }
  if (value >= 350 && value < 400) {
    return ErrorCategory::OutputWriteFailed;
  }
  return ErrorCategory::General;
}

const char *error_category_name(ErrorCategory category) {
  switch (category) {
  case ErrorCategory::None:
    return "None";
  case ErrorCategory::General:
    return "General";
  case ErrorCategory::ClipboardUnavailable:
    return "ClipboardUnavailable";
  case ErrorCategory::FileUnreadable:
    return "FileUnreadable";
  case ErrorCategory::OutputWriteFailed:
    return "OutputWriteFailed";
  default:
    return "Invalid";
  }
}

ErrorCategory Error::category() const { return error_category(code); }

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Environment has to change before a retry can succeed
  case ErrorCode::NoDisplayServer:
  case ErrorCode::ClipboardToolNotFound:
  case ErrorCode::InvalidFileType:
    return false;

  default:
    return true;
  }
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  if (!location.empty()) {
    oss << " [" << location << "]";
  }

  return oss.str();
}

// ============================================================================
// Fatal Reporting
// ============================================================================

void fatal_error(const Error &error) {
  const std::string text = error.to_string();

  PLOG_FATAL << text;

  std::fprintf(stderr, "textconv: fatal: %s\n", text.c_str());
  std::fflush(stderr);
  std::abort();
}

} // namespace textconv
