/**
 * @file error.h
 * @brief Error codes and result types for textconv
 *
 * Every fallible operation returns a Result. The aborting entry points
 * of TextConverter are thin wrappers that pass the error to
 * fatal_error().
 */

#ifndef TEXTCONV_ERROR_H
#define TEXTCONV_ERROR_H

#include "platform.h"
#include <optional>
#include <string>
#include <variant>

namespace textconv {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : int {
  // Success (0)
  Success = 0,

  // General errors (1-99)
  InvalidArgument = 2,

  // Clipboard errors (100-199)
  ClipboardUnavailable = 100,
  NoDisplayServer = 101,
  ClipboardToolNotFound = 102,

  // File read errors (300-349)
  FileNotFound = 300,
  FileReadError = 301,
  InvalidFileType = 302,

  // File write errors (350-399)
  FileCreateError = 350,
  FileWriteError = 351,

  // Platform errors (500-599)
  PlatformError = 500
};

/**
 * @brief The failure kinds an entry point can report
 *
 * Every ErrorCode belongs to exactly one category.
 */
enum class ErrorCategory {
  None,
  General,
  ClipboardUnavailable,
  FileUnreadable,
  OutputWriteFailed
};

// ============================================================================
// Error Information
// ============================================================================

/**
 * @brief Detailed error information
 */
struct Error {
  ErrorCode code = ErrorCode::Success;
  std::string message;
  std::string details;  // Additional context
  std::string location; // Path or operation the error refers to

  Error() = default;

  explicit Error(ErrorCode c, std::string msg = "", std::string det = "")
      : code(c), message(std::move(msg)), details(std::move(det)) {}

  /// Check if this represents an error
  bool is_error() const { return code != ErrorCode::Success; }

  /// Check if this represents success
  bool is_ok() const { return code == ErrorCode::Success; }

  /// Category of the error code
  ErrorCategory category() const;

  /// Get human-readable error string
  std::string to_string() const;

  /// Attach a location and return *this
  Error &at(std::string where) {
    location = std::move(where);
    return *this;
  }

  /// Create success result
  static Error ok() { return Error(ErrorCode::Success); }
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type that holds either a value or an error
 *
 * Usage:
 *   Result<std::string> result = read_text_file(path);
 *   if (result) {
 *       std::string text = result.value();
 *   } else {
 *       Error err = result.error();
 *   }
 */
template <typename T> class Result {
public:
  /// Construct with success value
  Result(T value) : data_(std::move(value)) {}

  /// Construct with error
  Result(Error error) : data_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : data_(Error(code, std::move(message))) {}

  /// Check if result is success
  bool is_ok() const { return std::holds_alternative<T>(data_); }

  /// Check if result is error
  bool is_error() const { return std::holds_alternative<Error>(data_); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the value (undefined behavior if error)
  T &value() & { return std::get<T>(data_); }
  const T &value() const & { return std::get<T>(data_); }
  T &&value() && { return std::get<T>(std::move(data_)); }

  /// Get the error (undefined behavior if success)
  Error &error() & { return std::get<Error>(data_); }
  const Error &error() const & { return std::get<Error>(data_); }

  /// Get value or default
  T value_or(T default_value) const {
    return is_ok() ? std::get<T>(data_) : std::move(default_value);
  }

private:
  std::variant<T, Error> data_;
};

/**
 * @brief Specialization for void result (success or error, no value)
 */
template <> class Result<void> {
public:
  /// Construct success
  Result() : error_(std::nullopt) {}

  /// Construct with error
  Result(Error error) : error_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : error_(Error(code, std::move(message))) {}

  bool is_ok() const { return !error_.has_value(); }
  bool is_error() const { return error_.has_value(); }
  explicit operator bool() const { return is_ok(); }

  Error &error() { return error_.value(); }
  const Error &error() const { return error_.value(); }

  /// Create success result
  static Result ok() { return Result(); }

private:
  std::optional<Error> error_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

/// Return early if result is error
#define TEXTCONV_TRY(result)                                                   \
  do {                                                                         \
    auto &&_result = (result);                                                 \
    if (_result.is_error()) {                                                  \
      return _result.error();                                                  \
    }                                                                          \
  } while (0)

/// Return early with error if condition is false
#define TEXTCONV_REQUIRE(condition, error_code, message)                       \
  do {                                                                         \
    if (!(condition)) {                                                        \
      return ::textconv::Error(error_code, message);                           \
    }                                                                          \
  } while (0)

// ============================================================================
// Error Code Helpers
// ============================================================================

/// Get human-readable name for error code
TEXTCONV_API const char *error_code_name(ErrorCode code);

/// Get description for error code
TEXTCONV_API const char *error_code_description(ErrorCode code);

/// Get the failure category of an error code
TEXTCONV_API ErrorCategory error_category(ErrorCode code);

/// Get human-readable name for an error category
TEXTCONV_API const char *error_category_name(ErrorCategory category);

/// Check if error code is recoverable by retrying later
TEXTCONV_API bool is_recoverable(ErrorCode code);

/**
 * @brief Report an error and terminate the process
 *
 * Logs at fatal severity, writes "textconv: fatal: <error>" to stderr
 * and calls std::abort().
 */
[[noreturn]] TEXTCONV_API void fatal_error(const Error &error);

} // namespace textconv

#endif // TEXTCONV_ERROR_H
