/**
 * @file converter.h
 * @brief The text transformation abstraction
 *
 * A concrete converter implements one pure function, convert(), and
 * gets three entry points for free:
 * - from_text():      convert a string directly
 * - from_clipboard(): convert the current clipboard text
 * - from_file():      convert a file and save the result beside it
 *
 * Example usage:
 * @code
 *   class ReverseText : public textconv::TextConverter {
 *   public:
 *     std::string convert(std::string_view input) const override {
 *       return std::string(input.rbegin(), input.rend());
 *     }
 *   };
 *
 *   ReverseText reverse;
 *   reverse.from_text("Hello World!"); // "!dlroW olleH"
 *   reverse.from_file("notes.txt");    // also writes notes_converted.md
 * @endcode
 *
 * The try_ entry points report failures as Result errors. The plain
 * from_clipboard() and from_file() treat the same failures as fatal
 * and abort the process with a diagnostic.
 */

#ifndef TEXTCONV_CONVERTER_H
#define TEXTCONV_CONVERTER_H

#include "clipboard.h"
#include "error.h"
#include "platform.h"
#include "types.h"
#include <filesystem>
#include <string>
#include <string_view>

namespace textconv {

/**
 * @brief Base class of every text transformation
 *
 * Implementations must be deterministic and free of side effects; the
 * entry points rely on convert() being callable any number of times.
 * Each implementation documents what it does with malformed UTF-8.
 */
class TEXTCONV_API TextConverter {
public:
  virtual ~TextConverter() = default;

  /**
   * @brief Transform @p input into the desired form
   *
   * Preferably called through one of the entry points below.
   */
  virtual std::string convert(std::string_view input) const = 0;

  // ========================================================================
  // Text
  // ========================================================================

  /// Same as convert(input)
  std::string from_text(std::string_view input) const;

  // ========================================================================
  // Clipboard
  // ========================================================================

  /**
   * @brief Convert the clipboard text of the desktop session
   *
   * The system clipboard is configured by TextConvConfig::from_environment().
   * A clipboard without text (empty, or holding an image) is converted
   * as "". Aborts if the clipboard cannot be accessed or the environment
   * configuration is invalid.
   */
  std::string from_clipboard() const;

  /// from_clipboard() against a caller-supplied clipboard
  std::string from_clipboard(ClipboardService &clipboard) const;

  /**
   * @brief Convert the clipboard text, reporting failures
   * @return Converted text, an ErrorCategory::ClipboardUnavailable error,
   *         or InvalidArgument for a bad environment override
   */
  Result<std::string> try_from_clipboard() const;

  /// try_from_clipboard() against a caller-supplied clipboard
  Result<std::string> try_from_clipboard(ClipboardService &clipboard) const;

  // ========================================================================
  // File
  // ========================================================================

  /**
   * @brief Convert a text file and write the result beside it
   *
   * The result is written to derive_output_path(path), replacing any
   * existing file, and also returned. Aborts if the file cannot be read
   * as text or the output cannot be written.
   */
  std::string from_file(const std::filesystem::path &path) const;

  /**
   * @brief Convert a text file, reporting failures
   *
   * Nothing is written when reading fails.
   *
   * @return Converted text, or an ErrorCategory::FileUnreadable /
   *         ErrorCategory::OutputWriteFailed error
   */
  Result<std::string> try_from_file(const std::filesystem::path &path) const;
};

/**
 * @brief Adapts a plain function to TextConverter
 */
class TEXTCONV_API FunctionConverter : public TextConverter {
public:
  /// @throws std::invalid_argument if @p function is empty
  explicit FunctionConverter(ConvertFunction function);

  std::string convert(std::string_view input) const override;

private:
  ConvertFunction function_;
};

/// Wrap @p function as a converter
TEXTCONV_API FunctionConverter make_converter(ConvertFunction function);

} // namespace textconv

#endif // TEXTCONV_CONVERTER_H
