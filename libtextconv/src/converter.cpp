/**
 * @file converter.cpp
 * @brief Entry points shared by every TextConverter
 */

#include "textconv/converter.h"
#include "textconv/config.h"
#include "textconv/file_io.h"
#include <plog/Log.h>
#include <stdexcept>

namespace fs = std::filesystem;

namespace textconv {

namespace {

[[noreturn]] void clipboard_fatal(const Error &cause) {
  fatal_error(Error(ErrorCode::ClipboardUnavailable,
                    "Could not fetch the clipboard contents",
                    cause.to_string()));
}

} // namespace

// ============================================================================
// Text
// ============================================================================

std::string TextConverter::from_text(std::string_view input) const {
  return convert(input);
}

// ============================================================================
// Clipboard
// ============================================================================

Result<std::string>
TextConverter::try_from_clipboard(ClipboardService &clipboard) const {
  auto session = clipboard.open();
  if (session.is_error()) {
    return session.error();
  }

  auto text = session.value()->read_text();
  if (text.is_error()) {
    PLOG_ERROR << "Clipboard read failed: " << text.error().to_string();
    return text.error();
  }

  if (!text.value().has_value()) {
    PLOG_WARNING << "Clipboard holds no text; converting an empty string";
    return convert(std::string_view());
  }

  PLOG_DEBUG << "Converting " << text.value()->size()
             << " bytes from the clipboard";
  return convert(*text.value());
}

Result<std::string> TextConverter::try_from_clipboard() const {
  auto config = TextConvConfig::from_environment();
  if (config.is_error()) {
    PLOG_ERROR << "Invalid clipboard configuration: "
               << config.error().to_string();
    return config.error();
  }

  auto clipboard = make_system_clipboard(config.value().clipboard);
  return try_from_clipboard(*clipboard);
}

std::string TextConverter::from_clipboard(ClipboardService &clipboard) const {
  auto result = try_from_clipboard(clipboard);
  if (result.is_error()) {
    clipboard_fatal(result.error());
  }
  return std::move(result).value();
}

std::string TextConverter::from_clipboard() const {
  auto result = try_from_clipboard();
  if (result.is_error()) {
    clipboard_fatal(result.error());
  }
  return std::move(result).value();
}

// ============================================================================
// File
// ============================================================================

Result<std::string> TextConverter::try_from_file(const fs::path &path) const {
  auto input = read_text_file(path);
  if (input.is_error()) {
    PLOG_ERROR << input.error().to_string();
    return input.error();
  }

  PLOG_DEBUG << "Converting " << input.value().size() << " bytes from "
             << path.string();
  std::string output = convert(input.value());

  const fs::path output_path = derive_output_path(path);
  auto written = write_text_file(output_path, output);
  if (written.is_error()) {
    PLOG_ERROR << written.error().to_string();
    return written.error();
  }

  PLOG_INFO << "Wrote converted output to " << output_path.string();
  return output;
}

std::string TextConverter::from_file(const fs::path &path) const {
  auto result = try_from_file(path);
  if (result.is_error()) {
    fatal_error(result.error());
  }
  return std::move(result).value();
}

// ============================================================================
// FunctionConverter
// ============================================================================

FunctionConverter::FunctionConverter(ConvertFunction function)
    : function_(std::move(function)) {
  if (!function_) {
    throw std::invalid_argument("FunctionConverter requires a callable");
  }
}

std::string FunctionConverter::convert(std::string_view input) const {
  return function_(input);
}

FunctionConverter make_converter(ConvertFunction function) {
  return FunctionConverter(std::move(function));
}

} // namespace textconv
