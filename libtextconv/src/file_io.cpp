/**
 * @file file_io.cpp
 * @brief Whole-file text I/O implementation
 */

#include "textconv/file_io.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <plog/Log.h>
#include <sstream>
#include <utf8proc.h>

namespace fs = std::filesystem;

namespace textconv {

// ============================================================================
// UTF-8 Validation
// ============================================================================

bool is_valid_utf8(std::string_view text) {
  const auto *str = reinterpret_cast<const utf8proc_uint8_t *>(text.data());
  const auto len = static_cast<utf8proc_ssize_t>(text.size());

  utf8proc_ssize_t pos = 0;
  while (pos < len) {
    utf8proc_int32_t codepoint;
    utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
    if (bytes <= 0) {
      return false;
    }
    pos += bytes;
  }
  return true;
}

// ============================================================================
// Reading
// ============================================================================

Result<std::string> read_text_file(const fs::path &path) {
  std::error_code ec;

  if (!fs::exists(path, ec)) {
    return Error(ErrorCode::FileNotFound, "Failed to read file contents",
                 ec ? ec.message() : "No such file or directory")
        .at(path.string());
  }

  if (fs::is_directory(path, ec)) {
    return Error(ErrorCode::FileReadError, "Failed to read file contents",
                 "Is a directory")
        .at(path.string());
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return Error(ErrorCode::FileReadError, "Failed to read file contents",
                 std::strerror(errno))
        .at(path.string());
  }

  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    return Error(ErrorCode::FileReadError, "Failed to read file contents",
                 "I/O error while reading")
        .at(path.string());
  }

  std::string text = contents.str();
  if (!is_valid_utf8(text)) {
    return Error(ErrorCode::InvalidFileType, "Failed to read file contents",
                 "stream did not contain valid UTF-8")
        .at(path.string());
  }

  PLOG_DEBUG << "Read " << text.size() << " bytes from " << path.string();
  return text;
}

// ============================================================================
// Writing
// ============================================================================

Result<void> write_text_file(const fs::path &path, std::string_view text) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    return Error(ErrorCode::FileCreateError,
                 "Failed to create the output file", std::strerror(errno))
        .at(path.string());
  }

  file.write(text.data(), static_cast<std::streamsize>(text.size()));
  file.flush();
  if (!file) {
    return Error(ErrorCode::FileWriteError,
                 "Failed to write to the output file", std::strerror(errno))
        .at(path.string());
  }

  return Result<void>::ok();
}

// ============================================================================
// Output Naming
// ============================================================================

fs::path derive_output_path(const fs::path &input) {
  const std::string &native = input.native();
  const auto dot = native.find(OUTPUT_BASE_DELIMITER);

  std::string base = native.substr(0, dot);
  base += OUTPUT_SUFFIX;
  return fs::path(base);
}

} // namespace textconv
