/**
 * @file file_io.h
 * @brief Whole-file text I/O and output path naming
 */

#ifndef TEXTCONV_FILE_IO_H
#define TEXTCONV_FILE_IO_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <filesystem>
#include <string>
#include <string_view>

namespace textconv {

/**
 * @brief Read an entire file as UTF-8 text
 * @param path File to read
 * @return Contents, or FileNotFound / FileReadError / InvalidFileType
 */
TEXTCONV_API Result<std::string>
read_text_file(const std::filesystem::path &path);

/**
 * @brief Create or truncate a file and write all of @p text into it
 *
 * Returns only after the data has been handed to the OS and the stream
 * flushed.
 *
 * @return Success, or FileCreateError / FileWriteError
 */
TEXTCONV_API Result<void> write_text_file(const std::filesystem::path &path,
                                          std::string_view text);

/**
 * @brief Path a file conversion writes its result to
 *
 * Keeps the text of @p input up to, not including, its first '.' and
 * appends OUTPUT_SUFFIX. Directory components are not special:
 *   "notes.txt"      -> "notes_converted.md"
 *   "archive.tar.gz" -> "archive_converted.md"
 *   "README"         -> "README_converted.md"
 */
TEXTCONV_API std::filesystem::path
derive_output_path(const std::filesystem::path &input);

/**
 * @brief Check whether @p text is well-formed UTF-8
 */
TEXTCONV_API bool is_valid_utf8(std::string_view text);

} // namespace textconv

#endif // TEXTCONV_FILE_IO_H
