/**
 * @file converters.cpp
 * @brief Stock converter implementations
 *
 * Code point handling uses utf8proc; byte encodings use libsodium.
 */

#include "textconv/converters.h"
#include <sodium.h>
#include <utf8proc.h>
#include <vector>

namespace textconv {

namespace {

/// Length of the code point at @p pos, or 1 for an invalid byte
utf8proc_ssize_t next_unit(const utf8proc_uint8_t *str, utf8proc_ssize_t len,
                           utf8proc_ssize_t pos, utf8proc_int32_t *codepoint) {
  utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, codepoint);
  if (bytes <= 0) {
    *codepoint = -1;
    return 1;
  }
  return bytes;
}

template <typename Mapping>
std::string map_code_points(std::string_view input, Mapping mapping) {
  const auto *str = reinterpret_cast<const utf8proc_uint8_t *>(input.data());
  const auto len = static_cast<utf8proc_ssize_t>(input.size());

  std::string result;
  result.reserve(input.size());

  utf8proc_ssize_t pos = 0;
  while (pos < len) {
    utf8proc_int32_t codepoint;
    utf8proc_ssize_t bytes = next_unit(str, len, pos, &codepoint);

    if (codepoint < 0) {
      result.push_back(input[static_cast<size_t>(pos)]);
    } else {
      utf8proc_uint8_t buffer[4];
      utf8proc_ssize_t written = utf8proc_encode_char(mapping(codepoint), buffer);
      result.append(reinterpret_cast<const char *>(buffer),
                    static_cast<size_t>(written));
    }
    pos += bytes;
  }
  return result;
}

} // namespace

// ============================================================================
// ReverseText
// ============================================================================

std::string ReverseText::convert(std::string_view input) const {
  const auto *str = reinterpret_cast<const utf8proc_uint8_t *>(input.data());
  const auto len = static_cast<utf8proc_ssize_t>(input.size());

  std::vector<std::string_view> units;
  units.reserve(input.size());

  utf8proc_ssize_t pos = 0;
  while (pos < len) {
    utf8proc_int32_t codepoint;
    utf8proc_ssize_t bytes = next_unit(str, len, pos, &codepoint);
    units.push_back(
        input.substr(static_cast<size_t>(pos), static_cast<size_t>(bytes)));
    pos += bytes;
  }

  std::string result;
  result.reserve(input.size());
  for (auto it = units.rbegin(); it != units.rend(); ++it) {
    result.append(it->data(), it->size());
  }
  return result;
}

// ============================================================================
// Case Mapping
// ============================================================================

std::string UppercaseText::convert(std::string_view input) const {
  return map_code_points(input, utf8proc_toupper);
}

std::string LowercaseText::convert(std::string_view input) const {
  return map_code_points(input, utf8proc_tolower);
}

// ============================================================================
// Byte Encodings
// ============================================================================

std::string Base64Text::convert(std::string_view input) const {
  if (input.empty()) {
    return std::string();
  }

  const int variant = sodium_base64_VARIANT_ORIGINAL;
  const size_t encoded_len = sodium_base64_encoded_len(input.size(), variant);

  std::string result(encoded_len, '\0');
  sodium_bin2base64(&result[0], encoded_len,
                    reinterpret_cast<const unsigned char *>(input.data()),
                    input.size(), variant);
  result.resize(encoded_len - 1); // drop the terminator
  return result;
}

std::string HexText::convert(std::string_view input) const {
  if (input.empty()) {
    return std::string();
  }

  const size_t hex_len = input.size() * 2 + 1;

  std::string result(hex_len, '\0');
  sodium_bin2hex(&result[0], hex_len,
                 reinterpret_cast<const unsigned char *>(input.data()),
                 input.size());
  result.resize(hex_len - 1);
  return result;
}

} // namespace textconv
