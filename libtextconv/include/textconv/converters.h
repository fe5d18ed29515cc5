/**
 * @file converters.h
 * @brief Stock text converters
 */

#ifndef TEXTCONV_CONVERTERS_H
#define TEXTCONV_CONVERTERS_H

#include "converter.h"
#include "platform.h"
#include <string>
#include <string_view>

namespace textconv {

/**
 * @brief Reverses the order of code points
 *
 * Bytes that are not part of a valid UTF-8 sequence are moved as
 * single units. Applying it twice gives back the input.
 */
class TEXTCONV_API ReverseText : public TextConverter {
public:
  std::string convert(std::string_view input) const override;
};

/**
 * @brief Unicode simple upper-case mapping
 *
 * Invalid UTF-8 bytes are copied through unchanged.
 */
class TEXTCONV_API UppercaseText : public TextConverter {
public:
  std::string convert(std::string_view input) const override;
};

/**
 * @brief Unicode simple lower-case mapping
 *
 * Invalid UTF-8 bytes are copied through unchanged.
 */
class TEXTCONV_API LowercaseText : public TextConverter {
public:
  std::string convert(std::string_view input) const override;
};

/// Standard padded Base64 of the input bytes; any byte sequence is accepted
class TEXTCONV_API Base64Text : public TextConverter {
public:
  std::string convert(std::string_view input) const override;
};

/// Lowercase hex of the input bytes; any byte sequence is accepted
class TEXTCONV_API HexText : public TextConverter {
public:
  std::string convert(std::string_view input) const override;
};

} // namespace textconv

#endif // TEXTCONV_CONVERTERS_H
