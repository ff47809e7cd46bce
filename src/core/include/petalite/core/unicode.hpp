#pragma once

#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace petalite::unicode {

// Unicode code point type
using CodePoint = char32_t;

constexpr CodePoint REPLACEMENT_CHARACTER = 0xFFFD;
constexpr CodePoint INVALID_CODE_POINT = 0xFFFFFFFF;

[[nodiscard]] constexpr bool is_valid(CodePoint cp) {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

// C0, DEL and C1 controls
[[nodiscard]] constexpr bool is_control(CodePoint cp) {
    return cp < 0x20 || (cp >= 0x7F && cp < 0xA0);
}

// UTF-8 encoding/decoding
struct Utf8DecodeResult {
    CodePoint code_point;
    usize bytes_consumed;
};

[[nodiscard]] Utf8DecodeResult utf8_decode(const char* data, usize length);
[[nodiscard]] usize utf8_encode(CodePoint cp, char* buffer);

// One decoded code point with its byte range in the source string
struct DecodedCodePoint {
    CodePoint code_point;
    u32 byte_offset;
    u32 byte_length;
};

// Decodes the whole string; malformed sequences become REPLACEMENT_CHARACTER
[[nodiscard]] std::vector<DecodedCodePoint> decode_utf8(std::string_view text);

[[nodiscard]] std::string encode_utf8(std::u32string_view code_points);

} // namespace petalite::unicode
