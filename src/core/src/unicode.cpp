#include "petalite/core/unicode.hpp"

namespace petalite::unicode {

Utf8DecodeResult utf8_decode(const char* data, usize length) {
    if (length == 0 || data == nullptr) {
        return {INVALID_CODE_POINT, 0};
    }

    auto byte = static_cast<u8>(data[0]);

    // Single byte (ASCII)
    if ((byte & 0x80) == 0) {
        return {static_cast<CodePoint>(byte), 1};
    }

    usize seq_len;
    CodePoint cp;

    if ((byte & 0xE0) == 0xC0) {
        seq_len = 2;
        cp = byte & 0x1F;
    } else if ((byte & 0xF0) == 0xE0) {
        seq_len = 3;
        cp = byte & 0x0F;
    } else if ((byte & 0xF8) == 0xF0) {
        seq_len = 4;
        cp = byte & 0x07;
    } else {
        // Invalid leading byte
        return {REPLACEMENT_CHARACTER, 1};
    }

    if (length < seq_len) {
        return {REPLACEMENT_CHARACTER, length};
    }

    for (usize i = 1; i < seq_len; ++i) {
        byte = static_cast<u8>(data[i]);
        if ((byte & 0xC0) != 0x80) {
            return {REPLACEMENT_CHARACTER, i};
        }
        cp = (cp << 6) | (byte & 0x3F);
    }

    if (!is_valid(cp)) {
        return {REPLACEMENT_CHARACTER, seq_len};
    }

    // Overlong encodings
    if ((seq_len == 2 && cp < 0x80) ||
        (seq_len == 3 && cp < 0x800) ||
        (seq_len == 4 && cp < 0x10000)) {
        return {REPLACEMENT_CHARACTER, seq_len};
    }

    return {cp, seq_len};
}

usize utf8_encode(CodePoint cp, char* buffer) {
    if (cp < 0x80) {
        buffer[0] = static_cast<char>(cp);
        return 1;
    }
    if (cp < 0x800) {
        buffer[0] = static_cast<char>(0xC0 | (cp >> 6));
        buffer[1] = static_cast<char>(0x80 | (cp & 0x3F));
        return 2;
    }
    if (cp < 0x10000) {
        buffer[0] = static_cast<char>(0xE0 | (cp >> 12));
        buffer[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buffer[2] = static_cast<char>(0x80 | (cp & 0x3F));
        return 3;
    }
    if (cp <= 0x10FFFF) {
        buffer[0] = static_cast<char>(0xF0 | (cp >> 18));
        buffer[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        buffer[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buffer[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }
    return 0;
}

std::vector<DecodedCodePoint> decode_utf8(std::string_view text) {
    std::vector<DecodedCodePoint> out;
    out.reserve(text.size());

    usize offset = 0;
    while (offset < text.size()) {
        auto decoded = utf8_decode(text.data() + offset, text.size() - offset);
        usize consumed = decoded.bytes_consumed == 0 ? 1 : decoded.bytes_consumed;
        out.push_back({decoded.code_point,
                       static_cast<u32>(offset),
                       static_cast<u32>(consumed)});
        offset += consumed;
    }
    return out;
}

std::string encode_utf8(std::u32string_view code_points) {
    std::string out;
    out.reserve(code_points.size());
    char buffer[4];
    for (CodePoint cp : code_points) {
        usize n = utf8_encode(cp, buffer);
        if (n == 0) {
            n = utf8_encode(REPLACEMENT_CHARACTER, buffer);
        }
        out.append(buffer, n);
    }
    return out;
}

} // namespace petalite::unicode
