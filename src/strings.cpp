/**
 * @file strings.cpp
 * @brief ASCII and UTF-8 string encoding over BitStream.
 */

#include <bitcodec/strings.hpp>

namespace bitcodec {

namespace {

constexpr char32_t MAX_CODE_POINT = 0x10FFFFU;

inline bool is_surrogate(char32_t cp) noexcept {
    return cp >= 0xD800U && cp <= 0xDFFFU;
}

/**
 * @brief Read the raw bytes of a string.
 *
 * Fixed-length reads consume all @p bytes even past a 0x00, which only
 * stops bytes from being kept.
 */
Error read_raw(BitStream& stream, std::size_t bytes, std::vector<std::uint8_t>& raw) {
    raw.clear();

    if (bytes == TERMINATED) {
        while (stream.bits_left() >= 8) {
            std::uint8_t c = 0;
            Error result = stream.read_uint8(c);
            if (result != Error::Ok) {
                return result;
            }
            if (c == 0x00) {
                break;
            }
            raw.push_back(c);
        }
        return Error::Ok;
    }

    if (bytes > stream.bits_left() / 8) {
        return Error::EndOfStream;
    }

    bool append = true;
    for (std::size_t i = 0; i < bytes; ++i) {
        std::uint8_t c = 0;
        Error result = stream.read_uint8(c);
        if (result != Error::Ok) {
            return result;
        }
        if (c == 0x00) {
            append = false;
        }
        if (append) {
            raw.push_back(c);
        }
    }

    return Error::Ok;
}

/**
 * @brief Write encoded bytes, terminated or padded/truncated to a fixed size.
 */
Error write_raw(BitStream& stream, const std::vector<std::uint8_t>& encoded, std::size_t bytes) {
    std::size_t total = (bytes == TERMINATED) ? encoded.size() + 1 : bytes;
    if (total == 0) {
        return Error::Ok;
    }

    std::vector<std::uint8_t> out(total, 0x00);
    std::size_t copied = (encoded.size() < total) ? encoded.size() : total;
    for (std::size_t i = 0; i < copied; ++i) {
        out[i] = encoded[i];
    }

    // Single bulk write keeps the operation all-or-nothing
    return stream.write_array_buffer(out);
}

} // namespace

Error encode_utf8(std::u32string_view text, std::vector<std::uint8_t>& bytes) {
    std::vector<std::uint8_t> out;
    out.reserve(text.size());

    for (char32_t cp : text) {
        if (cp > MAX_CODE_POINT || is_surrogate(cp)) {
            return Error::InvalidArg;
        }

        if (cp <= 0x7FU) {
            // 0xxxxxxx
            out.push_back(static_cast<std::uint8_t>(cp));
        } else if (cp <= 0x7FFU) {
            // 110xxxxx 10xxxxxx
            out.push_back(static_cast<std::uint8_t>(0xC0U | (cp >> 6)));
            out.push_back(static_cast<std::uint8_t>(0x80U | (cp & 0x3FU)));
        } else if (cp <= 0xFFFFU) {
            // 1110xxxx 10xxxxxx 10xxxxxx
            out.push_back(static_cast<std::uint8_t>(0xE0U | (cp >> 12)));
            out.push_back(static_cast<std::uint8_t>(0x80U | ((cp >> 6) & 0x3FU)));
            out.push_back(static_cast<std::uint8_t>(0x80U | (cp & 0x3FU)));
        } else {
            // 11110xxx 10xxxxxx 10xxxxxx 10xxxxxx
            out.push_back(static_cast<std::uint8_t>(0xF0U | (cp >> 18)));
            out.push_back(static_cast<std::uint8_t>(0x80U | ((cp >> 12) & 0x3FU)));
            out.push_back(static_cast<std::uint8_t>(0x80U | ((cp >> 6) & 0x3FU)));
            out.push_back(static_cast<std::uint8_t>(0x80U | (cp & 0x3FU)));
        }
    }

    bytes.swap(out);
    return Error::Ok;
}

Error decode_utf8(const std::uint8_t* bytes, std::size_t size, std::u32string& text) {
    std::u32string out;
    out.reserve(size);

    std::size_t i = 0;
    while (i < size) {
        std::uint8_t lead = bytes[i];
        std::size_t count;
        char32_t cp;
        char32_t min_cp;

        if (lead < 0x80U) {
            count = 1;
            cp = lead;
            min_cp = 0;
        } else if ((lead & 0xE0U) == 0xC0U) {
            count = 2;
            cp = lead & 0x1FU;
            min_cp = 0x80U;
        } else if ((lead & 0xF0U) == 0xE0U) {
            count = 3;
            cp = lead & 0x0FU;
            min_cp = 0x800U;
        } else if ((lead & 0xF8U) == 0xF0U) {
            count = 4;
            cp = lead & 0x07U;
            min_cp = 0x10000U;
        } else {
            return Error::InvalidArg; // stray continuation or invalid lead
        }

        if (count > size - i) {
            return Error::InvalidArg; // truncated sequence
        }

        for (std::size_t k = 1; k < count; ++k) {
            std::uint8_t next = bytes[i + k];
            if ((next & 0xC0U) != 0x80U) {
                return Error::InvalidArg;
            }
            cp = (cp << 6) | (next & 0x3FU);
        }

        if (cp < min_cp || cp > MAX_CODE_POINT || is_surrogate(cp)) {
            return Error::InvalidArg;
        }

        out.push_back(cp);
        i += count;
    }

    text.swap(out);
    return Error::Ok;
}

Error read_ascii_string(BitStream& stream, std::string& text, std::size_t bytes) {
    std::vector<std::uint8_t> raw;
    Error result = read_raw(stream, bytes, raw);
    if (result != Error::Ok) {
        return result;
    }

    text.assign(raw.begin(), raw.end());
    return Error::Ok;
}

Error read_utf8_string(BitStream& stream, std::u32string& text, std::size_t bytes) {
    std::vector<std::uint8_t> raw;
    Error result = read_raw(stream, bytes, raw);
    if (result != Error::Ok) {
        return result;
    }

    if (decode_utf8(raw.data(), raw.size(), text) != Error::Ok) {
        // Malformed input degrades to one code point per raw byte
        text.assign(raw.begin(), raw.end());
    }
    return Error::Ok;
}

Error write_ascii_string(BitStream& stream, const std::string& text, std::size_t bytes) {
    std::vector<std::uint8_t> encoded(text.begin(), text.end());
    return write_raw(stream, encoded, bytes);
}

Error write_utf8_string(BitStream& stream, const std::u32string& text, std::size_t bytes) {
    std::vector<std::uint8_t> encoded;
    Error result = encode_utf8(text, encoded);
    if (result != Error::Ok) {
        return result;
    }
    return write_raw(stream, encoded, bytes);
}

} // namespace bitcodec
