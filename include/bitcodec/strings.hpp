/**
 * @file strings.hpp
 * @brief ASCII and UTF-8 string codec on top of BitStream.
 *
 * Strings are stored either null-terminated (bytes == TERMINATED) or in a
 * fixed number of bytes.
 *
 * @par Reading
 * - Terminated: bytes are read until a 0x00 (consumed, not returned) or
 *   until fewer than 8 bits remain in the window.
 * - Fixed: exactly @c bytes bytes are consumed. Characters after the first
 *   0x00 are dropped but still consumed.
 *
 * @par Writing
 * - Terminated: the encoded bytes followed by one 0x00.
 * - Fixed: exactly @c bytes bytes, zero-padded, or silently truncated when
 *   the encoded text is longer.
 *
 * ASCII text is a std::string with one byte per character. Unicode text is
 * a std::u32string with one code point per element.
 */

#ifndef BITCODEC_STRINGS_HPP
#define BITCODEC_STRINGS_HPP

#include "bitstream.hpp"
#include "config.hpp"
#include "error.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace bitcodec {

/**
 * @brief Encode code points as UTF-8.
 *
 * Code points up to 7 bits take 1 byte, up to 11 bits 2 bytes, up to
 * 16 bits 3 bytes and the rest 4 bytes.
 *
 * @param text Code points to encode
 * @param[out] bytes Receives the encoded bytes (replaced)
 * @return Error::Ok, or Error::InvalidArg for a surrogate or a code point
 *         above U+10FFFF
 */
Error encode_utf8(std::u32string_view text, std::vector<std::uint8_t>& bytes);

/**
 * @brief Strictly decode UTF-8.
 *
 * Overlong forms, surrogates, code points above U+10FFFF, stray
 * continuation bytes and truncated sequences are rejected.
 *
 * @param bytes Encoded bytes
 * @param size Number of bytes
 * @param[out] text Receives the code points (unchanged on failure)
 * @return Error::Ok or Error::InvalidArg
 */
Error decode_utf8(const std::uint8_t* bytes, std::size_t size, std::u32string& text);

/**
 * @brief Read an ASCII string.
 *
 * @param stream Stream positioned at the string
 * @param[out] text Receives the characters
 * @param bytes Fixed byte count, or TERMINATED
 * @return Error::Ok, or Error::EndOfStream if a fixed length does not fit
 *         the window (nothing is consumed)
 */
Error read_ascii_string(BitStream& stream, std::string& text, std::size_t bytes = TERMINATED);

/**
 * @brief Read a UTF-8 string.
 *
 * Malformed input is not an error: each raw byte is returned as one code
 * point instead.
 */
Error read_utf8_string(BitStream& stream, std::u32string& text, std::size_t bytes = TERMINATED);

/**
 * @brief Write an ASCII string.
 *
 * @return Error::Ok, or Error::OutOfRange if the view is too short
 *         (nothing is written)
 */
Error write_ascii_string(BitStream& stream, const std::string& text,
                         std::size_t bytes = TERMINATED);

/**
 * @brief Write a UTF-8 string.
 *
 * @return Error::Ok, Error::InvalidArg if the text cannot be encoded, or
 *         Error::OutOfRange if the view is too short
 */
Error write_utf8_string(BitStream& stream, const std::u32string& text,
                        std::size_t bytes = TERMINATED);

} // namespace bitcodec

#endif // BITCODEC_STRINGS_HPP
