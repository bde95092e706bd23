/**
 * @file bitcodec.hpp
 * @brief Umbrella header for the bitcodec library.
 *
 * Pulls in the bit view, the bit stream and the string codec:
 * - BitView reads and writes 1-32 bit values at any bit offset of a
 *   borrowed buffer, big- or little-endian.
 * - BitStream adds an auto-advancing position, a window and zero-copy
 *   sub-streams.
 * - strings.hpp adds null-terminated and fixed-length ASCII/UTF-8 text.
 *
 * @par Example
 * @code
 * std::vector<std::uint8_t> buffer(16);
 * bitcodec::BitStream stream(buffer);
 * stream.set_big_endian(true);
 * stream.write_bits(5, 3);
 * stream.write_utf8_string(U"€");
 * @endcode
 */

#ifndef BITCODEC_HPP
#define BITCODEC_HPP

#include "bitstream.hpp"
#include "bitview.hpp"
#include "config.hpp"
#include "error.hpp"
#include "strings.hpp"

namespace bitcodec {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace bitcodec

#endif // BITCODEC_HPP
