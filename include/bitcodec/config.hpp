/**
 * @file config.hpp
 * @brief bitcodec compile-time configuration.
 *
 * Version information, access limits and the sentinel values shared by the
 * bit view, the bit stream and the string codec.
 */

#ifndef BITCODEC_CONFIG_HPP
#define BITCODEC_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace bitcodec {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Widest value a single get_bits/set_bits call can transfer
inline constexpr std::size_t MAX_ACCESS_BITS = 32U;

/// Byte length meaning "from the offset to the end of the buffer"
inline constexpr std::size_t WHOLE_BUFFER = static_cast<std::size_t>(-1);

/// String byte count meaning "null-terminated" rather than fixed length
inline constexpr std::size_t TERMINATED = static_cast<std::size_t>(-1);

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define BITCODEC_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * Constructors then report failure through valid() instead of throwing.
 * @{
 */
#ifndef BITCODEC_NO_EXCEPTIONS
#define BITCODEC_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace bitcodec

#endif // BITCODEC_CONFIG_HPP
