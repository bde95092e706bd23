/**
 * @file bitview.hpp
 * @brief Bit-addressed view over a borrowed byte buffer.
 *
 * BitView reads and writes values of 1 to 32 bits at any bit offset inside
 * a caller-owned buffer. The buffer is never copied; the view only records
 * the byte range it may touch.
 *
 * @par Bit Ordering
 * The endianness flag decides the order of bits both within a byte and
 * across byte boundaries:
 * - Big-endian: the first bit of a span is the MSB of its first byte, and
 *   the most significant bits of the value come from the lowest address.
 * - Little-endian (default): the first bit of a span is the LSB of its
 *   first byte, and the least significant bits of the value come from the
 *   lowest address.
 *
 * The flag may be changed at any time and affects all later accesses.
 */

#ifndef BITCODEC_BITVIEW_HPP
#define BITCODEC_BITVIEW_HPP

#include "config.hpp"
#include "error.hpp"
#include <vector>

namespace bitcodec {

/**
 * @brief Bit-level accessor over a borrowed byte range.
 *
 * The buffer must outlive the view and every stream sharing it. Views do
 * no internal locking.
 */
class BitView {
public:
    /**
     * @brief Construct an empty view (zero addressable bits).
     */
    BitView() noexcept : data_(nullptr), byte_length_(0), big_endian_(false), valid_(true) {}

    /**
     * @brief Construct a view over part of a raw buffer.
     *
     * @param data Start of the caller-owned buffer
     * @param size Size of the buffer in bytes
     * @param byte_offset First byte of the view
     * @param byte_length Bytes in the view, or WHOLE_BUFFER for the rest
     *
     * Throws InvalidArgumentException if the range does not fit the buffer.
     * With BITCODEC_NO_EXCEPTIONS the view is left empty and valid() is false.
     */
    BitView(std::uint8_t* data, std::size_t size, std::size_t byte_offset = 0,
            std::size_t byte_length = WHOLE_BUFFER);

    /**
     * @brief Construct a view over part of a byte vector.
     *
     * The vector must not be resized while the view is alive.
     */
    explicit BitView(std::vector<std::uint8_t>& buffer, std::size_t byte_offset = 0,
                     std::size_t byte_length = WHOLE_BUFFER)
        : BitView(buffer.data(), buffer.size(), byte_offset, byte_length) {}

    /**
     * @brief Whether construction succeeded.
     */
    [[nodiscard]] bool valid() const noexcept { return valid_; }

    /**
     * @brief First byte of the viewed range.
     */
    [[nodiscard]] std::uint8_t* data() const noexcept { return data_; }

    [[nodiscard]] std::size_t byte_length() const noexcept { return byte_length_; }

    [[nodiscard]] std::size_t bit_length() const noexcept { return byte_length_ * 8; }

    [[nodiscard]] bool big_endian() const noexcept { return big_endian_; }

    void set_big_endian(bool big_endian) noexcept { big_endian_ = big_endian; }

    /**
     * @brief Read an integer of up to 32 bits.
     *
     * @param offset Bit offset of the first bit
     * @param bits Width in bits (0-32)
     * @param[out] value Unsigned bit pattern, sign-extended to 32 bits when
     *             is_signed is set
     * @param is_signed Treat bit (bits - 1) as a sign bit
     * @return Error::Ok, Error::InvalidArg if bits > 32, or
     *         Error::OutOfRange if the span leaves the view
     */
    Error get_bits(std::size_t offset, std::size_t bits, std::uint32_t& value,
                   bool is_signed = false) const noexcept;

    /**
     * @brief Write the low bits of a value.
     *
     * @param offset Bit offset of the first bit
     * @param value Value to store (bits above the width are ignored)
     * @param bits Width in bits (0-32)
     * @return Error::Ok, Error::InvalidArg or Error::OutOfRange. The buffer
     *         is unchanged on failure.
     */
    Error set_bits(std::size_t offset, std::uint32_t value, std::size_t bits) noexcept;

    Error get_boolean(std::size_t offset, bool& value) const noexcept {
        std::uint32_t raw = 0;
        Error result = get_bits(offset, 1, raw);
        if (result == Error::Ok) {
            value = raw != 0;
        }
        return result;
    }

    Error get_int8(std::size_t offset, std::int8_t& value) const noexcept {
        return get_signed(offset, 8, value);
    }

    Error get_int16(std::size_t offset, std::int16_t& value) const noexcept {
        return get_signed(offset, 16, value);
    }

    Error get_int32(std::size_t offset, std::int32_t& value) const noexcept {
        return get_signed(offset, 32, value);
    }

    Error get_uint8(std::size_t offset, std::uint8_t& value) const noexcept {
        return get_unsigned(offset, 8, value);
    }

    Error get_uint16(std::size_t offset, std::uint16_t& value) const noexcept {
        return get_unsigned(offset, 16, value);
    }

    Error get_uint32(std::size_t offset, std::uint32_t& value) const noexcept {
        return get_bits(offset, 32, value);
    }

    /**
     * @brief Read 32 bits and reinterpret them as an IEEE-754 single.
     */
    Error get_float32(std::size_t offset, float& value) const noexcept;

    /**
     * @brief Read two 32-bit words (high word first) and reinterpret them
     * as an IEEE-754 double.
     */
    Error get_float64(std::size_t offset, double& value) const noexcept;

    Error set_boolean(std::size_t offset, bool value) noexcept {
        return set_bits(offset, value ? 1U : 0U, 1);
    }

    Error set_int8(std::size_t offset, std::int8_t value) noexcept {
        return set_bits(offset, static_cast<std::uint32_t>(value), 8);
    }

    Error set_int16(std::size_t offset, std::int16_t value) noexcept {
        return set_bits(offset, static_cast<std::uint32_t>(value), 16);
    }

    Error set_int32(std::size_t offset, std::int32_t value) noexcept {
        return set_bits(offset, static_cast<std::uint32_t>(value), 32);
    }

    Error set_uint8(std::size_t offset, std::uint8_t value) noexcept {
        return set_bits(offset, value, 8);
    }

    Error set_uint16(std::size_t offset, std::uint16_t value) noexcept {
        return set_bits(offset, value, 16);
    }

    Error set_uint32(std::size_t offset, std::uint32_t value) noexcept {
        return set_bits(offset, value, 32);
    }

    Error set_float32(std::size_t offset, float value) noexcept;

    /**
     * @brief Store a double as two 32-bit words, high word at offset and
     * low word at offset + 32.
     */
    Error set_float64(std::size_t offset, double value) noexcept;

    /**
     * @brief Copy bytes out of the view into a new buffer.
     *
     * Each byte is assembled with a single 8-bit read, so unaligned offsets
     * and the current endianness are honored.
     *
     * @param offset Bit offset of the first byte
     * @param byte_length Number of bytes to copy
     * @param[out] bytes Receives the copy (replaced, never a view)
     * @return Error::Ok or Error::OutOfRange
     */
    Error get_array_buffer(std::size_t offset, std::size_t byte_length,
                           std::vector<std::uint8_t>& bytes) const;

private:
    std::uint8_t* data_;
    std::size_t byte_length_;
    bool big_endian_;
    bool valid_;

    /**
     * @brief Check that [offset, offset + bits) lies inside the view.
     */
    [[nodiscard]] Error check_range(std::size_t offset, std::size_t bits) const noexcept {
        std::size_t total = bit_length();
        if (offset > total || bits > total - offset) {
            return Error::OutOfRange;
        }
        return Error::Ok;
    }

    template <typename T>
    Error get_signed(std::size_t offset, std::size_t bits, T& value) const noexcept {
        std::uint32_t raw = 0;
        Error result = get_bits(offset, bits, raw, true);
        if (result == Error::Ok) {
            value = static_cast<T>(static_cast<std::int32_t>(raw));
        }
        return result;
    }

    template <typename T>
    Error get_unsigned(std::size_t offset, std::size_t bits, T& value) const noexcept {
        std::uint32_t raw = 0;
        Error result = get_bits(offset, bits, raw);
        if (result == Error::Ok) {
            value = static_cast<T>(raw);
        }
        return result;
    }
};

} // namespace bitcodec

#endif // BITCODEC_BITVIEW_HPP
