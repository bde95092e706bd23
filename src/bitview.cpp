/**
 * @file bitview.cpp
 * @brief BitView bit packing and float reinterpretation.
 *
 * Values are transferred one backing byte at a time. Each step takes the
 * bit position inside the current byte (offset & 7) and moves as many bits
 * as that byte can supply, min(remaining, 8 - bit_offset).
 *
 * @see include/bitcodec/bitview.hpp for the bit ordering rules
 */

#include <bitcodec/bitview.hpp>

#include <cstring>

namespace bitcodec {

BitView::BitView(std::uint8_t* data, std::size_t size, std::size_t byte_offset,
                 std::size_t byte_length)
    : data_(nullptr), byte_length_(0), big_endian_(false), valid_(false) {
    if (byte_length == WHOLE_BUFFER) {
        byte_length = (byte_offset <= size) ? (size - byte_offset) : 0;
    }

    bool fits = (byte_offset <= size) && (byte_length <= size - byte_offset);
    bool has_storage = (data != nullptr) || (size == 0);
    if (!fits || !has_storage) {
#if !BITCODEC_NO_EXCEPTIONS
        throw InvalidArgumentException("BitView: byte range does not fit the source buffer");
#else
        return;
#endif
    }

    data_ = (data != nullptr) ? data + byte_offset : nullptr;
    byte_length_ = byte_length;
    valid_ = true;
}

Error BitView::get_bits(std::size_t offset, std::size_t bits, std::uint32_t& value,
                        bool is_signed) const noexcept {
    if (bits > MAX_ACCESS_BITS) {
        return Error::InvalidArg;
    }
    Error status = check_range(offset, bits);
    if (status != Error::Ok) {
        return status;
    }

    std::uint32_t result = 0;
    std::size_t i = 0;

    while (i < bits) {
        std::size_t remaining = bits - i;
        std::size_t bit_offset = offset & 7;    // offset % 8
        std::uint32_t current = data_[offset >> 3];

        // Bits obtainable from the current byte
        std::size_t read = (remaining < 8 - bit_offset) ? remaining : (8 - bit_offset);
        std::uint32_t mask = (1U << read) - 1U;

        if (big_endian_) {
            // MSB-first: earlier bits are more significant
            std::uint32_t chunk = (current >> (8 - read - bit_offset)) & mask;
            result = (result << read) | chunk;
        } else {
            // LSB-first: earlier bits are less significant
            std::uint32_t chunk = (current >> bit_offset) & mask;
            result |= chunk << i;
        }

        offset += read;
        i += read;
    }

    if (is_signed && bits > 0 && bits < 32) {
        // Extend the imaginary sign bit of a narrow value to 32 bits
        if ((result & (1U << (bits - 1))) != 0) {
            result |= ~((1U << bits) - 1U);
        }
    }

    value = result;
    return Error::Ok;
}

Error BitView::set_bits(std::size_t offset, std::uint32_t value, std::size_t bits) noexcept {
    if (bits > MAX_ACCESS_BITS) {
        return Error::InvalidArg;
    }
    Error status = check_range(offset, bits);
    if (status != Error::Ok) {
        return status;
    }

    std::size_t i = 0;

    while (i < bits) {
        std::size_t remaining = bits - i;
        std::size_t bit_offset = offset & 7;
        std::uint8_t& target = data_[offset >> 3];

        std::size_t wrote = (remaining < 8 - bit_offset) ? remaining : (8 - bit_offset);
        std::uint32_t mask = (1U << wrote) - 1U;

        std::uint32_t chunk;
        std::size_t dest_shift;
        if (big_endian_) {
            // Take the most significant unwritten bits first
            chunk = (value >> (bits - i - wrote)) & mask;
            dest_shift = 8 - bit_offset - wrote;
        } else {
            chunk = value & mask;
            value >>= wrote;
            dest_shift = bit_offset;
        }

        // Clear the destination bits, then merge the chunk in
        std::uint32_t dest_mask = ~(mask << dest_shift);
        target = static_cast<std::uint8_t>((target & dest_mask) | (chunk << dest_shift));

        offset += wrote;
        i += wrote;
    }

    return Error::Ok;
}

Error BitView::get_float32(std::size_t offset, float& value) const noexcept {
    std::uint32_t raw = 0;
    Error result = get_bits(offset, 32, raw);
    if (result != Error::Ok) {
        return result;
    }

    static_assert(sizeof(float) == sizeof(std::uint32_t), "IEEE-754 single required");
    std::memcpy(&value, &raw, sizeof(value));
    return Error::Ok;
}

Error BitView::get_float64(std::size_t offset, double& value) const noexcept {
    Error status = check_range(offset, 64);
    if (status != Error::Ok) {
        return status;
    }

    std::uint32_t high = 0;
    std::uint32_t low = 0;
    Error result = get_bits(offset, 32, high);
    if (result == Error::Ok) {
        result = get_bits(offset + 32, 32, low);
    }
    if (result != Error::Ok) {
        return result;
    }

    static_assert(sizeof(double) == sizeof(std::uint64_t), "IEEE-754 double required");
    std::uint64_t scratch = (static_cast<std::uint64_t>(high) << 32) | low;
    std::memcpy(&value, &scratch, sizeof(value));
    return Error::Ok;
}

Error BitView::set_float32(std::size_t offset, float value) noexcept {
    std::uint32_t raw = 0;
    std::memcpy(&raw, &value, sizeof(raw));
    return set_bits(offset, raw, 32);
}

Error BitView::set_float64(std::size_t offset, double value) noexcept {
    // Validate the whole span so a failure cannot leave half a double behind
    Error status = check_range(offset, 64);
    if (status != Error::Ok) {
        return status;
    }

    std::uint64_t scratch = 0;
    std::memcpy(&scratch, &value, sizeof(scratch));

    Error result = set_bits(offset, static_cast<std::uint32_t>(scratch >> 32), 32);
    if (result != Error::Ok) {
        return result;
    }
    return set_bits(offset + 32, static_cast<std::uint32_t>(scratch & 0xFFFFFFFFU), 32);
}

Error BitView::get_array_buffer(std::size_t offset, std::size_t byte_length,
                                std::vector<std::uint8_t>& bytes) const {
    if (byte_length > bit_length() / 8) {
        return Error::OutOfRange;
    }
    Error status = check_range(offset, byte_length * 8);
    if (status != Error::Ok) {
        return status;
    }

    std::vector<std::uint8_t> copy(byte_length);
    for (std::size_t i = 0; i < byte_length; ++i) {
        Error result = get_uint8(offset + (i * 8), copy[i]);
        if (result != Error::Ok) {
            return result;
        }
    }

    bytes.swap(copy);
    return Error::Ok;
}

} // namespace bitcodec
