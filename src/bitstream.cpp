/**
 * @file bitstream.cpp
 * @brief BitStream positioning, typed accessors and bit copying.
 */

#include <bitcodec/bitstream.hpp>
#include <bitcodec/strings.hpp>

namespace bitcodec {

BitStream::BitStream(std::uint8_t* data, std::size_t size, std::size_t byte_offset,
                     std::size_t byte_length)
    : BitStream(std::make_shared<BitView>(data, size, byte_offset, byte_length)) {}

BitStream::BitStream(std::shared_ptr<BitView> view)
    : view_(std::move(view)), start_(0), index_(0), length_(0), valid_(true) {
    if (!view_) {
#if !BITCODEC_NO_EXCEPTIONS
        throw InvalidArgumentException("BitStream: source view is null");
#else
        view_ = std::make_shared<BitView>();
        valid_ = false;
#endif
    }
    length_ = view_->bit_length();
}

Error BitStream::set_index(std::size_t index) noexcept {
    if (index > length()) {
        return Error::OutOfRange;
    }
    index_ = start_ + index;
    return Error::Ok;
}

Error BitStream::set_length(std::size_t length) noexcept {
    std::size_t total = view_->bit_length();
    if (start_ > total || length > total - start_) {
        return Error::OutOfRange;
    }
    if (start_ + length < index_) {
        return Error::OutOfRange;
    }
    length_ = start_ + length;
    return Error::Ok;
}

Error BitStream::set_byte_index(std::size_t byte_index) noexcept {
    if (byte_index > length() / 8) {
        return Error::OutOfRange;
    }
    return set_index(byte_index * 8);
}

Error BitStream::read_bits(std::size_t bits, std::uint32_t& value, bool is_signed) noexcept {
    Error result = view_->get_bits(index_, bits, value, is_signed);
    if (result == Error::Ok) {
        index_ += bits;
    }
    return result;
}

Error BitStream::write_bits(std::uint32_t value, std::size_t bits) noexcept {
    Error result = view_->set_bits(index_, value, bits);
    if (result == Error::Ok) {
        index_ += bits;
    }
    return result;
}

// ============================================================================
// Typed accessors: one entry per primitive, all routed through the view
// ============================================================================

Error BitStream::read_boolean(bool& value) noexcept {
    return read_value(1, &BitView::get_boolean, value);
}

Error BitStream::read_int8(std::int8_t& value) noexcept {
    return read_value(8, &BitView::get_int8, value);
}

Error BitStream::read_int16(std::int16_t& value) noexcept {
    return read_value(16, &BitView::get_int16, value);
}

Error BitStream::read_int32(std::int32_t& value) noexcept {
    return read_value(32, &BitView::get_int32, value);
}

Error BitStream::read_uint8(std::uint8_t& value) noexcept {
    return read_value(8, &BitView::get_uint8, value);
}

Error BitStream::read_uint16(std::uint16_t& value) noexcept {
    return read_value(16, &BitView::get_uint16, value);
}

Error BitStream::read_uint32(std::uint32_t& value) noexcept {
    return read_value(32, &BitView::get_uint32, value);
}

Error BitStream::read_float32(float& value) noexcept {
    return read_value(32, &BitView::get_float32, value);
}

Error BitStream::read_float64(double& value) noexcept {
    return read_value(64, &BitView::get_float64, value);
}

Error BitStream::write_boolean(bool value) noexcept {
    return write_value(1, &BitView::set_boolean, value);
}

Error BitStream::write_int8(std::int8_t value) noexcept {
    return write_value(8, &BitView::set_int8, value);
}

Error BitStream::write_int16(std::int16_t value) noexcept {
    return write_value(16, &BitView::set_int16, value);
}

Error BitStream::write_int32(std::int32_t value) noexcept {
    return write_value(32, &BitView::set_int32, value);
}

Error BitStream::write_uint8(std::uint8_t value) noexcept {
    return write_value(8, &BitView::set_uint8, value);
}

Error BitStream::write_uint16(std::uint16_t value) noexcept {
    return write_value(16, &BitView::set_uint16, value);
}

Error BitStream::write_uint32(std::uint32_t value) noexcept {
    return write_value(32, &BitView::set_uint32, value);
}

Error BitStream::write_float32(float value) noexcept {
    return write_value(32, &BitView::set_float32, value);
}

Error BitStream::write_float64(double value) noexcept {
    return write_value(64, &BitView::set_float64, value);
}

// ============================================================================
// Sub-streams and bulk copies
// ============================================================================

Error BitStream::read_bit_stream(std::size_t bit_length, BitStream& sub) noexcept {
    if (bit_length > bits_left()) {
        return Error::EndOfStream;
    }

    sub = BitStream(view_, index_, index_ + bit_length);
    index_ += bit_length;
    return Error::Ok;
}

Error BitStream::write_bit_stream(BitStream& source) noexcept {
    return write_bit_stream(source, source.bits_left());
}

Error BitStream::write_bit_stream(BitStream& source, std::size_t length) noexcept {
    std::size_t source_total = source.view_->bit_length();
    std::size_t target_total = view_->bit_length();
    if (source.index_ > source_total || length > source_total - source.index_) {
        return Error::OutOfRange;
    }
    if (index_ > target_total || length > target_total - index_) {
        return Error::OutOfRange;
    }

    while (length > 0) {
        std::size_t chunk = (length < MAX_ACCESS_BITS) ? length : MAX_ACCESS_BITS;

        std::uint32_t value = 0;
        Error result = source.read_bits(chunk, value);
        if (result != Error::Ok) {
            return result;
        }
        result = write_bits(value, chunk);
        if (result != Error::Ok) {
            return result;
        }

        length -= chunk;
    }

    return Error::Ok;
}

Error BitStream::read_array_buffer(std::size_t byte_length, std::vector<std::uint8_t>& bytes) {
    if (byte_length > bits_left() / 8) {
        return Error::EndOfStream;
    }

    Error result = view_->get_array_buffer(index_, byte_length, bytes);
    if (result == Error::Ok) {
        index_ += byte_length * 8;
    }
    return result;
}

Error BitStream::write_array_buffer(const std::uint8_t* bytes, std::size_t byte_length) {
    if (byte_length == 0) {
        return Error::Ok;
    }
    if (bytes == nullptr) {
        return Error::InvalidArg;
    }

    // The view needs mutable storage, so stage the caller's bytes
    std::vector<std::uint8_t> staging(bytes, bytes + byte_length);
    BitStream source(staging);
    source.set_big_endian(big_endian());

    return write_bit_stream(source, byte_length * 8);
}

// ============================================================================
// String codec
// ============================================================================

Error BitStream::read_ascii_string(std::string& text, std::size_t bytes) {
    return bitcodec::read_ascii_string(*this, text, bytes);
}

Error BitStream::read_utf8_string(std::u32string& text, std::size_t bytes) {
    return bitcodec::read_utf8_string(*this, text, bytes);
}

Error BitStream::write_ascii_string(const std::string& text, std::size_t bytes) {
    return bitcodec::write_ascii_string(*this, text, bytes);
}

Error BitStream::write_utf8_string(const std::u32string& text, std::size_t bytes) {
    return bitcodec::write_utf8_string(*this, text, bytes);
}

} // namespace bitcodec
