/**
 * @file bitstream.hpp
 * @brief Positioned bit cursor over a shared BitView.
 *
 * A BitStream keeps a read/write position and a window [start, length)
 * into the bit address space of a BitView. Typed reads and writes advance
 * the position by the width of the type. Sub-streams carved out with
 * read_bit_stream() share the same view, so nested fixed-size structures
 * can be parsed without copying.
 *
 * @par Positions
 * index(), length() and byte_index() are relative to the window start.
 * Internally the stream tracks absolute bit offsets into the view.
 *
 * @par Bounds
 * - Reads fail with Error::EndOfStream when they would cross length().
 * - Writes are only checked against the view's capacity and fail with
 *   Error::OutOfRange, so a write may run past the nominal window.
 * - read_bits() and write_bits() are unrestricted pass-throughs that are
 *   checked against the view only.
 */

#ifndef BITCODEC_BITSTREAM_HPP
#define BITCODEC_BITSTREAM_HPP

#include "bitview.hpp"
#include "config.hpp"
#include "error.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace bitcodec {

/**
 * @brief Auto-advancing typed reader/writer over a BitView.
 *
 * Copies of a stream share the view but keep independent positions.
 * Streams are not thread-safe; sharing one view between threads needs
 * external synchronization.
 */
class BitStream {
public:
    /**
     * @brief Construct a stream over an empty view.
     *
     * Useful as the target of read_bit_stream().
     */
    BitStream() : BitStream(std::make_shared<BitView>(), 0, 0) {}

    /**
     * @brief Construct a stream over part of a raw buffer.
     *
     * @param data Start of the caller-owned buffer
     * @param size Size of the buffer in bytes
     * @param byte_offset First byte of the view
     * @param byte_length Bytes in the view, or WHOLE_BUFFER for the rest
     *
     * Throws InvalidArgumentException if the range does not fit the buffer.
     */
    BitStream(std::uint8_t* data, std::size_t size, std::size_t byte_offset = 0,
              std::size_t byte_length = WHOLE_BUFFER);

    /**
     * @brief Construct a stream over part of a byte vector.
     */
    explicit BitStream(std::vector<std::uint8_t>& buffer, std::size_t byte_offset = 0,
                       std::size_t byte_length = WHOLE_BUFFER)
        : BitStream(buffer.data(), buffer.size(), byte_offset, byte_length) {}

    /**
     * @brief Construct a stream sharing an existing view.
     *
     * The window covers the whole view. A null view throws
     * InvalidArgumentException (or yields an invalid, empty stream when
     * exceptions are disabled).
     */
    explicit BitStream(std::shared_ptr<BitView> view);

    /**
     * @brief Whether construction succeeded.
     */
    [[nodiscard]] bool valid() const noexcept { return valid_ && view_->valid(); }

    /**
     * @brief Current position, relative to the window start.
     */
    [[nodiscard]] std::size_t index() const noexcept { return index_ - start_; }

    /**
     * @brief Move the position inside the window.
     * @return Error::OutOfRange if the position lies past length()
     */
    Error set_index(std::size_t index) noexcept;

    /**
     * @brief Window end, relative to the window start.
     */
    [[nodiscard]] std::size_t length() const noexcept { return length_ - start_; }

    /**
     * @brief Shrink or grow the window.
     * @return Error::OutOfRange if the end would pass the view or fall
     *         before the current position
     */
    Error set_length(std::size_t length) noexcept;

    /**
     * @brief Bits left before the window end.
     */
    [[nodiscard]] std::size_t bits_left() const noexcept {
        return (index_ < length_) ? (length_ - index_) : 0;
    }

    /**
     * @brief Position in whole bytes, rounded up.
     */
    [[nodiscard]] std::size_t byte_index() const noexcept { return (index() + 7) / 8; }

    Error set_byte_index(std::size_t byte_index) noexcept;

    [[nodiscard]] const std::shared_ptr<BitView>& view() const noexcept { return view_; }

    [[nodiscard]] std::uint8_t* data() const noexcept { return view_->data(); }

    [[nodiscard]] bool big_endian() const noexcept { return view_->big_endian(); }

    /**
     * @brief Set the endianness of the shared view.
     *
     * Affects every stream sharing the view.
     */
    void set_big_endian(bool big_endian) noexcept { view_->set_big_endian(big_endian); }

    /**
     * @brief Read up to 32 bits at the position and advance.
     *
     * Checked against the view only, not the window.
     */
    Error read_bits(std::size_t bits, std::uint32_t& value, bool is_signed = false) noexcept;

    /**
     * @brief Write up to 32 bits at the position and advance.
     */
    Error write_bits(std::uint32_t value, std::size_t bits) noexcept;

    Error read_boolean(bool& value) noexcept;
    Error read_int8(std::int8_t& value) noexcept;
    Error read_int16(std::int16_t& value) noexcept;
    Error read_int32(std::int32_t& value) noexcept;
    Error read_uint8(std::uint8_t& value) noexcept;
    Error read_uint16(std::uint16_t& value) noexcept;
    Error read_uint32(std::uint32_t& value) noexcept;
    Error read_float32(float& value) noexcept;
    Error read_float64(double& value) noexcept;

    Error write_boolean(bool value) noexcept;
    Error write_int8(std::int8_t value) noexcept;
    Error write_int16(std::int16_t value) noexcept;
    Error write_int32(std::int32_t value) noexcept;
    Error write_uint8(std::uint8_t value) noexcept;
    Error write_uint16(std::uint16_t value) noexcept;
    Error write_uint32(std::uint32_t value) noexcept;
    Error write_float32(float value) noexcept;
    Error write_float64(double value) noexcept;

    /**
     * @brief Carve a sub-stream out of the next bit_length bits.
     *
     * The sub-stream shares this stream's view; its window starts at the
     * current position and spans bit_length bits. This stream advances by
     * bit_length immediately, however much of the sub-stream is consumed.
     *
     * @param bit_length Window size of the sub-stream
     * @param[out] sub Receives the sub-stream
     * @return Error::Ok or Error::EndOfStream
     */
    Error read_bit_stream(std::size_t bit_length, BitStream& sub) noexcept;

    /**
     * @brief Copy every bit left in the source's window to this stream.
     */
    Error write_bit_stream(BitStream& source) noexcept;

    /**
     * @brief Copy bits from the source's position to this stream.
     *
     * Bits move in chunks of at most 32 through read_bits()/write_bits(),
     * each side using its own view's endianness. Both positions advance.
     *
     * @param source Stream to copy from
     * @param length Number of bits to copy
     * @return Error::Ok, or Error::OutOfRange before anything is copied if
     *         either view is too short
     */
    Error write_bit_stream(BitStream& source, std::size_t length) noexcept;

    /**
     * @brief Copy byte_length bytes at the position into a new buffer.
     */
    Error read_array_buffer(std::size_t byte_length, std::vector<std::uint8_t>& bytes);

    /**
     * @brief Write raw bytes at the position.
     *
     * The bytes are wrapped in a temporary stream with this stream's
     * endianness and copied with write_bit_stream().
     */
    Error write_array_buffer(const std::uint8_t* bytes, std::size_t byte_length);

    Error write_array_buffer(const std::vector<std::uint8_t>& bytes) {
        return write_array_buffer(bytes.data(), bytes.size());
    }

    /**
     * @name String codec
     * @see strings.hpp
     * @{
     */
    Error read_ascii_string(std::string& text, std::size_t bytes = TERMINATED);
    Error read_utf8_string(std::u32string& text, std::size_t bytes = TERMINATED);
    Error write_ascii_string(const std::string& text, std::size_t bytes = TERMINATED);
    Error write_utf8_string(const std::u32string& text, std::size_t bytes = TERMINATED);
    /** @} */

private:
    std::shared_ptr<BitView> view_;
    std::size_t start_;  ///< Absolute window start
    std::size_t index_;  ///< Absolute position
    std::size_t length_; ///< Absolute window end
    bool valid_;

    BitStream(std::shared_ptr<BitView> view, std::size_t start, std::size_t end) noexcept
        : view_(std::move(view)), start_(start), index_(start), length_(end), valid_(true) {}

    template <typename T>
    Error read_value(std::size_t bits, Error (BitView::*getter)(std::size_t, T&) const noexcept,
                     T& value) noexcept {
        if (bits > bits_left()) {
            return Error::EndOfStream;
        }
        Error result = ((*view_).*getter)(index_, value);
        if (result == Error::Ok) {
            index_ += bits;
        }
        return result;
    }

    template <typename T>
    Error write_value(std::size_t bits, Error (BitView::*setter)(std::size_t, T) noexcept,
                      T value) noexcept {
        Error result = ((*view_).*setter)(index_, value);
        if (result == Error::Ok) {
            index_ += bits;
        }
        return result;
    }
};

} // namespace bitcodec

#endif // BITCODEC_BITSTREAM_HPP
