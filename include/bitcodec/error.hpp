/**
 * @file error.hpp
 * @brief bitcodec error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for embedded compatibility (-fno-exceptions). Every accessor returns an
 * Error; only constructors, which cannot return one, throw.
 */

#ifndef BITCODEC_ERROR_HPP
#define BITCODEC_ERROR_HPP

#include "config.hpp"

#if !BITCODEC_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace bitcodec {

/**
 * @brief Error codes returned by all fallible operations.
 *
 * A failing operation leaves the buffer and the stream position untouched.
 */
enum class Error {
    Ok = 0,          ///< Success
    InvalidArg = -1, ///< Invalid argument or construction source
    OutOfRange = -2, ///< Bit span exceeds the view's addressable bits
    EndOfStream = -3 ///< Read would cross the stream's window end
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::OutOfRange:
        return "Bit range out of bounds";
    case Error::EndOfStream:
        return "Read past the end of the stream";
    default:
        return "Unknown error";
    }
}

#if !BITCODEC_NO_EXCEPTIONS

/**
 * @brief Base exception for bitcodec errors.
 */
class BitcodecException : public std::runtime_error {
public:
    explicit BitcodecException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments and construction sources.
 */
class InvalidArgumentException : public BitcodecException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : BitcodecException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for out-of-bounds bit access.
 */
class OutOfRangeException : public BitcodecException {
public:
    explicit OutOfRangeException(const std::string& message)
        : BitcodecException(message, Error::OutOfRange) {}
};

/**
 * @brief Exception for reads past a stream's window.
 */
class EndOfStreamException : public BitcodecException {
public:
    explicit EndOfStreamException(const std::string& message)
        : BitcodecException(message, Error::EndOfStream) {}
};

/**
 * @brief Throw the exception matching a non-Ok error code.
 *
 * @param error Error code returned by an accessor
 * @param what Context prepended to the message
 */
inline void throw_if_error(Error error, const char* what) {
    if (error == Error::Ok) {
        return;
    }
    std::string message = std::string(what) + ": " + error_string(error);
    switch (error) {
    case Error::OutOfRange:
        throw OutOfRangeException(message);
    case Error::EndOfStream:
        throw EndOfStreamException(message);
    default:
        throw InvalidArgumentException(message);
    }
}

#endif // !BITCODEC_NO_EXCEPTIONS

} // namespace bitcodec

#endif // BITCODEC_ERROR_HPP
