/**
 * @file error.hpp
 * @brief shapecheck error handling.
 *
 * Decoding failures are never thrown: they travel inside Result as a
 * DecodeError. The codes and exceptions here report misuse of the API,
 * such as building a composite error without children or reading the
 * value of a failed result.
 */

#ifndef SHAPECHECK_ERROR_HPP
#define SHAPECHECK_ERROR_HPP

#include "config.hpp"

#include <stdexcept>
#include <string>

namespace shapecheck {

/**
 * @brief Error codes carried by library exceptions.
 */
enum class Error {
    InvalidArg = -1,    ///< Invalid argument
    BadAccess = -2,     ///< Accessed the wrong alternative of a Result
    InvalidData = -3    ///< Malformed input text
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::BadAccess:
        return "Bad result access";
    case Error::InvalidData:
        return "Invalid or malformed data";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Base exception for shapecheck errors.
 *
 * what() reads "<error_string(code)>: <message>".
 */
class ShapecheckException : public std::runtime_error {
public:
    explicit ShapecheckException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(std::string(error_string(code)) + ": " + message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public ShapecheckException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : ShapecheckException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for reading the value of a failure or the error of a success.
 */
class BadResultAccessException : public ShapecheckException {
public:
    explicit BadResultAccessException(const std::string& message)
        : ShapecheckException(message, Error::BadAccess) {}
};

/**
 * @brief Exception for malformed input text.
 */
class InvalidDataException : public ShapecheckException {
public:
    explicit InvalidDataException(const std::string& message)
        : ShapecheckException(message, Error::InvalidData) {}
};

} // namespace shapecheck

#endif // SHAPECHECK_ERROR_HPP
