/**
 * @file errors.hpp
 * @brief Exception types thrown by the odmeta library.
 */

#ifndef ODMETA_ERRORS_HPP
#define ODMETA_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace odmeta {

/**
 * @brief Base class of every error raised by odmeta.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A file or archive could not be read or written.
 */
class IoError final : public Error {
public:
    using Error::Error;
};

/**
 * @brief An XML document is malformed.
 */
class ParseError final : public Error {
public:
    using Error::Error;
};

/**
 * @brief The document lacks an element an operation depends on
 * (the office:meta container, or meta.xml itself).
 */
class StructuralError final : public Error {
public:
    using Error::Error;
};

} // namespace odmeta

#endif // ODMETA_ERRORS_HPP
