/**
 * @file errors.hpp
 * @brief Exception types raised by the timeuuid core library.
 *
 * All errors derive from UuidError, which is a std::runtime_error, so callers
 * that only care about "something went wrong" can catch std::exception.
 *
 * @copyright Copyright (c) 2024 timeuuid Contributors
 * @license MIT License
 */

#pragma once

#include "timeuuid/core/export.hpp"

#include <stdexcept>
#include <string>

namespace timeuuid {
namespace core {

/**
 * @class UuidError
 * @brief Root of the timeuuid error hierarchy.
 */
class TIMEUUID_CORE_API UuidError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class InvalidFormatError
 * @brief An unknown format token was requested.
 */
class TIMEUUID_CORE_API InvalidFormatError : public UuidError {
public:
    explicit InvalidFormatError(const std::string& format)
        : UuidError("invalid UUID format :" + format)
        , format_(format)
    {}

    /// The offending token.
    const std::string& format() const noexcept { return format_; }

private:
    std::string format_;
};

/**
 * @class InvalidInputError
 * @brief A value does not have the shape of its declared format.
 */
class TIMEUUID_CORE_API InvalidInputError : public UuidError {
public:
    using UuidError::UuidError;
};

/**
 * @class InvalidEncodingError
 * @brief Text that is not a valid base-62 number.
 */
class TIMEUUID_CORE_API InvalidEncodingError : public InvalidInputError {
public:
    using InvalidInputError::InvalidInputError;
};

/**
 * @class NoopTranslationError
 * @brief translate() was asked to convert a format into itself.
 */
class TIMEUUID_CORE_API NoopTranslationError : public UuidError {
public:
    explicit NoopTranslationError(const std::string& format)
        : UuidError("refusing to translate " + format + " into itself")
    {}
};

/**
 * @class NodeIdentityUnavailableError
 * @brief No node identifier could be determined. Fatal for a new generator.
 */
class TIMEUUID_CORE_API NodeIdentityUnavailableError : public UuidError {
public:
    using UuidError::UuidError;
};

/**
 * @class PersistenceUnavailableError
 * @brief The state file cannot be opened, locked, read or written.
 */
class TIMEUUID_CORE_API PersistenceUnavailableError : public UuidError {
public:
    using UuidError::UuidError;
};

}  // namespace core
}  // namespace timeuuid
