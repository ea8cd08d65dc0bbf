#pragma once

#include <stdexcept>
#include <string>

namespace h5cx
{

/** @brief Base class of every error raised by h5cx */
class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** @brief A RecordShape is malformed; raised before any I/O happens */
class InvalidShapeError : public Error
{
public:
    using Error::Error;
};

/** @brief A value's extent disagrees with the declared member dimensions */
class DimensionMismatchError : public Error
{
public:
    using Error::Error;
};

/** @brief A value holds a different primitive or rank than the member */
class ValueTypeError : public Error
{
public:
    using Error::Error;
};

/**
 * @brief A member failed while a whole record was being encoded or decoded.
 *
 * The record operation is abandoned; no partial buffer is handed out. The
 * member's own error is nested and can be recovered with
 * std::rethrow_if_nested.
 */
class EncodingError : public Error
{
public:
    EncodingError(const std::string& member, const std::string& cause)
        : Error("member '" + member + "': " + cause), member_(member)
    {
    }

    explicit EncodingError(const std::string& msg) : Error(msg) {}

    /** @brief Name of the failing member, empty for record-level failures */
    const std::string& member() const noexcept { return member_; }

private:
    std::string member_;
};

/** @brief A block selector lies outside a bounded dataset extent */
class OutOfBoundsError : public Error
{
public:
    using Error::Error;
};

/** @brief A committed type conflicts with the requested layout */
class TypeConflictError : public Error
{
public:
    using Error::Error;
};

/** @brief An HDF5 library call failed */
class StorageError : public Error
{
public:
    using Error::Error;
};

/** @brief Invalid configuration value or file */
class ConfigError : public Error
{
public:
    using Error::Error;
};

}  // namespace h5cx
