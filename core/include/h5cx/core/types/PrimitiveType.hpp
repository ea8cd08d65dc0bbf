#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

#include "h5cx/core/util/Errors.hpp"

namespace h5cx
{

/** Element type of a compound member */
enum class PrimitiveType {
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Float32,
    Float64,
    /** one byte, 0 or 1 */
    Bool,
    String,
    Enum,
    Compound
};

/** Rank class of a compound member */
enum class ElementKind { Scalar, FixedArray, Matrix, NDArray };

std::string toString(PrimitiveType type);
std::string toString(ElementKind kind);

/** @brief True for the ten integer and floating point types */
bool isNumeric(PrimitiveType type);

/**
 * @brief Byte width of one element of a numeric type.
 *
 * Bool is one byte. String, Enum and Compound widths depend on the member
 * declaration and are computed by the layout planner.
 *
 * @throws InvalidShapeError for a non-numeric type
 */
std::size_t numericSize(PrimitiveType type);

template <typename T>
constexpr PrimitiveType primitiveOf()
{
    if constexpr (std::is_same_v<T, std::int8_t>) return PrimitiveType::Int8;
    else if constexpr (std::is_same_v<T, std::int16_t>) return PrimitiveType::Int16;
    else if constexpr (std::is_same_v<T, std::int32_t>) return PrimitiveType::Int32;
    else if constexpr (std::is_same_v<T, std::int64_t>) return PrimitiveType::Int64;
    else if constexpr (std::is_same_v<T, std::uint8_t>) return PrimitiveType::UInt8;
    else if constexpr (std::is_same_v<T, std::uint16_t>) return PrimitiveType::UInt16;
    else if constexpr (std::is_same_v<T, std::uint32_t>) return PrimitiveType::UInt32;
    else if constexpr (std::is_same_v<T, std::uint64_t>) return PrimitiveType::UInt64;
    else if constexpr (std::is_same_v<T, float>) return PrimitiveType::Float32;
    else if constexpr (std::is_same_v<T, double>) return PrimitiveType::Float64;
    else static_assert(sizeof(T) == 0, "unsupported numeric member type");
}

/**
 * @brief Call f(std::type_identity<T>{}) with the C++ type of a numeric
 * PrimitiveType.
 *
 * @throws InvalidShapeError for a non-numeric type
 */
template <typename F>
decltype(auto) visitNumeric(PrimitiveType type, F&& f)
{
    switch (type) {
        case PrimitiveType::Int8:    return f(std::type_identity<std::int8_t>{});
        case PrimitiveType::Int16:   return f(std::type_identity<std::int16_t>{});
        case PrimitiveType::Int32:   return f(std::type_identity<std::int32_t>{});
        case PrimitiveType::Int64:   return f(std::type_identity<std::int64_t>{});
        case PrimitiveType::UInt8:   return f(std::type_identity<std::uint8_t>{});
        case PrimitiveType::UInt16:  return f(std::type_identity<std::uint16_t>{});
        case PrimitiveType::UInt32:  return f(std::type_identity<std::uint32_t>{});
        case PrimitiveType::UInt64:  return f(std::type_identity<std::uint64_t>{});
        case PrimitiveType::Float32: return f(std::type_identity<float>{});
        case PrimitiveType::Float64: return f(std::type_identity<double>{});
        default: break;
    }
    throw InvalidShapeError("not a numeric type: " + toString(type));
}

}  // namespace h5cx
