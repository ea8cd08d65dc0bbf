#include "h5cx/core/types/PrimitiveType.hpp"

#include "h5cx/core/util/Errors.hpp"

namespace h5cx
{

std::string toString(PrimitiveType type)
{
    switch (type) {
        case PrimitiveType::Int8:     return "int8";
        case PrimitiveType::Int16:    return "int16";
        case PrimitiveType::Int32:    return "int32";
        case PrimitiveType::Int64:    return "int64";
        case PrimitiveType::UInt8:    return "uint8";
        case PrimitiveType::UInt16:   return "uint16";
        case PrimitiveType::UInt32:   return "uint32";
        case PrimitiveType::UInt64:   return "uint64";
        case PrimitiveType::Float32:  return "float32";
        case PrimitiveType::Float64:  return "float64";
        case PrimitiveType::Bool:     return "bool";
        case PrimitiveType::String:   return "string";
        case PrimitiveType::Enum:     return "enum";
        case PrimitiveType::Compound: return "compound";
    }
    return "unknown";
}

std::string toString(ElementKind kind)
{
    switch (kind) {
        case ElementKind::Scalar:     return "scalar";
        case ElementKind::FixedArray: return "array";
        case ElementKind::Matrix:     return "matrix";
        case ElementKind::NDArray:    return "ndarray";
    }
    return "unknown";
}

bool isNumeric(PrimitiveType type)
{
    return type != PrimitiveType::Bool && type != PrimitiveType::String &&
           type != PrimitiveType::Enum && type != PrimitiveType::Compound;
}

std::size_t numericSize(PrimitiveType type)
{
    switch (type) {
        case PrimitiveType::Int8:
        case PrimitiveType::UInt8:
            return 1;
        case PrimitiveType::Int16:
        case PrimitiveType::UInt16:
            return 2;
        case PrimitiveType::Int32:
        case PrimitiveType::UInt32:
        case PrimitiveType::Float32:
            return 4;
        case PrimitiveType::Int64:
        case PrimitiveType::UInt64:
        case PrimitiveType::Float64:
            return 8;
        default:
            break;
    }
    throw InvalidShapeError("not a numeric type: " + toString(type));
}

}  // namespace h5cx
