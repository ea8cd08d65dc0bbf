#include "h5cx/core/types/TypeVariant.hpp"

#include "h5cx/core/util/Errors.hpp"

namespace h5cx
{

std::string toString(TypeVariant variant)
{
    switch (variant) {
        case TypeVariant::None:                            return "none";
        case TypeVariant::TimestampMillisecondsSinceEpoch: return "timestamp_ms";
        case TypeVariant::TimeDurationMicroseconds:        return "duration_us";
        case TypeVariant::TimeDurationMilliseconds:        return "duration_ms";
        case TypeVariant::TimeDurationSeconds:             return "duration_s";
        case TypeVariant::TimeDurationMinutes:             return "duration_min";
        case TypeVariant::TimeDurationHours:               return "duration_h";
        case TypeVariant::TimeDurationDays:                return "duration_d";
    }
    return "unknown";
}

TypeVariant typeVariantFromOrdinal(int ordinal)
{
    if (ordinal < 0 || ordinal > static_cast<int>(TypeVariant::TimeDurationDays)) {
        throw ValueTypeError("unknown type variant ordinal " + std::to_string(ordinal));
    }
    return static_cast<TypeVariant>(ordinal);
}

}  // namespace h5cx
