#pragma once

#include <cstdint>
#include <string>

namespace h5cx
{

/**
 * @brief Semantic tag attached to a compound member.
 *
 * The tag does not change the byte layout; it is stored next to the
 * committed type so that readers can interpret e.g. an int64 member as a
 * timestamp. The numeric values are persisted and must not be reordered.
 */
enum class TypeVariant : std::int8_t {
    None = 0,
    TimestampMillisecondsSinceEpoch = 1,
    TimeDurationMicroseconds = 2,
    TimeDurationMilliseconds = 3,
    TimeDurationSeconds = 4,
    TimeDurationMinutes = 5,
    TimeDurationHours = 6,
    TimeDurationDays = 7
};

std::string toString(TypeVariant variant);

/** @throws ValueTypeError for an ordinal no TypeVariant has */
TypeVariant typeVariantFromOrdinal(int ordinal);

}  // namespace h5cx
