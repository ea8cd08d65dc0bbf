#include "h5cx/core/types/EnumType.hpp"

#include "h5cx/core/util/Errors.hpp"

#include <cstdint>
#include <limits>

namespace h5cx
{

EnumType::EnumType(std::string name, std::vector<std::string> values)
    : name_(std::move(name)), values_(std::move(values))
{
    if (values_.empty()) {
        throw InvalidShapeError("enum type '" + name_ + "' has no values");
    }
    for (std::size_t i = 0; i < values_.size(); ++i) {
        if (!ordinals_.emplace(values_[i], static_cast<int>(i)).second) {
            throw InvalidShapeError(
                "enum type '" + name_ + "' has duplicate value '" + values_[i] + "'");
        }
    }
}

std::shared_ptr<const EnumType> EnumType::create(
    std::string name, std::vector<std::string> values)
{
    return std::make_shared<EnumType>(std::move(name), std::move(values));
}

std::size_t EnumType::storageSize() const
{
    if (values_.size() < static_cast<std::size_t>(std::numeric_limits<std::int8_t>::max())) {
        return 1;
    }
    if (values_.size() < static_cast<std::size_t>(std::numeric_limits<std::int16_t>::max())) {
        return 2;
    }
    return 4;
}

int EnumType::ordinalOf(const std::string& value) const
{
    auto it = ordinals_.find(value);
    if (it == ordinals_.end()) {
        throw ValueTypeError("'" + value + "' is not a value of enum type '" + name_ + "'");
    }
    return it->second;
}

const std::string& EnumType::nameOf(int ordinal) const
{
    if (ordinal < 0 || static_cast<std::size_t>(ordinal) >= values_.size()) {
        throw ValueTypeError(
            "ordinal " + std::to_string(ordinal) + " out of range for enum type '" + name_ + "'");
    }
    return values_[static_cast<std::size_t>(ordinal)];
}

}  // namespace h5cx
