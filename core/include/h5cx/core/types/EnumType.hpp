#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace h5cx
{

/**
 * @brief Named, ordered set of enumeration values.
 *
 * Ordinals are the positions in the value list. The storage width grows
 * with the number of values: 1 byte below 127 values, 2 bytes below 32767,
 * 4 bytes otherwise.
 */
class EnumType
{
public:
    /** @throws InvalidShapeError on an empty list or duplicate names */
    EnumType(std::string name, std::vector<std::string> values);

    static std::shared_ptr<const EnumType> create(
        std::string name, std::vector<std::string> values);

    const std::string& name() const { return name_; }
    const std::vector<std::string>& values() const { return values_; }
    std::size_t size() const { return values_.size(); }

    /** Bytes per stored ordinal (1, 2 or 4) */
    std::size_t storageSize() const;

    /** @throws ValueTypeError for a name not in this enumeration */
    int ordinalOf(const std::string& value) const;

    /** @throws ValueTypeError for an out-of-range ordinal */
    const std::string& nameOf(int ordinal) const;

private:
    std::string name_;
    std::vector<std::string> values_;
    std::unordered_map<std::string, int> ordinals_;
};

}  // namespace h5cx
