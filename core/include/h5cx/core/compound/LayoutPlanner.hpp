#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "h5cx/core/types/RecordShape.hpp"

namespace h5cx
{

class RecordLayout;

/** @brief Placement of one member inside the flat record buffer */
struct MemberLayout {
    MemberSpec spec;
    /** position in declaration order */
    std::size_t index = 0;
    std::size_t offset = 0;
    /** elementSize * elementCount */
    std::size_t length = 0;
    std::size_t elementSize = 0;
    std::size_t elementCount = 1;
    /** validated extents; empty for scalars */
    std::vector<std::size_t> dimensions;
    /** layout of a Compound member's nested record */
    std::shared_ptr<const RecordLayout> nested;

    const std::string& name() const { return spec.name; }
};

/**
 * @brief Byte offsets and lengths of every member of a record.
 *
 * Members are packed in declaration order without padding:
 * offset(i + 1) == offset(i) + length(i), and totalLength() is the sum of
 * all member lengths. Instances are immutable once planned.
 */
class RecordLayout
{
public:
    RecordLayout(std::vector<MemberLayout> members, std::size_t totalLength);

    const std::vector<MemberLayout>& members() const { return members_; }
    std::size_t size() const { return members_.size(); }
    std::size_t totalLength() const { return totalLength_; }
    const MemberLayout& operator[](std::size_t i) const { return members_[i]; }

    /** @return nullptr if no member has this name */
    const MemberLayout* find(const std::string& name) const;

    /** @throws std::out_of_range if no member has this name */
    const MemberLayout& at(const std::string& name) const;

private:
    std::vector<MemberLayout> members_;
    std::size_t totalLength_;
};

/**
 * @brief Compute the packed layout of a record shape.
 *
 * Deterministic: the same shape always yields the same offsets.
 *
 * @throws InvalidShapeError if a member's dimensions do not fit its element
 * kind, an extent is negative, names are empty or repeated, a string has no
 * positive length, an enum has no enum type, a compound has no nested
 * shape, or a string or compound member is not a scalar
 */
std::shared_ptr<const RecordLayout> planLayout(const RecordShape& shape);

}  // namespace h5cx
