#pragma once

#include <cstddef>
#include <memory>
#include <span>

#include "h5cx/core/compound/LayoutPlanner.hpp"
#include "h5cx/core/compound/ValueAccessor.hpp"
#include "h5cx/core/types/Value.hpp"

namespace h5cx
{

/**
 * @brief Write one member value into a record buffer.
 *
 * Writes record[member.offset, member.offset + member.length). The value
 * is checked completely before the first byte is written, so a failing call
 * leaves the buffer untouched.
 *
 * - Scalar: native byte representation
 * - FixedArray: contiguous elements; shorter values are zero-padded
 * - Matrix: rows x cols, flattened row-major
 * - NDArray: the array's shape must equal the declared dimensions
 * - String: truncated to the declared length, NUL padded
 * - Enum: stored as the value's ordinal
 * - Compound: nested record encoded with the nested layout
 *
 * @throws ValueTypeError if the value alternative does not match the member
 * @throws DimensionMismatchError if the value extents do not fit
 * @throws EncodingError if the buffer is too small for the member
 */
void encodeMember(const Value& value, const MemberLayout& member, std::span<std::byte> record);

/**
 * @brief Read one member value out of a record buffer.
 *
 * Matrix and NDArray values come back in the declared dimensions.
 *
 * @throws EncodingError if the buffer is too small for the member
 * @throws ValueTypeError for an enum ordinal outside its enum type
 */
Value decodeMember(std::span<const std::byte> record, const MemberLayout& member);

/** @brief One member's accessor paired with its placement */
template <typename Record>
class MemberCodec
{
public:
    MemberCodec(std::shared_ptr<const ValueAccessor<Record>> accessor, MemberLayout layout)
        : accessor_(std::move(accessor)), layout_(std::move(layout))
    {
    }

    void encode(const Record& record, std::span<std::byte> buffer) const
    {
        encodeMember(accessor_->get(record), layout_, buffer);
    }

    void decode(std::span<const std::byte> buffer, Record& record) const
    {
        accessor_->set(record, decodeMember(buffer, layout_));
    }

    const MemberLayout& layout() const { return layout_; }
    const std::string& name() const { return layout_.name(); }

private:
    std::shared_ptr<const ValueAccessor<Record>> accessor_;
    MemberLayout layout_;
};

}  // namespace h5cx
