#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "h5cx/core/types/EnumType.hpp"
#include "h5cx/core/types/PrimitiveType.hpp"
#include "h5cx/core/types/TypeVariant.hpp"

namespace h5cx
{

class RecordShape;

/**
 * @brief Declaration of one compound member.
 *
 * Extents are signed so that a negative extent reaches the layout planner
 * and is rejected there instead of wrapping around.
 */
struct MemberSpec {
    std::string name;
    ElementKind kind = ElementKind::Scalar;
    PrimitiveType primitive = PrimitiveType::Int32;
    /** empty for Scalar, {n} for FixedArray, {rows, cols} for Matrix */
    std::vector<std::int64_t> dimensions;
    TypeVariant variant = TypeVariant::None;
    /** maximum number of bytes, String only */
    std::int64_t stringLength = 0;
    /** Enum only */
    std::shared_ptr<const EnumType> enumType;
    /** Compound only */
    std::shared_ptr<const RecordShape> nested;
};

/** @brief Ordered list of member declarations of one compound record */
class RecordShape
{
public:
    RecordShape() = default;
    explicit RecordShape(std::vector<MemberSpec> members) : members_(std::move(members)) {}

    const std::vector<MemberSpec>& members() const { return members_; }
    std::size_t size() const { return members_.size(); }
    bool empty() const { return members_.empty(); }
    const MemberSpec& operator[](std::size_t i) const { return members_[i]; }

    /** @return nullptr if no member has this name */
    const MemberSpec* find(const std::string& name) const;

    void add(MemberSpec member) { members_.push_back(std::move(member)); }

private:
    std::vector<MemberSpec> members_;
};

/**
 * @brief Fluent construction of a RecordShape.
 *
 * @code
 * auto shape = RecordShapeBuilder()
 *                  .scalar<std::int32_t>("id")
 *                  .array<double>("position", 3)
 *                  .string("label", 16)
 *                  .build();
 * @endcode
 *
 * The builder does not validate; planLayout() does.
 */
class RecordShapeBuilder
{
public:
    template <typename T>
    RecordShapeBuilder& scalar(const std::string& name, TypeVariant variant = TypeVariant::None)
    {
        return numeric(name, primitiveOf<T>(), ElementKind::Scalar, {}, variant);
    }

    template <typename T>
    RecordShapeBuilder& array(const std::string& name, std::int64_t length)
    {
        return numeric(name, primitiveOf<T>(), ElementKind::FixedArray, {length});
    }

    template <typename T>
    RecordShapeBuilder& matrix(const std::string& name, std::int64_t rows, std::int64_t cols)
    {
        return numeric(name, primitiveOf<T>(), ElementKind::Matrix, {rows, cols});
    }

    template <typename T>
    RecordShapeBuilder& ndarray(const std::string& name, std::vector<std::int64_t> dimensions)
    {
        return numeric(name, primitiveOf<T>(), ElementKind::NDArray, std::move(dimensions));
    }

    RecordShapeBuilder& boolean(const std::string& name);
    RecordShapeBuilder& string(const std::string& name, std::int64_t maxLength);
    RecordShapeBuilder& enumeration(
        const std::string& name, std::shared_ptr<const EnumType> type);
    RecordShapeBuilder& enumArray(
        const std::string& name, std::shared_ptr<const EnumType> type, std::int64_t length);
    RecordShapeBuilder& compound(const std::string& name, RecordShape nested);

    /** Append a fully specified member */
    RecordShapeBuilder& member(MemberSpec spec);

    RecordShape build() const { return shape_; }

private:
    RecordShapeBuilder& numeric(
        const std::string& name,
        PrimitiveType primitive,
        ElementKind kind,
        std::vector<std::int64_t> dimensions,
        TypeVariant variant = TypeVariant::None);

    RecordShape shape_;
};

}  // namespace h5cx
