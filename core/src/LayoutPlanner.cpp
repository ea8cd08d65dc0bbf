#include "h5cx/core/compound/LayoutPlanner.hpp"

#include "h5cx/core/util/Errors.hpp"

#include <limits>
#include <set>
#include <stdexcept>

namespace h5cx
{

RecordLayout::RecordLayout(std::vector<MemberLayout> members, std::size_t totalLength)
    : members_(std::move(members)), totalLength_(totalLength)
{
}

const MemberLayout* RecordLayout::find(const std::string& name) const
{
    for (const auto& m : members_) {
        if (m.name() == name) {
            return &m;
        }
    }
    return nullptr;
}

const MemberLayout& RecordLayout::at(const std::string& name) const
{
    const auto* m = find(name);
    if (!m) {
        throw std::out_of_range("record layout has no member '" + name + "'");
    }
    return *m;
}

namespace
{

std::string where(const MemberSpec& spec)
{
    return "member '" + spec.name + "': ";
}

std::size_t expectedRank(const MemberSpec& spec)
{
    switch (spec.kind) {
        case ElementKind::Scalar:     return 0;
        case ElementKind::FixedArray: return 1;
        case ElementKind::Matrix:     return 2;
        case ElementKind::NDArray:    return spec.dimensions.size();
    }
    return 0;
}

void validate(const MemberSpec& spec)
{
    if (spec.kind == ElementKind::NDArray && spec.dimensions.empty()) {
        throw InvalidShapeError(where(spec) + "ndarray needs at least one dimension");
    }
    if (spec.dimensions.size() != expectedRank(spec)) {
        throw InvalidShapeError(
            where(spec) + toString(spec.kind) + " expects " +
            std::to_string(expectedRank(spec)) + " dimension(s), got " +
            std::to_string(spec.dimensions.size()));
    }
    for (auto extent : spec.dimensions) {
        if (extent < 0) {
            throw InvalidShapeError(where(spec) + "negative dimension " + std::to_string(extent));
        }
    }

    switch (spec.primitive) {
        case PrimitiveType::Bool:
            if (spec.kind != ElementKind::Scalar) {
                throw InvalidShapeError(where(spec) + "bool members must be scalar");
            }
            break;
        case PrimitiveType::String:
            if (spec.kind != ElementKind::Scalar) {
                throw InvalidShapeError(where(spec) + "string members must be scalar");
            }
            if (spec.stringLength <= 0) {
                throw InvalidShapeError(where(spec) + "string members need a positive length");
            }
            break;
        case PrimitiveType::Enum:
            if (!spec.enumType) {
                throw InvalidShapeError(where(spec) + "enum member without enum type");
            }
            if (spec.kind != ElementKind::Scalar && spec.kind != ElementKind::FixedArray) {
                throw InvalidShapeError(where(spec) + "enum members must be scalar or array");
            }
            break;
        case PrimitiveType::Compound:
            if (!spec.nested) {
                throw InvalidShapeError(where(spec) + "compound member without nested shape");
            }
            if (spec.kind != ElementKind::Scalar) {
                throw InvalidShapeError(where(spec) + "compound members must be scalar");
            }
            break;
        default:
            break;
    }
}

// width of one non-compound element; strings carry their terminator
std::size_t elementSizeOf(const MemberSpec& spec)
{
    switch (spec.primitive) {
        case PrimitiveType::Bool:
            return 1;
        case PrimitiveType::String:
            return static_cast<std::size_t>(spec.stringLength) + 1;
        case PrimitiveType::Enum:
            return spec.enumType->storageSize();
        default:
            return numericSize(spec.primitive);
    }
}

std::size_t checkedProduct(std::size_t a, std::size_t b, const MemberSpec& spec)
{
    if (b != 0 && a > std::numeric_limits<std::size_t>::max() / b) {
        throw InvalidShapeError(where(spec) + "byte length does not fit in size_t");
    }
    return a * b;
}

}  // namespace

std::shared_ptr<const RecordLayout> planLayout(const RecordShape& shape)
{
    std::set<std::string> names;
    std::vector<MemberLayout> members;
    members.reserve(shape.size());

    std::size_t offset = 0;
    for (std::size_t i = 0; i < shape.size(); ++i) {
        const auto& spec = shape[i];
        if (spec.name.empty()) {
            throw InvalidShapeError("member #" + std::to_string(i) + " has an empty name");
        }
        if (!names.insert(spec.name).second) {
            throw InvalidShapeError("duplicate member name '" + spec.name + "'");
        }
        validate(spec);

        MemberLayout m;
        m.spec = spec;
        m.index = i;
        m.offset = offset;
        for (auto extent : spec.dimensions) {
            m.dimensions.push_back(static_cast<std::size_t>(extent));
            m.elementCount = checkedProduct(m.elementCount, static_cast<std::size_t>(extent), spec);
        }
        if (spec.primitive == PrimitiveType::Compound) {
            m.nested = planLayout(*spec.nested);
            m.elementSize = m.nested->totalLength();
        } else {
            m.elementSize = elementSizeOf(spec);
        }
        m.length = checkedProduct(m.elementSize, m.elementCount, spec);
        if (m.length > std::numeric_limits<std::size_t>::max() - offset) {
            throw InvalidShapeError(where(spec) + "record length does not fit in size_t");
        }
        offset += m.length;
        members.push_back(std::move(m));
    }

    return std::make_shared<RecordLayout>(std::move(members), offset);
}

}  // namespace h5cx
