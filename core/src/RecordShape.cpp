#include "h5cx/core/types/RecordShape.hpp"

namespace h5cx
{

const MemberSpec* RecordShape::find(const std::string& name) const
{
    for (const auto& m : members_) {
        if (m.name == name) {
            return &m;
        }
    }
    return nullptr;
}

RecordShapeBuilder& RecordShapeBuilder::numeric(
    const std::string& name,
    PrimitiveType primitive,
    ElementKind kind,
    std::vector<std::int64_t> dimensions,
    TypeVariant variant)
{
    MemberSpec spec;
    spec.name = name;
    spec.kind = kind;
    spec.primitive = primitive;
    spec.dimensions = std::move(dimensions);
    spec.variant = variant;
    return member(std::move(spec));
}

RecordShapeBuilder& RecordShapeBuilder::boolean(const std::string& name)
{
    MemberSpec spec;
    spec.name = name;
    spec.primitive = PrimitiveType::Bool;
    return member(std::move(spec));
}

RecordShapeBuilder& RecordShapeBuilder::string(const std::string& name, std::int64_t maxLength)
{
    MemberSpec spec;
    spec.name = name;
    spec.primitive = PrimitiveType::String;
    spec.stringLength = maxLength;
    return member(std::move(spec));
}

RecordShapeBuilder& RecordShapeBuilder::enumeration(
    const std::string& name, std::shared_ptr<const EnumType> type)
{
    MemberSpec spec;
    spec.name = name;
    spec.primitive = PrimitiveType::Enum;
    spec.enumType = std::move(type);
    return member(std::move(spec));
}

RecordShapeBuilder& RecordShapeBuilder::enumArray(
    const std::string& name, std::shared_ptr<const EnumType> type, std::int64_t length)
{
    MemberSpec spec;
    spec.name = name;
    spec.kind = ElementKind::FixedArray;
    spec.primitive = PrimitiveType::Enum;
    spec.dimensions = {length};
    spec.enumType = std::move(type);
    return member(std::move(spec));
}

RecordShapeBuilder& RecordShapeBuilder::compound(const std::string& name, RecordShape nested)
{
    MemberSpec spec;
    spec.name = name;
    spec.primitive = PrimitiveType::Compound;
    spec.nested = std::make_shared<RecordShape>(std::move(nested));
    return member(std::move(spec));
}

RecordShapeBuilder& RecordShapeBuilder::member(MemberSpec spec)
{
    shape_.add(std::move(spec));
    return *this;
}

}  // namespace h5cx
