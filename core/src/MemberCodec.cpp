#include "h5cx/core/compound/MemberCodec.hpp"

#include "h5cx/core/util/Errors.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

namespace h5cx
{

namespace
{

std::string where(const MemberLayout& m)
{
    return "member '" + m.name() + "' (" + toString(m.spec.primitive) + " " +
           toString(m.spec.kind) + "): ";
}

std::string extents(const std::vector<std::size_t>& dims)
{
    std::string out;
    for (auto d : dims) {
        out += "[" + std::to_string(d) + "]";
    }
    return out;
}

[[noreturn]] void wrongValue(const Value& value, const MemberLayout& m)
{
    throw ValueTypeError(where(m) + "cannot hold a value of type " + describeValue(value));
}

template <typename T>
const T& expect(const Value& value, const MemberLayout& m)
{
    const auto* v = std::get_if<T>(&value);
    if (!v) {
        wrongValue(value, m);
    }
    return *v;
}

void checkBuffer(std::size_t available, const MemberLayout& m)
{
    if (m.offset + m.length > available) {
        throw EncodingError(
            where(m) + "record buffer of " + std::to_string(available) +
            " bytes ends before byte " + std::to_string(m.offset + m.length));
    }
}

template <typename T>
void encodeNumeric(const Value& value, const MemberLayout& m, std::byte* dst)
{
    switch (m.spec.kind) {
        case ElementKind::Scalar: {
            const T& v = expect<T>(value, m);
            std::memcpy(dst, &v, sizeof(T));
            return;
        }
        case ElementKind::FixedArray: {
            const auto& v = expect<std::vector<T>>(value, m);
            if (v.size() > m.elementCount) {
                throw DimensionMismatchError(
                    where(m) + std::to_string(v.size()) + " elements do not fit into " +
                    extents(m.dimensions));
            }
            std::memset(dst, 0, m.length);
            if (!v.empty()) {
                std::memcpy(dst, v.data(), v.size() * sizeof(T));
            }
            return;
        }
        case ElementKind::Matrix: {
            const auto& v = expect<Matrix<T>>(value, m);
            const std::size_t rows = m.dimensions[0];
            const std::size_t cols = m.dimensions[1];
            if (m.elementCount == 0 && v.empty()) {
                return;
            }
            if (v.size() != rows) {
                throw DimensionMismatchError(
                    where(m) + std::to_string(v.size()) + " rows given, expected " +
                    extents(m.dimensions));
            }
            for (std::size_t r = 0; r < rows; ++r) {
                if (v[r].size() != cols) {
                    throw DimensionMismatchError(
                        where(m) + "row " + std::to_string(r) + " has " +
                        std::to_string(v[r].size()) + " columns, expected " +
                        extents(m.dimensions));
                }
            }
            if (cols == 0) {
                return;
            }
            for (std::size_t r = 0; r < rows; ++r) {
                std::memcpy(dst + r * cols * sizeof(T), v[r].data(), cols * sizeof(T));
            }
            return;
        }
        case ElementKind::NDArray: {
            const auto& v = expect<xt::xarray<T>>(value, m);
            const auto& shape = v.shape();
            if (!std::equal(shape.begin(), shape.end(), m.dimensions.begin(), m.dimensions.end())) {
                std::vector<std::size_t> given(shape.begin(), shape.end());
                throw DimensionMismatchError(
                    where(m) + "array of shape " + extents(given) + " given, expected " +
                    extents(m.dimensions));
            }
            if (m.length > 0) {
                std::memcpy(dst, v.data(), m.length);
            }
            return;
        }
    }
}

template <typename T>
Value decodeNumeric(const std::byte* src, const MemberLayout& m)
{
    switch (m.spec.kind) {
        case ElementKind::Scalar: {
            T v;
            std::memcpy(&v, src, sizeof(T));
            return v;
        }
        case ElementKind::FixedArray: {
            std::vector<T> v(m.elementCount);
            if (m.length > 0) {
                std::memcpy(v.data(), src, m.length);
            }
            return v;
        }
        case ElementKind::Matrix: {
            const std::size_t rows = m.dimensions[0];
            const std::size_t cols = m.dimensions[1];
            Matrix<T> v(rows, std::vector<T>(cols));
            if (cols > 0) {
                for (std::size_t r = 0; r < rows; ++r) {
                    std::memcpy(v[r].data(), src + r * cols * sizeof(T), cols * sizeof(T));
                }
            }
            return v;
        }
        case ElementKind::NDArray: {
            auto v = xt::xarray<T>::from_shape(m.dimensions);
            if (m.length > 0) {
                std::memcpy(v.data(), src, m.length);
            }
            return v;
        }
    }
    throw ValueTypeError(where(m) + "unknown element kind");
}

void encodeBool(const Value& value, const MemberLayout& m, std::byte* dst)
{
    *dst = expect<bool>(value, m) ? std::byte{1} : std::byte{0};
}

// any non-zero byte reads as true
Value decodeBool(const std::byte* src)
{
    return *src != std::byte{0};
}

void encodeString(const Value& value, const MemberLayout& m, std::byte* dst)
{
    const auto& s = expect<std::string>(value, m);
    const std::size_t n = std::min(s.size(), m.length - 1);
    std::memset(dst, 0, m.length);
    std::memcpy(dst, s.data(), n);
}

Value decodeString(const std::byte* src, const MemberLayout& m)
{
    const auto* chars = reinterpret_cast<const char*>(src);
    const auto* end = std::find(chars, chars + m.length, '\0');
    return std::string(chars, end);
}

void writeOrdinal(std::byte* dst, std::size_t width, int ordinal)
{
    switch (width) {
        case 1: {
            auto v = static_cast<std::int8_t>(ordinal);
            std::memcpy(dst, &v, 1);
            break;
        }
        case 2: {
            auto v = static_cast<std::int16_t>(ordinal);
            std::memcpy(dst, &v, 2);
            break;
        }
        default: {
            auto v = static_cast<std::int32_t>(ordinal);
            std::memcpy(dst, &v, 4);
            break;
        }
    }
}

int readOrdinal(const std::byte* src, std::size_t width)
{
    switch (width) {
        case 1: {
            std::int8_t v;
            std::memcpy(&v, src, 1);
            return v;
        }
        case 2: {
            std::int16_t v;
            std::memcpy(&v, src, 2);
            return v;
        }
        default: {
            std::int32_t v;
            std::memcpy(&v, src, 4);
            return v;
        }
    }
}

void encodeEnum(const Value& value, const MemberLayout& m, std::byte* dst)
{
    const auto& type = *m.spec.enumType;
    std::vector<int> ordinals;
    if (m.spec.kind == ElementKind::Scalar) {
        ordinals.push_back(type.ordinalOf(expect<EnumValue>(value, m).name));
    } else {
        const auto& v = expect<std::vector<EnumValue>>(value, m);
        if (v.size() > m.elementCount) {
            throw DimensionMismatchError(
                where(m) + std::to_string(v.size()) + " elements do not fit into " +
                extents(m.dimensions));
        }
        for (const auto& e : v) {
            ordinals.push_back(type.ordinalOf(e.name));
        }
    }

    std::memset(dst, 0, m.length);
    for (std::size_t i = 0; i < ordinals.size(); ++i) {
        writeOrdinal(dst + i * m.elementSize, m.elementSize, ordinals[i]);
    }
}

Value decodeEnum(const std::byte* src, const MemberLayout& m)
{
    const auto& type = *m.spec.enumType;
    if (m.spec.kind == ElementKind::Scalar) {
        return EnumValue{type.nameOf(readOrdinal(src, m.elementSize))};
    }
    std::vector<EnumValue> v;
    v.reserve(m.elementCount);
    for (std::size_t i = 0; i < m.elementCount; ++i) {
        v.push_back(EnumValue{type.nameOf(readOrdinal(src + i * m.elementSize, m.elementSize))});
    }
    return v;
}

void encodeCompound(const Value& value, const MemberLayout& m, std::byte* dst)
{
    const auto& members = expect<CompoundValue>(value, m).members();
    const auto& nested = *m.nested;

    // staged so that a failing nested member leaves dst untouched
    std::vector<std::byte> staging(nested.totalLength());
    for (const auto& nm : nested.members()) {
        auto it = members.find(nm.name());
        if (it == members.end()) {
            throw ValueTypeError(where(m) + "nested member '" + nm.name() + "' is missing");
        }
        encodeMember(it->second, nm, staging);
    }
    if (!staging.empty()) {
        std::memcpy(dst, staging.data(), staging.size());
    }
}

Value decodeCompound(const std::byte* src, const MemberLayout& m)
{
    std::span<const std::byte> nestedBytes(src, m.length);
    CompoundValue value;
    for (const auto& nm : m.nested->members()) {
        value.members().emplace(nm.name(), decodeMember(nestedBytes, nm));
    }
    return value;
}

}  // namespace

void encodeMember(const Value& value, const MemberLayout& member, std::span<std::byte> record)
{
    checkBuffer(record.size(), member);
    std::byte* dst = record.data() + member.offset;

    switch (member.spec.primitive) {
        case PrimitiveType::Bool:
            encodeBool(value, member, dst);
            return;
        case PrimitiveType::String:
            encodeString(value, member, dst);
            return;
        case PrimitiveType::Enum:
            encodeEnum(value, member, dst);
            return;
        case PrimitiveType::Compound:
            encodeCompound(value, member, dst);
            return;
        default:
            visitNumeric(member.spec.primitive, [&]<typename T>(std::type_identity<T>) {
                encodeNumeric<T>(value, member, dst);
            });
            return;
    }
}

Value decodeMember(std::span<const std::byte> record, const MemberLayout& member)
{
    checkBuffer(record.size(), member);
    const std::byte* src = record.data() + member.offset;

    switch (member.spec.primitive) {
        case PrimitiveType::Bool:
            return decodeBool(src);
        case PrimitiveType::String:
            return decodeString(src, member);
        case PrimitiveType::Enum:
            return decodeEnum(src, member);
        case PrimitiveType::Compound:
            return decodeCompound(src, member);
        default:
            return visitNumeric(member.spec.primitive, [&]<typename T>(std::type_identity<T>) {
                return decodeNumeric<T>(src, member);
            });
    }
}

}  // namespace h5cx
