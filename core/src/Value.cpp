#include "h5cx/core/types/Value.hpp"

#include "h5cx/core/types/PrimitiveType.hpp"

namespace h5cx
{

CompoundValue::CompoundValue() : members_(std::make_unique<MapRecord>()) {}

CompoundValue::CompoundValue(MapRecord members)
    : members_(std::make_unique<MapRecord>(std::move(members)))
{
}

CompoundValue::CompoundValue(const CompoundValue& other)
    : members_(std::make_unique<MapRecord>(*other.members_))
{
}

// A moved-from value is left empty but valid.
CompoundValue::CompoundValue(CompoundValue&& other) noexcept
    : members_(std::move(other.members_))
{
    other.members_ = std::make_unique<MapRecord>();
}

CompoundValue& CompoundValue::operator=(const CompoundValue& other)
{
    if (this != &other) {
        members_ = std::make_unique<MapRecord>(*other.members_);
    }
    return *this;
}

CompoundValue& CompoundValue::operator=(CompoundValue&& other) noexcept
{
    if (this != &other) {
        std::swap(members_, other.members_);
    }
    return *this;
}

CompoundValue::~CompoundValue() = default;

bool CompoundValue::operator==(const CompoundValue& other) const
{
    return *members_ == *other.members_;
}

namespace
{

template <typename T>
struct ValueShape {
    static constexpr bool vector = false;
    static constexpr bool matrix = false;
    static constexpr bool ndarray = false;
};

template <typename T>
struct ValueShape<std::vector<T>> {
    static constexpr bool vector = std::is_arithmetic_v<T>;
    static constexpr bool matrix = false;
    static constexpr bool ndarray = false;
};

template <typename T>
struct ValueShape<std::vector<std::vector<T>>> {
    static constexpr bool vector = false;
    static constexpr bool matrix = true;
    static constexpr bool ndarray = false;
};

template <typename T>
struct ValueShape<xt::xarray<T>> {
    static constexpr bool vector = false;
    static constexpr bool matrix = false;
    static constexpr bool ndarray = true;
};

}  // namespace

std::string describeValue(const Value& value)
{
    return std::visit([](const auto& v) -> std::string {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::string>) {
            return "string";
        } else if constexpr (std::is_same_v<V, bool>) {
            return "bool";
        } else if constexpr (std::is_same_v<V, EnumValue>) {
            return "enum";
        } else if constexpr (std::is_same_v<V, std::vector<EnumValue>>) {
            return "enum[" + std::to_string(v.size()) + "]";
        } else if constexpr (std::is_same_v<V, CompoundValue>) {
            return "compound";
        } else if constexpr (std::is_arithmetic_v<V>) {
            return toString(primitiveOf<V>());
        } else if constexpr (ValueShape<V>::vector) {
            return toString(primitiveOf<typename V::value_type>()) + "[" +
                   std::to_string(v.size()) + "]";
        } else if constexpr (ValueShape<V>::matrix) {
            std::string cols = v.empty() ? "0" : std::to_string(v.front().size());
            return toString(primitiveOf<typename V::value_type::value_type>()) + "[" +
                   std::to_string(v.size()) + "][" + cols + "]";
        } else {
            static_assert(ValueShape<V>::ndarray);
            std::string out = toString(primitiveOf<typename V::value_type>());
            for (auto extent : v.shape()) {
                out += "[" + std::to_string(extent) + "]";
            }
            return out;
        }
    }, value);
}

}  // namespace h5cx
