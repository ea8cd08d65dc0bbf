#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <xtensor/containers/xarray.hpp>

namespace h5cx
{

/** Enumeration member value, by name */
struct EnumValue {
    std::string name;

    bool operator==(const EnumValue& other) const = default;
};

/** Row-major 2-D member value; rows may be ragged on input */
template <typename T>
using Matrix = std::vector<std::vector<T>>;

class CompoundValue;

/**
 * @brief Any value a compound member can hold.
 *
 * Scalars are the plain numeric types, fixed arrays std::vector<T>,
 * matrices Matrix<T>, higher-rank arrays xt::xarray<T> (which carry their
 * own shape). Booleans, strings, enumerations and nested compounds complete
 * the set.
 */
using Value = std::variant<
    std::int8_t, std::int16_t, std::int32_t, std::int64_t,
    std::uint8_t, std::uint16_t, std::uint32_t, std::uint64_t,
    float, double,
    bool,
    std::vector<std::int8_t>, std::vector<std::int16_t>,
    std::vector<std::int32_t>, std::vector<std::int64_t>,
    std::vector<std::uint8_t>, std::vector<std::uint16_t>,
    std::vector<std::uint32_t>, std::vector<std::uint64_t>,
    std::vector<float>, std::vector<double>,
    Matrix<std::int8_t>, Matrix<std::int16_t>,
    Matrix<std::int32_t>, Matrix<std::int64_t>,
    Matrix<std::uint8_t>, Matrix<std::uint16_t>,
    Matrix<std::uint32_t>, Matrix<std::uint64_t>,
    Matrix<float>, Matrix<double>,
    xt::xarray<std::int8_t>, xt::xarray<std::int16_t>,
    xt::xarray<std::int32_t>, xt::xarray<std::int64_t>,
    xt::xarray<std::uint8_t>, xt::xarray<std::uint16_t>,
    xt::xarray<std::uint32_t>, xt::xarray<std::uint64_t>,
    xt::xarray<float>, xt::xarray<double>,
    std::string,
    EnumValue,
    std::vector<EnumValue>,
    CompoundValue>;

/** Record addressed by member name */
using MapRecord = std::map<std::string, Value>;

/** Record addressed by member position */
using ListRecord = std::vector<Value>;

/** Nested compound member value; owns a MapRecord */
class CompoundValue
{
public:
    CompoundValue();
    explicit CompoundValue(MapRecord members);
    CompoundValue(const CompoundValue& other);
    CompoundValue(CompoundValue&& other) noexcept;
    CompoundValue& operator=(const CompoundValue& other);
    CompoundValue& operator=(CompoundValue&& other) noexcept;
    ~CompoundValue();

    const MapRecord& members() const { return *members_; }
    MapRecord& members() { return *members_; }

    bool operator==(const CompoundValue& other) const;

private:
    std::unique_ptr<MapRecord> members_;
};

template <typename T, typename V>
struct IsVariantAlternative;

template <typename T, typename... Ts>
struct IsVariantAlternative<T, std::variant<Ts...>>
    : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {
};

/** True when T is held directly by Value */
template <typename T>
inline constexpr bool isValueAlternative = IsVariantAlternative<T, Value>::value;

/** @brief Short description such as "int32", "float64[3]" or "string" */
std::string describeValue(const Value& value);

}  // namespace h5cx
