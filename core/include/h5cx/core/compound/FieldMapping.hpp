#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "h5cx/core/compound/RecordCodec.hpp"
#include "h5cx/core/compound/ValueAccessor.hpp"
#include "h5cx/core/types/RecordShape.hpp"

namespace h5cx
{

/**
 * @brief Accessor for a struct field that is itself a mapped struct.
 *
 * The nested struct travels through the codec as a CompoundValue keyed by
 * the nested member names.
 */
template <typename Record, typename Inner>
class NestedFieldAccessor : public ValueAccessor<Record>
{
public:
    using NestedAccessors =
        std::vector<std::pair<std::string, std::shared_ptr<const ValueAccessor<Inner>>>>;

    NestedFieldAccessor(Inner Record::*field, NestedAccessors nested)
        : field_(field), nested_(std::move(nested))
    {
    }

    Value get(const Record& record) const override
    {
        CompoundValue value;
        for (const auto& [name, accessor] : nested_) {
            value.members().emplace(name, accessor->get(record.*field_));
        }
        return value;
    }

    void set(Record& record, Value value) const override
    {
        auto* compound = std::get_if<CompoundValue>(&value);
        if (!compound) {
            throw ValueTypeError("cannot assign " + describeValue(value) + " to nested record");
        }
        for (const auto& [name, accessor] : nested_) {
            auto it = compound->members().find(name);
            if (it == compound->members().end()) {
                throw ValueTypeError("nested record has no entry '" + name + "'");
            }
            accessor->set(record.*field_, std::move(it->second));
        }
    }

private:
    Inner Record::*field_;
    NestedAccessors nested_;
};

/**
 * @brief Declares how the fields of a struct map onto compound members.
 *
 * The mapping yields both the RecordShape and one accessor per member, so
 * the struct layout never has to be discovered at runtime.
 *
 * @code
 * struct Sample {
 *     std::int32_t id;
 *     std::vector<double> position;
 *     std::string label;
 * };
 *
 * auto mapping = FieldMapping<Sample>()
 *                    .scalar("id", &Sample::id)
 *                    .array("position", &Sample::position, 3)
 *                    .string("label", &Sample::label, 16);
 * auto codec = makeFieldCodec(mapping);
 * @endcode
 */
template <typename Record>
class FieldMapping
{
public:
    using AccessorPtr = std::shared_ptr<const ValueAccessor<Record>>;

    template <typename T>
    FieldMapping& scalar(
        const std::string& name, T Record::*field, TypeVariant variant = TypeVariant::None)
    {
        builder_.scalar<T>(name, variant);
        return add<T>(field);
    }

    template <typename T>
    FieldMapping& array(const std::string& name, std::vector<T> Record::*field, std::int64_t length)
    {
        builder_.array<T>(name, length);
        return add<std::vector<T>>(field);
    }

    template <typename T>
    FieldMapping& matrix(
        const std::string& name, Matrix<T> Record::*field, std::int64_t rows, std::int64_t cols)
    {
        builder_.matrix<T>(name, rows, cols);
        return add<Matrix<T>>(field);
    }

    template <typename T>
    FieldMapping& ndarray(
        const std::string& name, xt::xarray<T> Record::*field, std::vector<std::int64_t> dimensions)
    {
        builder_.ndarray<T>(name, std::move(dimensions));
        return add<xt::xarray<T>>(field);
    }

    FieldMapping& boolean(const std::string& name, bool Record::*field)
    {
        builder_.boolean(name);
        return add<bool>(field);
    }

    FieldMapping& string(const std::string& name, std::string Record::*field, std::int64_t maxLength)
    {
        builder_.string(name, maxLength);
        return add<std::string>(field);
    }

    FieldMapping& enumeration(
        const std::string& name, EnumValue Record::*field, std::shared_ptr<const EnumType> type)
    {
        builder_.enumeration(name, std::move(type));
        return add<EnumValue>(field);
    }

    FieldMapping& enumArray(
        const std::string& name,
        std::vector<EnumValue> Record::*field,
        std::shared_ptr<const EnumType> type,
        std::int64_t length)
    {
        builder_.enumArray(name, std::move(type), length);
        return add<std::vector<EnumValue>>(field);
    }

    template <typename Inner>
    FieldMapping& compound(
        const std::string& name, Inner Record::*field, const FieldMapping<Inner>& nested)
    {
        builder_.compound(name, nested.shape());

        typename NestedFieldAccessor<Record, Inner>::NestedAccessors accessors;
        const auto nestedShape = nested.shape();
        for (std::size_t i = 0; i < nestedShape.size(); ++i) {
            accessors.emplace_back(nestedShape[i].name, nested.accessors()[i]);
        }
        accessors_.push_back(
            std::make_shared<NestedFieldAccessor<Record, Inner>>(field, std::move(accessors)));
        return *this;
    }

    RecordShape shape() const { return builder_.build(); }
    const std::vector<AccessorPtr>& accessors() const { return accessors_; }

private:
    template <typename M>
    FieldMapping& add(M Record::*field)
    {
        accessors_.push_back(std::make_shared<FieldAccessor<Record, M>>(field));
        return *this;
    }

    RecordShapeBuilder builder_;
    std::vector<AccessorPtr> accessors_;
};

/**
 * @brief Plan the mapping's layout and build a codec for it.
 * @throws InvalidShapeError if the mapping does not describe a valid shape
 */
template <typename Record>
RecordCodec<Record> makeFieldCodec(const FieldMapping<Record>& mapping)
{
    return RecordCodec<Record>(planLayout(mapping.shape()), mapping.accessors());
}

}  // namespace h5cx
