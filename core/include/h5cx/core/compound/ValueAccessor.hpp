#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

#include "h5cx/core/types/Value.hpp"
#include "h5cx/core/util/Errors.hpp"

namespace h5cx
{

/**
 * @brief Reads and writes one member of a record of type Record.
 *
 * Struct fields, map entries and list positions are reached through the
 * same interface, so the member codec does not care how records are stored.
 */
template <typename Record>
class ValueAccessor
{
public:
    virtual ~ValueAccessor() = default;

    virtual Value get(const Record& record) const = 0;
    virtual void set(Record& record, Value value) const = 0;
};

/** @brief Accessor for a data member of a struct */
template <typename Record, typename M>
class FieldAccessor : public ValueAccessor<Record>
{
    static_assert(isValueAlternative<M>, "field type must be one of the Value alternatives");

public:
    explicit FieldAccessor(M Record::*field) : field_(field) {}

    Value get(const Record& record) const override { return Value(record.*field_); }

    void set(Record& record, Value value) const override
    {
        auto* v = std::get_if<M>(&value);
        if (!v) {
            throw ValueTypeError("cannot assign " + describeValue(value) + " to field");
        }
        record.*field_ = std::move(*v);
    }

private:
    M Record::*field_;
};

/** @brief Accessor for a named entry of a MapRecord */
class MapAccessor : public ValueAccessor<MapRecord>
{
public:
    explicit MapAccessor(std::string name) : name_(std::move(name)) {}

    Value get(const MapRecord& record) const override
    {
        auto it = record.find(name_);
        if (it == record.end()) {
            throw ValueTypeError("record has no entry '" + name_ + "'");
        }
        return it->second;
    }

    void set(MapRecord& record, Value value) const override
    {
        record.insert_or_assign(name_, std::move(value));
    }

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/** @brief Accessor for a position of a ListRecord */
class ListAccessor : public ValueAccessor<ListRecord>
{
public:
    explicit ListAccessor(std::size_t index) : index_(index) {}

    Value get(const ListRecord& record) const override
    {
        if (index_ >= record.size()) {
            throw ValueTypeError(
                "record has " + std::to_string(record.size()) + " entries, position " +
                std::to_string(index_) + " requested");
        }
        return record[index_];
    }

    void set(ListRecord& record, Value value) const override
    {
        if (record.size() <= index_) {
            record.resize(index_ + 1);
        }
        record[index_] = std::move(value);
    }

    std::size_t index() const { return index_; }

private:
    std::size_t index_;
};

}  // namespace h5cx
