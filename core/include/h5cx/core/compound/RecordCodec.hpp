#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include "h5cx/core/compound/LayoutPlanner.hpp"
#include "h5cx/core/compound/MemberCodec.hpp"
#include "h5cx/core/compound/ValueAccessor.hpp"
#include "h5cx/core/util/Errors.hpp"

namespace h5cx
{

/**
 * @brief Converts whole records to and from the flat compound layout.
 *
 * A codec is immutable after construction (apart from the byte inspector)
 * and may be shared between threads as long as each call gets its own
 * buffers.
 *
 * @code
 * auto codec = RecordCodec<MapRecord>::forMap(planLayout(shape));
 * auto bytes = codec.byteify(record);
 * MapRecord back = codec.unbyteify(bytes);
 * @endcode
 */
template <typename Record>
class RecordCodec
{
public:
    /** Called with every finished buffer; must not keep the span */
    using ByteInspector = std::function<void(std::span<const std::byte>)>;
    using AccessorPtr = std::shared_ptr<const ValueAccessor<Record>>;

    /** @throws InvalidShapeError unless there is one accessor per member */
    RecordCodec(std::shared_ptr<const RecordLayout> layout, std::vector<AccessorPtr> accessors)
        : layout_(std::move(layout))
    {
        if (accessors.size() != layout_->size()) {
            throw InvalidShapeError(
                "record codec needs " + std::to_string(layout_->size()) + " accessors, got " +
                std::to_string(accessors.size()));
        }
        members_.reserve(accessors.size());
        for (std::size_t i = 0; i < accessors.size(); ++i) {
            members_.emplace_back(std::move(accessors[i]), (*layout_)[i]);
        }
    }

    /** Codec for records addressed by member name */
    static RecordCodec forMap(std::shared_ptr<const RecordLayout> layout)
        requires std::is_same_v<Record, MapRecord>
    {
        std::vector<AccessorPtr> accessors;
        for (const auto& m : layout->members()) {
            accessors.push_back(std::make_shared<MapAccessor>(m.name()));
        }
        return RecordCodec(std::move(layout), std::move(accessors));
    }

    /** Codec for records addressed by member position */
    static RecordCodec forList(std::shared_ptr<const RecordLayout> layout)
        requires std::is_same_v<Record, ListRecord>
    {
        std::vector<AccessorPtr> accessors;
        for (const auto& m : layout->members()) {
            accessors.push_back(std::make_shared<ListAccessor>(m.index));
        }
        return RecordCodec(std::move(layout), std::move(accessors));
    }

    /**
     * @brief Encode one record into a buffer of recordSize() bytes.
     * @throws EncodingError naming the first member that failed
     */
    std::vector<std::byte> byteify(const Record& record) const
    {
        std::vector<std::byte> buffer(recordSize());
        encodeInto(record, buffer);
        inspect(buffer);
        return buffer;
    }

    /** @brief Encode records back to back */
    std::vector<std::byte> byteify(std::span<const Record> records) const
    {
        std::vector<std::byte> buffer(recordSize() * records.size());
        for (std::size_t i = 0; i < records.size(); ++i) {
            encodeInto(records[i], std::span<std::byte>(buffer).subspan(i * recordSize(), recordSize()));
        }
        inspect(buffer);
        return buffer;
    }

    /**
     * @brief Decode the first record of a buffer.
     * @throws EncodingError if the buffer is shorter than one record or a
     * member cannot be decoded
     */
    Record unbyteify(std::span<const std::byte> bytes) const
    {
        if (bytes.size() < recordSize()) {
            throw EncodingError(
                "buffer of " + std::to_string(bytes.size()) + " bytes is shorter than the record size " +
                std::to_string(recordSize()));
        }
        Record record{};
        decodeFrom(bytes.first(recordSize()), record);
        return record;
    }

    /**
     * @brief Decode a buffer holding records back to back.
     * @throws EncodingError if the length is not a multiple of recordSize()
     */
    std::vector<Record> arrayify(std::span<const std::byte> bytes) const
    {
        const std::size_t size = recordSize();
        if (size == 0 ? !bytes.empty() : bytes.size() % size != 0) {
            throw EncodingError(
                "buffer of " + std::to_string(bytes.size()) +
                " bytes is not a multiple of the record size " + std::to_string(size));
        }
        std::vector<Record> records(size == 0 ? 0 : bytes.size() / size);
        for (std::size_t i = 0; i < records.size(); ++i) {
            decodeFrom(bytes.subspan(i * size, size), records[i]);
        }
        return records;
    }

    void setByteInspector(ByteInspector inspector) { inspector_ = std::move(inspector); }

    std::size_t recordSize() const { return layout_->totalLength(); }
    const RecordLayout& layout() const { return *layout_; }
    const std::shared_ptr<const RecordLayout>& layoutPtr() const { return layout_; }
    const std::vector<MemberCodec<Record>>& members() const { return members_; }

private:
    void encodeInto(const Record& record, std::span<std::byte> buffer) const
    {
        for (const auto& member : members_) {
            try {
                member.encode(record, buffer);
            } catch (const EncodingError&) {
                throw;
            } catch (const Error& e) {
                std::throw_with_nested(EncodingError(member.name(), e.what()));
            }
        }
    }

    void decodeFrom(std::span<const std::byte> buffer, Record& record) const
    {
        for (const auto& member : members_) {
            try {
                member.decode(buffer, record);
            } catch (const EncodingError&) {
                throw;
            } catch (const Error& e) {
                std::throw_with_nested(EncodingError(member.name(), e.what()));
            }
        }
    }

    void inspect(std::span<const std::byte> buffer) const
    {
        if (inspector_) {
            inspector_(buffer);
        }
    }

    std::shared_ptr<const RecordLayout> layout_;
    std::vector<MemberCodec<Record>> members_;
    ByteInspector inspector_;
};

}  // namespace h5cx
