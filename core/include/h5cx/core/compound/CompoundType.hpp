#pragma once

#include <memory>
#include <string>

#include "h5cx/core/compound/LayoutPlanner.hpp"
#include "h5cx/core/compound/RecordCodec.hpp"
#include "h5cx/core/h5/Handle.hpp"

namespace h5cx
{

/**
 * @brief A record layout bound to its HDF5 types in one container.
 *
 * The storage type is the committed, named type used when creating
 * datasets; the native type describes the codec's buffers in memory.
 * Owned by the container's TypeRegistry and invalid once the container
 * is closed.
 */
class CompoundType
{
public:
    CompoundType(
        std::string name,
        std::shared_ptr<const RecordLayout> layout,
        h5::Handle storageType,
        h5::Handle nativeType)
        : name_(std::move(name))
        , layout_(std::move(layout))
        , storageType_(std::move(storageType))
        , nativeType_(std::move(nativeType))
    {
    }

    CompoundType(const CompoundType&) = delete;
    CompoundType& operator=(const CompoundType&) = delete;

    const std::string& name() const { return name_; }
    const RecordLayout& layout() const { return *layout_; }
    const std::shared_ptr<const RecordLayout>& layoutPtr() const { return layout_; }
    std::size_t recordSize() const { return layout_->totalLength(); }

    hid_t storageTypeId() const { return storageType_.get(); }
    hid_t nativeTypeId() const { return nativeType_.get(); }

    RecordCodec<MapRecord> mapCodec() const { return RecordCodec<MapRecord>::forMap(layout_); }
    RecordCodec<ListRecord> listCodec() const { return RecordCodec<ListRecord>::forList(layout_); }

private:
    std::string name_;
    std::shared_ptr<const RecordLayout> layout_;
    h5::Handle storageType_;
    h5::Handle nativeType_;
};

}  // namespace h5cx
