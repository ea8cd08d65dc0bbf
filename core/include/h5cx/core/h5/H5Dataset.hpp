#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include <hdf5.h>
#include <xtensor/containers/xarray.hpp>

#include "h5cx/core/blocks/BlockIterator.hpp"
#include "h5cx/core/blocks/BlockPlanner.hpp"
#include "h5cx/core/compound/CompoundType.hpp"
#include "h5cx/core/compound/RecordCodec.hpp"
#include "h5cx/core/h5/Handle.hpp"
#include "h5cx/core/util/Errors.hpp"

namespace h5cx
{

/**
 * @brief An open HDF5 dataset with block-wise I/O.
 *
 * Obtained from H5File. The file must stay open while the dataset is used,
 * and a NaturalBlocks range must not outlive the dataset it came from.
 */
class H5Dataset
{
public:
    H5Dataset(h5::Handle dataset, std::string path);

    H5Dataset(const H5Dataset&) = delete;
    H5Dataset& operator=(const H5Dataset&) = delete;
    H5Dataset(H5Dataset&&) noexcept = default;
    H5Dataset& operator=(H5Dataset&&) noexcept = default;

    const std::string& path() const { return path_; }
    hid_t id() const { return dataset_.get(); }

    /** @brief Current dimensions, maximum dimensions and chunk shape */
    DatasetExtent extent() const;

    /**
     * @brief Grow (or shrink) the dataset to new dimensions.
     * @throws StorageError if the dataset is not chunked or a dimension
     * exceeds its maximum
     */
    void extend(const std::vector<std::uint64_t>& dimensions);

    /**
     * @brief Read a hyperslab into a new array of the given shape.
     * @throws OutOfBoundsError if the region leaves the dataset
     */
    template <typename T>
    xt::xarray<T> readBlock(
        const std::vector<std::uint64_t>& offset,
        const std::vector<std::uint32_t>& shape) const;

    /**
     * @brief Write an array at an offset.
     *
     * The dataset is extended first when the array reaches past its
     * current end; a failed write restores the previous extent.
     *
     * @throws OutOfBoundsError if the array leaves the maximum extent
     */
    template <typename T>
    void writeBlock(const xt::xarray<T>& data, const std::vector<std::uint64_t>& offset);

    /**
     * @brief Read block number blockNumber of a grid of blockShape blocks.
     *
     * The last block of each axis is clipped to the dataset.
     */
    template <typename T>
    DataBlock<xt::xarray<T>> readArrayBlock(
        const std::vector<std::uint32_t>& blockShape,
        const std::vector<std::uint64_t>& blockNumber) const
    {
        auto block = planBlock(extent(), blockShape, BlockNumber{blockNumber});
        return {block.index, block.offset, readBlock<T>(block.offset, block.shape)};
    }

    /** @brief All natural blocks (chunks) of the dataset, in row-major order */
    template <typename T>
    NaturalBlocks<xt::xarray<T>> naturalBlocks() const
    {
        return NaturalBlocks<xt::xarray<T>>(BlockIterator<xt::xarray<T>>(
            extent(), [this](const BlockDescriptor& b) { return readBlock<T>(b.offset, b.shape); }));
    }

    // --- Compound records (one-dimensional datasets) ---

    /**
     * @brief Encode records and write them starting at element offset.
     * @throws EncodingError if a record cannot be encoded
     * @throws OutOfBoundsError if the records reach past the current extent
     */
    template <typename Record>
    void writeRecords(
        const CompoundType& type,
        const RecordCodec<Record>& codec,
        std::span<const std::type_identity_t<Record>> records,
        std::uint64_t offset = 0)
    {
        checkRecordAccess(type, codec.recordSize());
        if (records.empty()) {
            return;
        }
        auto bytes = codec.byteify(records);
        writeRaw(type.nativeTypeId(), {offset}, {records.size()}, bytes.data());
    }

    /** @brief Read count records starting at element offset */
    template <typename Record>
    std::vector<Record> readRecords(
        const CompoundType& type,
        const RecordCodec<Record>& codec,
        std::uint64_t offset,
        std::uint64_t count) const
    {
        checkRecordAccess(type, codec.recordSize());
        return readRecordsRaw(type.nativeTypeId(), codec, offset, count);
    }

    /**
     * @brief The natural blocks of a compound dataset, decoded.
     *
     * The type and codec are captured; the type must stay registered
     * while the range is used.
     */
    template <typename Record>
    NaturalBlocks<std::vector<Record>> naturalRecordBlocks(
        const CompoundType& type, RecordCodec<Record> codec) const
    {
        checkRecordAccess(type, codec.recordSize());
        hid_t nativeType = type.nativeTypeId();
        return NaturalBlocks<std::vector<Record>>(BlockIterator<std::vector<Record>>(
            extent(), [this, nativeType, codec = std::move(codec)](const BlockDescriptor& b) {
                return readRecordsRaw(nativeType, codec, b.offset[0], b.shape[0]);
            }));
    }

private:
    void readRaw(
        hid_t memType,
        const std::vector<std::uint64_t>& offset,
        const std::vector<std::uint64_t>& shape,
        void* buffer) const;

    void writeRaw(
        hid_t memType,
        const std::vector<std::uint64_t>& offset,
        const std::vector<std::uint64_t>& shape,
        const void* buffer);

    void checkRecordAccess(const CompoundType& type, std::size_t codecSize) const;

    template <typename Record>
    std::vector<Record> readRecordsRaw(
        hid_t nativeType,
        const RecordCodec<Record>& codec,
        std::uint64_t offset,
        std::uint64_t count) const
    {
        std::vector<std::byte> bytes(codec.recordSize() * count);
        if (count > 0) {
            readRaw(nativeType, {offset}, {count}, bytes.data());
        }
        return codec.arrayify(bytes);
    }

    h5::Handle dataset_;
    std::string path_;
};

#define H5CX_DATASET_EXTERN(T)                                              \
    extern template xt::xarray<T> H5Dataset::readBlock<T>(                  \
        const std::vector<std::uint64_t>&, const std::vector<std::uint32_t>&) const; \
    extern template void H5Dataset::writeBlock<T>(                          \
        const xt::xarray<T>&, const std::vector<std::uint64_t>&);

H5CX_DATASET_EXTERN(std::int8_t)
H5CX_DATASET_EXTERN(std::int16_t)
H5CX_DATASET_EXTERN(std::int32_t)
H5CX_DATASET_EXTERN(std::int64_t)
H5CX_DATASET_EXTERN(std::uint8_t)
H5CX_DATASET_EXTERN(std::uint16_t)
H5CX_DATASET_EXTERN(std::uint32_t)
H5CX_DATASET_EXTERN(std::uint64_t)
H5CX_DATASET_EXTERN(float)
H5CX_DATASET_EXTERN(double)

#undef H5CX_DATASET_EXTERN

}  // namespace h5cx
