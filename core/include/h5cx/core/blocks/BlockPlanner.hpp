#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <variant>
#include <vector>

namespace h5cx
{

/** Marks an axis of DatasetExtent::maxDimensions that can grow without bound */
inline constexpr std::uint64_t kUnlimited = std::numeric_limits<std::uint64_t>::max();

/** @brief Current size and chunking of an N-dimensional dataset */
struct DatasetExtent {
    std::vector<std::uint64_t> dimensions;
    /** absent for contiguous (unchunked) datasets */
    std::optional<std::vector<std::uint32_t>> chunkShape;
    /** absent when the dataset cannot grow */
    std::optional<std::vector<std::uint64_t>> maxDimensions;

    std::size_t rank() const { return dimensions.size(); }
    bool isUnlimited(std::size_t axis) const;
    /** product of the dimensions */
    std::uint64_t elementCount() const;
};

/** @brief One block of a dataset: grid index, start and clipped extent */
struct BlockDescriptor {
    std::vector<std::uint64_t> index;
    std::vector<std::uint64_t> offset;
    std::vector<std::uint32_t> shape;

    std::uint64_t elementCount() const;
};

/** Select a block by its position in the block grid */
struct BlockNumber {
    std::vector<std::uint64_t> number;
};

/** Select a block by the element it starts at */
struct BlockOffset {
    std::vector<std::uint64_t> offset;
};

using BlockSelector = std::variant<BlockNumber, BlockOffset>;

/**
 * @brief Place and clip one block of a dataset.
 *
 * A BlockNumber starts at number * blockShape; a BlockOffset starts where it
 * says and gets the grid index offset / blockShape. On a bounded axis the
 * last block is clipped to dimensions - offset. On an unlimited axis a
 * block starting at or past the current end keeps the full block shape, so
 * that it can be written to grow the dataset.
 *
 * @throws OutOfBoundsError on rank mismatches, a zero block extent, or an
 * offset at or beyond the end of a bounded axis
 */
BlockDescriptor planBlock(
    const DatasetExtent& extent,
    const std::vector<std::uint32_t>& blockShape,
    const BlockSelector& selector);

/**
 * @brief The block shape natural to a dataset's storage.
 *
 * The chunk shape for chunked datasets, otherwise the whole dataset.
 *
 * @throws OutOfBoundsError if an unchunked dimension exceeds the 32-bit
 * block extent range
 */
std::vector<std::uint32_t> naturalBlockShape(const DatasetExtent& extent);

/** Number of blocks per axis, ceil(dimensions / blockShape) */
std::vector<std::uint64_t> blockCounts(
    const DatasetExtent& extent, const std::vector<std::uint32_t>& blockShape);

/** Product of blockCounts() */
std::uint64_t totalBlockCount(
    const DatasetExtent& extent, const std::vector<std::uint32_t>& blockShape);

}  // namespace h5cx
