#include "h5cx/core/blocks/BlockPlanner.hpp"

#include "h5cx/core/util/Errors.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace h5cx
{

bool DatasetExtent::isUnlimited(std::size_t axis) const
{
    return maxDimensions && axis < maxDimensions->size() && (*maxDimensions)[axis] == kUnlimited;
}

std::uint64_t DatasetExtent::elementCount() const
{
    std::uint64_t n = 1;
    for (auto d : dimensions) {
        n *= d;
    }
    return n;
}

std::uint64_t BlockDescriptor::elementCount() const
{
    std::uint64_t n = 1;
    for (auto s : shape) {
        n *= s;
    }
    return n;
}

namespace
{

void checkRank(const DatasetExtent& extent, std::size_t rank, const char* what)
{
    if (rank != extent.rank()) {
        throw OutOfBoundsError(
            std::string(what) + " has rank " + std::to_string(rank) + ", dataset has rank " +
            std::to_string(extent.rank()));
    }
}

void checkBlockShape(const DatasetExtent& extent, const std::vector<std::uint32_t>& blockShape)
{
    checkRank(extent, blockShape.size(), "block shape");
    for (std::size_t i = 0; i < blockShape.size(); ++i) {
        if (blockShape[i] == 0) {
            throw OutOfBoundsError("block shape is zero on axis " + std::to_string(i));
        }
    }
}

}  // namespace

BlockDescriptor planBlock(
    const DatasetExtent& extent,
    const std::vector<std::uint32_t>& blockShape,
    const BlockSelector& selector)
{
    checkBlockShape(extent, blockShape);

    const auto rank = extent.rank();
    BlockDescriptor block;
    block.index.resize(rank);
    block.offset.resize(rank);
    block.shape.resize(rank);

    if (const auto* number = std::get_if<BlockNumber>(&selector)) {
        checkRank(extent, number->number.size(), "block number");
        for (std::size_t i = 0; i < rank; ++i) {
            if (number->number[i] > std::numeric_limits<std::uint64_t>::max() / blockShape[i]) {
                throw OutOfBoundsError(
                    "block number " + std::to_string(number->number[i]) + " on axis " +
                    std::to_string(i) + " has no representable offset");
            }
            block.index[i] = number->number[i];
            block.offset[i] = number->number[i] * blockShape[i];
        }
    } else {
        const auto& offset = std::get<BlockOffset>(selector).offset;
        checkRank(extent, offset.size(), "block offset");
        for (std::size_t i = 0; i < rank; ++i) {
            block.index[i] = offset[i] / blockShape[i];
            block.offset[i] = offset[i];
        }
    }

    for (std::size_t i = 0; i < rank; ++i) {
        const auto dim = extent.dimensions[i];
        const auto start = block.offset[i];
        if (start >= dim) {
            if (!extent.isUnlimited(i)) {
                throw OutOfBoundsError(
                    "block offset " + std::to_string(start) + " is outside axis " +
                    std::to_string(i) + " of size " + std::to_string(dim));
            }
            if (start > std::numeric_limits<std::uint64_t>::max() - blockShape[i]) {
                throw OutOfBoundsError(
                    "block at offset " + std::to_string(start) + " on axis " +
                    std::to_string(i) + " ends past the largest extent");
            }
            block.shape[i] = blockShape[i];
            continue;
        }
        block.shape[i] = static_cast<std::uint32_t>(
            std::min<std::uint64_t>(dim - start, blockShape[i]));
    }

    return block;
}

std::vector<std::uint32_t> naturalBlockShape(const DatasetExtent& extent)
{
    if (extent.chunkShape) {
        checkRank(extent, extent.chunkShape->size(), "chunk shape");
        return *extent.chunkShape;
    }

    std::vector<std::uint32_t> shape(extent.rank());
    for (std::size_t i = 0; i < extent.rank(); ++i) {
        const auto dim = extent.dimensions[i];
        if (dim > std::numeric_limits<std::uint32_t>::max()) {
            throw OutOfBoundsError(
                "axis " + std::to_string(i) + " of size " + std::to_string(dim) +
                " is too large for a single block");
        }
        // an empty axis still gets a valid block extent; it yields no blocks
        shape[i] = std::max<std::uint32_t>(static_cast<std::uint32_t>(dim), 1);
    }
    return shape;
}

std::vector<std::uint64_t> blockCounts(
    const DatasetExtent& extent, const std::vector<std::uint32_t>& blockShape)
{
    checkBlockShape(extent, blockShape);

    std::vector<std::uint64_t> counts(extent.rank());
    for (std::size_t i = 0; i < extent.rank(); ++i) {
        const auto dim = extent.dimensions[i];
        counts[i] = dim / blockShape[i] + (dim % blockShape[i] != 0 ? 1 : 0);
    }
    return counts;
}

std::uint64_t totalBlockCount(
    const DatasetExtent& extent, const std::vector<std::uint32_t>& blockShape)
{
    std::uint64_t total = 1;
    for (auto count : blockCounts(extent, blockShape)) {
        total *= count;
    }
    return total;
}

}  // namespace h5cx
