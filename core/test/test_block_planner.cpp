#include "test.hpp"

#include "h5cx/core/blocks/BlockPlanner.hpp"
#include "h5cx/core/util/Errors.hpp"

#include <limits>

using namespace h5cx;

namespace {

DatasetExtent extent1d(std::uint64_t n)
{
    DatasetExtent e;
    e.dimensions = {n};
    return e;
}

}  // namespace

TEST(BlockPlanner, OneDimensionalGrid)
{
    auto e = extent1d(10);
    std::vector<std::uint32_t> block{4};

    auto b0 = planBlock(e, block, BlockNumber{{0}});
    auto b1 = planBlock(e, block, BlockNumber{{1}});
    auto b2 = planBlock(e, block, BlockNumber{{2}});

    EXPECT_EQ(b0.offset[0], 0u);
    EXPECT_EQ(b0.shape[0], 4u);
    EXPECT_EQ(b1.offset[0], 4u);
    EXPECT_EQ(b1.shape[0], 4u);
    EXPECT_EQ(b2.offset[0], 8u);
    EXPECT_EQ(b2.shape[0], 2u);
    EXPECT_EQ(b2.elementCount(), 2u);

    EXPECT_THROW(planBlock(e, block, BlockNumber{{3}}), OutOfBoundsError);
}

TEST(BlockPlanner, OffsetSelectorGetsGridIndex)
{
    DatasetExtent e;
    e.dimensions = {100, 50};
    std::vector<std::uint32_t> block{32, 32};

    auto b = planBlock(e, block, BlockOffset{{70, 40}});
    EXPECT_EQ(b.index[0], 2u);
    EXPECT_EQ(b.index[1], 1u);
    EXPECT_EQ(b.offset[0], 70u);
    EXPECT_EQ(b.offset[1], 40u);
    EXPECT_EQ(b.shape[0], 30u);
    EXPECT_EQ(b.shape[1], 10u);
}

TEST(BlockPlanner, ClipsOnEveryAxis)
{
    DatasetExtent e;
    e.dimensions = {5, 7, 9};
    std::vector<std::uint32_t> block{2, 3, 4};

    auto b = planBlock(e, block, BlockNumber{{2, 2, 2}});
    EXPECT_EQ(b.shape[0], 1u);
    EXPECT_EQ(b.shape[1], 1u);
    EXPECT_EQ(b.shape[2], 1u);
    EXPECT_EQ(b.elementCount(), 1u);
}

TEST(BlockPlanner, UnlimitedAxisKeepsFullBlock)
{
    DatasetExtent e;
    e.dimensions = {10, 4};
    e.chunkShape = std::vector<std::uint32_t>{8, 4};
    e.maxDimensions = std::vector<std::uint64_t>{kUnlimited, 4};
    EXPECT_TRUE(e.isUnlimited(0));
    EXPECT_FALSE(e.isUnlimited(1));

    auto past = planBlock(e, *e.chunkShape, BlockOffset{{16, 0}});
    EXPECT_EQ(past.shape[0], 8u);
    EXPECT_EQ(past.shape[1], 4u);

    // still clipped when it starts inside the current extent
    auto last = planBlock(e, *e.chunkShape, BlockNumber{{1, 0}});
    EXPECT_EQ(last.shape[0], 2u);

    BlockSelector boundedEnd = BlockOffset{{0, 4}};
    EXPECT_THROW(planBlock(e, *e.chunkShape, boundedEnd), OutOfBoundsError);
}

TEST(BlockPlanner, RejectsBadSelectors)
{
    DatasetExtent e;
    e.dimensions = {10, 10};
    std::vector<std::uint32_t> block{5, 5};
    std::vector<std::uint32_t> wrongRank{5};
    std::vector<std::uint32_t> zero{5, 0};

    BlockSelector origin = BlockNumber{{0, 0}};
    BlockSelector shortNumber = BlockNumber{{0}};
    BlockSelector pastEnd = BlockOffset{{10, 0}};

    EXPECT_THROW(planBlock(e, wrongRank, origin), OutOfBoundsError);
    EXPECT_THROW(planBlock(e, zero, origin), OutOfBoundsError);
    EXPECT_THROW(planBlock(e, block, shortNumber), OutOfBoundsError);
    EXPECT_THROW(planBlock(e, block, pastEnd), OutOfBoundsError);
}

TEST(BlockPlanner, HugeSelectorsDoNotWrap)
{
    std::vector<std::uint32_t> block{4};
    BlockSelector huge = BlockNumber{{std::uint64_t{1} << 62}};
    EXPECT_THROW(planBlock(extent1d(10), block, huge), OutOfBoundsError);

    DatasetExtent unlimited = extent1d(10);
    unlimited.maxDimensions = std::vector<std::uint64_t>{kUnlimited};
    EXPECT_THROW(planBlock(unlimited, block, huge), OutOfBoundsError);

    const auto top = std::numeric_limits<std::uint64_t>::max();
    BlockSelector nearTop = BlockOffset{{top - 1}};
    EXPECT_THROW(planBlock(unlimited, block, nearTop), OutOfBoundsError);

    // an axis reaching the largest extent clips instead of wrapping
    DatasetExtent full = extent1d(top);
    BlockSelector lastRow = BlockOffset{{top - 2}};
    auto tail = planBlock(full, block, lastRow);
    EXPECT_EQ(tail.offset[0], top - 2);
    EXPECT_EQ(tail.shape[0], 2u);
    EXPECT_EQ(blockCounts(full, block)[0], top / 4 + 1);
}

TEST(BlockPlanner, NaturalBlockShape)
{
    DatasetExtent chunked;
    chunked.dimensions = {100, 100};
    chunked.chunkShape = std::vector<std::uint32_t>{16, 32};
    auto fromChunks = naturalBlockShape(chunked);
    std::vector<std::uint32_t> expectedChunks{16, 32};
    EXPECT_EQ(fromChunks, expectedChunks);

    DatasetExtent contiguous;
    contiguous.dimensions = {12, 0};
    auto whole = naturalBlockShape(contiguous);
    std::vector<std::uint32_t> expectedWhole{12, 1};
    EXPECT_EQ(whole, expectedWhole);

    DatasetExtent huge = extent1d(std::uint64_t{1} << 33);
    EXPECT_THROW(naturalBlockShape(huge), OutOfBoundsError);
}

TEST(BlockPlanner, BlockCounts)
{
    DatasetExtent e;
    e.dimensions = {10, 8, 0};
    std::vector<std::uint32_t> block{4, 8, 3};

    auto counts = blockCounts(e, block);
    std::vector<std::uint64_t> expected{3, 1, 0};
    EXPECT_EQ(counts, expected);
    EXPECT_EQ(totalBlockCount(e, block), 0u);

    e.dimensions = {10, 8, 7};
    EXPECT_EQ(totalBlockCount(e, block), 9u);
}
