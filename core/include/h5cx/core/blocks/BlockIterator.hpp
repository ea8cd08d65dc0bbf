#pragma once

#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "h5cx/core/blocks/BlockPlanner.hpp"

namespace h5cx
{

/** @brief A block's data together with where it came from */
template <typename V>
struct DataBlock {
    std::vector<std::uint64_t> index;
    std::vector<std::uint64_t> offset;
    V data;
};

/**
 * @brief Row-major multi-axis counter over a block grid.
 *
 * The last axis varies fastest. Starts at all zeros, or exhausted when any
 * axis has no blocks.
 */
class BlockCursor
{
public:
    enum class State { Ready, Exhausted };

    explicit BlockCursor(std::vector<std::uint64_t> counts);

    State state() const { return state_; }
    bool ready() const { return state_ == State::Ready; }
    const std::vector<std::uint64_t>& index() const { return index_; }
    const std::vector<std::uint64_t>& counts() const { return counts_; }

    /** Step to the next index; carrying out of axis 0 exhausts the cursor */
    State advance();

private:
    std::vector<std::uint64_t> counts_;
    std::vector<std::uint64_t> index_;
    State state_;
};

/**
 * @brief Visits every block of a dataset once, in row-major grid order.
 *
 * Each step plans the block at the cursor, hands it to the reader and
 * returns the result. The iterator is single pass and cannot be restarted.
 *
 * @code
 * BlockIterator<xt::xarray<float>> it(extent, [&](const BlockDescriptor& b) {
 *     return dataset.readBlock<float>(b.offset, b.shape);
 * });
 * while (it.hasNext()) {
 *     auto block = it.next();
 * }
 * @endcode
 */
template <typename V>
class BlockIterator
{
public:
    using BlockReader = std::function<V(const BlockDescriptor&)>;
    using State = BlockCursor::State;

    /** Iterate the natural blocks of the extent */
    BlockIterator(DatasetExtent extent, BlockReader reader)
        : BlockIterator(extent, naturalBlockShape(extent), std::move(reader))
    {
    }

    /** Iterate blocks of an explicit shape */
    BlockIterator(DatasetExtent extent, std::vector<std::uint32_t> blockShape, BlockReader reader)
        : extent_(std::move(extent))
        , blockShape_(std::move(blockShape))
        , cursor_(blockCounts(extent_, blockShape_))
        , reader_(std::move(reader))
    {
    }

    bool hasNext() const { return cursor_.ready(); }
    State state() const { return cursor_.state(); }

    /** Grid index of the block next() returns */
    const std::vector<std::uint64_t>& index() const { return cursor_.index(); }

    State advance() { return cursor_.advance(); }

    /**
     * @brief Read the current block and move past it.
     *
     * If the reader throws, the cursor stays on the failed block.
     *
     * @throws std::out_of_range if the iterator is exhausted
     */
    DataBlock<V> next()
    {
        if (!cursor_.ready()) {
            throw std::out_of_range("block iterator is exhausted");
        }
        auto block = planBlock(extent_, blockShape_, BlockNumber{cursor_.index()});
        DataBlock<V> result{block.index, block.offset, reader_(block)};
        cursor_.advance();
        return result;
    }

    const DatasetExtent& extent() const { return extent_; }
    const std::vector<std::uint32_t>& blockShape() const { return blockShape_; }
    std::uint64_t blockCount() const { return totalBlockCount(extent_, blockShape_); }

private:
    DatasetExtent extent_;
    std::vector<std::uint32_t> blockShape_;
    BlockCursor cursor_;
    BlockReader reader_;
};

/**
 * @brief Single-pass range over a BlockIterator, for range-for loops.
 *
 * @code
 * for (auto& block : dataset.naturalBlocks<float>()) {
 *     process(block.offset, block.data);
 * }
 * @endcode
 */
template <typename V>
class NaturalBlocks
{
public:
    class iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = DataBlock<V>;
        using difference_type = std::ptrdiff_t;
        using pointer = DataBlock<V>*;
        using reference = DataBlock<V>&;

        iterator() = default;
        explicit iterator(NaturalBlocks* range) : range_(range) {}

        reference operator*() const { return *range_->current_; }
        pointer operator->() const { return &*range_->current_; }

        iterator& operator++()
        {
            range_->fetch();
            return *this;
        }

        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& it, std::default_sentinel_t)
        {
            return !it.range_ || !it.range_->current_;
        }

    private:
        NaturalBlocks* range_ = nullptr;
    };

    explicit NaturalBlocks(BlockIterator<V> blocks) : blocks_(std::move(blocks)) {}

    NaturalBlocks(const NaturalBlocks&) = delete;
    NaturalBlocks& operator=(const NaturalBlocks&) = delete;

    iterator begin()
    {
        if (!started_) {
            started_ = true;
            fetch();
        }
        return iterator(this);
    }

    std::default_sentinel_t end() const { return {}; }

    std::uint64_t blockCount() const { return blocks_.blockCount(); }

private:
    friend bool operator==(const iterator& it, std::default_sentinel_t);

    void fetch()
    {
        if (blocks_.hasNext()) {
            current_ = blocks_.next();
        } else {
            current_.reset();
        }
    }

    BlockIterator<V> blocks_;
    std::optional<DataBlock<V>> current_;
    bool started_ = false;
};

}  // namespace h5cx
