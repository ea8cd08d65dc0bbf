#include "h5cx/core/blocks/BlockIterator.hpp"

#include <algorithm>

namespace h5cx
{

BlockCursor::BlockCursor(std::vector<std::uint64_t> counts)
    : counts_(std::move(counts))
    , index_(counts_.size(), 0)
    , state_(State::Ready)
{
    if (counts_.empty() ||
        std::any_of(counts_.begin(), counts_.end(), [](auto c) { return c == 0; })) {
        state_ = State::Exhausted;
    }
}

BlockCursor::State BlockCursor::advance()
{
    if (state_ == State::Exhausted) {
        return state_;
    }
    for (std::size_t axis = counts_.size(); axis-- > 0;) {
        if (++index_[axis] < counts_[axis]) {
            return state_;
        }
        index_[axis] = 0;
    }
    state_ = State::Exhausted;
    return state_;
}

}  // namespace h5cx
