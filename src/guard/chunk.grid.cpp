#include "chunk.grid.hh"
#include "macros.hh"

#include <algorithm>
#include <limits>

xzarrguard::ChunkGrid::ChunkGrid(std::vector<uint64_t> shape,
                                 std::vector<uint64_t> chunk_shape)
  : shape_{ std::move(shape) }
  , chunk_shape_{ std::move(chunk_shape) }
  , size_{ 1 }
{
    EXPECT_STATUS(shape_.size() == chunk_shape_.size(),
                  XzgStatusCode_InvalidShape,
                  "Shape has rank ",
                  shape_.size(),
                  " but chunk shape has rank ",
                  chunk_shape_.size());

    chunks_per_dim_.reserve(shape_.size());
    for (auto i = 0; i < shape_.size(); ++i) {
        EXPECT_STATUS(chunk_shape_[i] > 0,
                      XzgStatusCode_InvalidShape,
                      "Chunk size along dimension ",
                      i,
                      " must be positive");

        const auto n_chunks =
          chunks_along_dimension(shape_[i], chunk_shape_[i]);
        chunks_per_dim_.push_back(n_chunks);
    }

    if (std::find(chunks_per_dim_.begin(), chunks_per_dim_.end(), 0) !=
        chunks_per_dim_.end()) {
        size_ = 0;
        return;
    }

    for (auto i = 0; i < chunks_per_dim_.size(); ++i) {
        EXPECT_STATUS(size_ <= std::numeric_limits<uint64_t>::max() /
                                 chunks_per_dim_[i],
                      XzgStatusCode_InvalidShape,
                      "Chunk count overflows at dimension ",
                      i);
        size_ *= chunks_per_dim_[i];
    }
}

bool
xzarrguard::ChunkGrid::contains(const ChunkCoordinate& coord) const
{
    if (coord.size() != chunks_per_dim_.size()) {
        return false;
    }

    for (auto i = 0; i < coord.size(); ++i) {
        if (coord[i] >= chunks_per_dim_[i]) {
            return false;
        }
    }

    return true;
}

xzarrguard::ChunkGrid::Iterator
xzarrguard::ChunkGrid::begin() const
{
    return { this, 0 };
}

xzarrguard::ChunkGrid::Iterator
xzarrguard::ChunkGrid::end() const
{
    return { this, size_ };
}

xzarrguard::ChunkGrid::Iterator::Iterator(const ChunkGrid* grid,
                                          uint64_t index)
  : grid_{ grid }
  , index_{ index }
  , coord_(grid->ndims(), 0)
{
}

xzarrguard::ChunkGrid::Iterator&
xzarrguard::ChunkGrid::Iterator::operator++()
{
    ++index_;
    if (index_ >= grid_->size()) {
        index_ = grid_->size();
        return *this;
    }

    // odometer, last dimension fastest
    const auto& counts = grid_->chunks_per_dimension();
    for (auto d = coord_.size(); d > 0; --d) {
        if (++coord_[d - 1] < counts[d - 1]) {
            break;
        }
        coord_[d - 1] = 0;
    }

    return *this;
}

xzarrguard::ChunkGrid::Iterator
xzarrguard::ChunkGrid::Iterator::operator++(int)
{
    Iterator tmp = *this;
    ++(*this);
    return tmp;
}
