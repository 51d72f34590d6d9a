#pragma once

#include "xzarrguard.common.hh"

#include <cstddef>
#include <iterator>
#include <vector>

namespace xzarrguard {
/**
 * @brief The regular grid of chunks covering an array.
 * @details Iterating a ChunkGrid yields every chunk coordinate in row-major
 * order (last dimension fastest). Coordinates are generated on the fly, so a
 * grid can be iterated any number of times without materializing it.
 */
class ChunkGrid
{
  public:
    class Iterator
    {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ChunkCoordinate;
        using difference_type = std::ptrdiff_t;
        using pointer = const ChunkCoordinate*;
        using reference = const ChunkCoordinate&;

        Iterator() = default;

        reference operator*() const { return coord_; }
        pointer operator->() const { return &coord_; }

        Iterator& operator++();
        Iterator operator++(int);

        bool operator==(const Iterator& other) const
        {
            return index_ == other.index_;
        }
        bool operator!=(const Iterator& other) const
        {
            return !(*this == other);
        }

      private:
        friend class ChunkGrid;
        Iterator(const ChunkGrid* grid, uint64_t index);

        const ChunkGrid* grid_{ nullptr };
        uint64_t index_{ 0 };
        ChunkCoordinate coord_;
    };

    /**
     * @throw xzarrguard::Error with XzgStatusCode_InvalidShape if the ranks
     * differ or a chunk size is zero.
     */
    ChunkGrid(std::vector<uint64_t> shape, std::vector<uint64_t> chunk_shape);

    size_t ndims() const { return shape_.size(); }
    const std::vector<uint64_t>& shape() const { return shape_; }
    const std::vector<uint64_t>& chunk_shape() const { return chunk_shape_; }

    /// @brief Number of chunks along each dimension.
    const std::vector<uint64_t>& chunks_per_dimension() const
    {
        return chunks_per_dim_;
    }

    /// @brief Total number of chunks. One for a rank-0 array.
    uint64_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    /// @brief Whether @p coord has the grid's rank and lies inside it.
    bool contains(const ChunkCoordinate& coord) const;

    Iterator begin() const;
    Iterator end() const;

  private:
    std::vector<uint64_t> shape_;
    std::vector<uint64_t> chunk_shape_;
    std::vector<uint64_t> chunks_per_dim_;
    uint64_t size_;
};
} // namespace xzarrguard
