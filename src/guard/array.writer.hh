#pragma once

#include "blosc.compression.params.hh"
#include "dataset.hh"
#include "thread.pool.hh"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <set>

namespace xzarrguard {
struct ArrayWriterConfig
{
    std::filesystem::path store_path;
    std::optional<BloscCompressionParams> compression_params;

    /// Chunks that are not written at all.
    std::set<ChunkCoordinate> skipped_chunks;

    /// Chunks written with every element set to the fill value.
    std::set<ChunkCoordinate> fill_chunks;
};

/**
 * @brief Writes one variable as a Zarr v3 array: its zarr.json document and
 * one file per chunk.
 */
class ArrayWriter
{
  public:
    ArrayWriter(const Variable& variable,
                ArrayWriterConfig&& config,
                std::shared_ptr<ThreadPool> thread_pool);

    /// @brief The array's zarr.json document.
    nlohmann::json make_metadata() const;

    /**
     * @brief Write the array's zarr.json.
     * @throw xzarrguard::Error with XzgStatusCode_IOError on failure.
     */
    void write_array_metadata();

    /**
     * @brief Write every chunk of the array that is not skipped, in parallel.
     * @return The number of chunks written.
     * @throw xzarrguard::Error with XzgStatusCode_IOError or
     * XzgStatusCode_CompressionError if any chunk fails.
     */
    size_t write_chunks();

  private:
    const Variable& variable_;
    ArrayWriterConfig config_;
    std::shared_ptr<ThreadPool> thread_pool_;

    std::filesystem::path array_path_() const;
    std::vector<std::byte> encode_chunk_(const ChunkCoordinate& coord) const;
};
} // namespace xzarrguard
