#pragma once

#include "array.metadata.hh"
#include "blosc.compression.params.hh"
#include "store.hh"
#include "xzarrguard.common.hh"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace xzarrguard {
/**
 * @brief An in-memory N-dimensional array with the metadata needed to store it
 * as a Zarr v3 array.
 */
struct Variable
{
    /// Store-relative path of the array, '/'-separated.
    std::string name;
    std::vector<uint64_t> shape;
    std::vector<uint64_t> chunk_shape;
    XzgDataType data_type{ XzgDataType_float64 };
    nlohmann::json fill_value = 0;
    ChunkKeyEncoding chunk_key_encoding{ ChunkKeyEncoding::Default };
    char separator{ '/' };
    std::vector<std::string> dimension_names;
    nlohmann::json attributes = nlohmann::json::object();

    /// Overrides the dataset's compression when set.
    std::optional<BloscCompressionParams> compression;

    /// Elements in C order, little-endian.
    std::vector<std::byte> data;

    size_t n_elements() const;
    size_t bytes_per_element() const;

    /// @brief Bytes of one full, unclipped chunk.
    size_t bytes_per_chunk() const;

    /**
     * @brief Check the variable for consistency.
     * @throw xzarrguard::Error with XzgStatusCode_InvalidShape if the shape and
     * chunk shape disagree, or XzgStatusCode_InvalidArgument if the name, fill
     * value, dimension names or data size are invalid.
     */
    void validate() const;

    /// @brief The layout of this variable, as read back from its metadata.
    ArraySpec spec() const;

    /**
     * @brief The fill value encoded as one element.
     * @throw xzarrguard::Error with XzgStatusCode_InvalidArgument if the fill
     * value cannot be represented in the data type.
     */
    std::vector<std::byte> fill_bytes() const;

    /**
     * @brief Copy a chunk out of the array. The parts of an edge chunk that lie
     * outside the array are set to the fill value.
     * @return bytes_per_chunk() bytes.
     */
    std::vector<std::byte> chunk_data(const ChunkCoordinate& coord) const;

    /**
     * @brief Copy the part of a full chunk that lies inside the array into the
     * array.
     * @param coord The chunk's coordinate.
     * @param chunk bytes_per_chunk() bytes.
     */
    void set_chunk_data(const ChunkCoordinate& coord,
                        std::span<const std::byte> chunk);
};

struct Dataset
{
    nlohmann::json attributes = nlohmann::json::object();

    /// Compression for variables that do not set their own.
    std::optional<BloscCompressionParams> compression;
    std::vector<Variable> variables;

    /// @brief Find a variable by name, or nullptr.
    const Variable* find(std::string_view name) const;

    /**
     * @brief Check every variable, and that no two variables share a name or
     * nest inside one another.
     * @throw xzarrguard::Error as for Variable::validate, or
     * XzgStatusCode_InvalidArgument for conflicting names.
     */
    void validate() const;
};

/**
 * @brief Load every array of a Zarr v3 store into memory.
 * @details Arrays must use the "bytes" codec, little-endian, optionally
 * followed by "blosc". Each variable keeps its own compression, so the
 * dataset-wide compression is left unset. Chunks absent from the store read
 * as the fill value.
 * Group attributes of the root become the dataset's attributes.
 * @throw xzarrguard::Error with XzgStatusCode_StoreUnreadable if the store
 * cannot be read, XzgStatusCode_InvalidArgument for unsupported data types
 * or codecs, or XzgStatusCode_CompressionError for an undecodable chunk.
 */
Dataset
read_dataset(const Store& store);
} // namespace xzarrguard
