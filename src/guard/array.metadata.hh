#pragma once

#include "store.hh"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace xzarrguard {
/// @brief Directory, relative to the store root, reserved for xzarrguard.
inline constexpr std::string_view guard_directory = ".xzarrguard";

enum class ChunkKeyEncoding
{
    Default,
    V2,
};

/**
 * @brief The parts of a Zarr v3 array's metadata needed to locate its chunks.
 */
struct ArraySpec
{
    /// Store-relative path of the array node, '/'-joined. Empty for a root
    /// array.
    std::string name;
    std::vector<uint64_t> shape;
    std::vector<uint64_t> chunk_shape;
    ChunkKeyEncoding chunk_key_encoding{ ChunkKeyEncoding::Default };
    char separator{ '/' };

    /// The array's full zarr.json document.
    nlohmann::json metadata;

    size_t ndims() const { return shape.size(); }
};

/**
 * @brief Parse the zarr.json document of an array node.
 * @param name The store-relative path of the array.
 * @param metadata The parsed zarr.json document.
 * @throw xzarrguard::Error with XzgStatusCode_StoreUnreadable if the document
 * is not Zarr v3 array metadata with a regular chunk grid and a supported
 * chunk key encoding, or XzgStatusCode_InvalidShape if the shape or chunk
 * shape is malformed.
 */
ArraySpec
parse_array_metadata(std::string_view name, const nlohmann::json& metadata);

/**
 * @brief Find every array in a Zarr v3 store.
 * @details Inline consolidated metadata in the root zarr.json is used when
 * present. Otherwise the hierarchy is walked from the root, without
 * descending into array nodes (so chunk directories are never scanned) or
 * into the reserved guard directory.
 * @return The arrays, sorted by name.
 * @throw xzarrguard::Error with XzgStatusCode_StoreUnreadable if a metadata
 * document is unreadable, is not JSON, or is not Zarr v3.
 */
std::vector<ArraySpec>
scan_array_specs(const Store& store);
} // namespace xzarrguard
