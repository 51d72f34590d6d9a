#pragma once

#include "store.hh"
#include "xzarrguard.common.hh"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace xzarrguard {
inline constexpr int manifest_schema_version = 1;
inline constexpr int manifest_zarr_format = 3;

/// @brief A chunk whose absence is sanctioned, with the key it had when the
/// manifest was written.
struct ManifestEntry
{
    ChunkCoordinate coord;
    std::string key;

    bool operator==(const ManifestEntry&) const = default;
};

struct Manifest
{
    int schema_version{ manifest_schema_version };
    int zarr_format{ manifest_zarr_format };
    std::string variable;
    std::vector<ManifestEntry> allowed_missing;
};

/// @brief Chunk coordinates declared as no-data, by variable name.
using NoDataChunks = std::map<std::string, std::set<ChunkCoordinate>>;

/**
 * @brief Store-relative key of the manifest for @p variable:
 * ".xzarrguard/manifests/<percent-encoded variable>.json".
 */
std::string
manifest_key(std::string_view variable);

/// @brief Filesystem path of the manifest for @p variable in a local store.
std::filesystem::path
manifest_path(const std::filesystem::path& store_root,
              std::string_view variable);

/**
 * @brief List the variables that have a manifest in @p store.
 * @return Decoded variable names, sorted.
 */
std::vector<std::string>
list_manifest_variables(const Store& store);

nlohmann::json
to_json(const Manifest& manifest);

/**
 * @brief Parse and validate a manifest document.
 * @param text The document.
 * @param variable The variable the manifest is expected to describe.
 * @throw xzarrguard::Error with XzgStatusCode_ManifestCorrupt if the document
 * is not valid JSON, lacks or mistypes a field, has an unsupported
 * schema_version or zarr_format, describes another variable, or repeats a
 * coordinate.
 */
Manifest
parse_manifest(std::string_view text, std::string_view variable);

/**
 * @brief Load the manifest for @p variable.
 * @return The manifest, or nullopt if the variable has none.
 * @throw xzarrguard::Error with XzgStatusCode_ManifestCorrupt as for
 * parse_manifest, or XzgStatusCode_StoreUnreadable if the store fails.
 */
std::optional<Manifest>
load_manifest(const Store& store, std::string_view variable);

/**
 * @brief Atomically write a manifest into a local store, replacing any
 * previous manifest for the same variable.
 * @return The path of the manifest file.
 * @throw xzarrguard::Error with XzgStatusCode_InvalidCoordinate if two entries
 * share a coordinate, or XzgStatusCode_IOError if the file cannot be written.
 */
std::filesystem::path
save_manifest(const std::filesystem::path& store_root,
              const Manifest& manifest);

/**
 * @brief Parse a no-data declaration: a JSON object mapping variable names to
 * arrays of chunk coordinates. Coordinates are deduplicated.
 * @throw xzarrguard::Error with XzgStatusCode_InvalidArgument if the document
 * is not a JSON object of arrays, or XzgStatusCode_InvalidCoordinate if a
 * coordinate is not an array of non-negative integers.
 */
NoDataChunks
parse_no_data_chunks(std::string_view text);

/// @brief Read a no-data declaration file. See parse_no_data_chunks.
NoDataChunks
load_no_data_chunks(const std::filesystem::path& path);

/// @brief Write a no-data declaration file, sorted by variable and coordinate.
void
dump_no_data_chunks(const std::filesystem::path& path,
                    const NoDataChunks& no_data_chunks);
} // namespace xzarrguard
