#pragma once

#include "dataset.hh"
#include "integrity.report.hh"
#include "manifest.hh"
#include "xzarrguard.types.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace xzarrguard {
/**
 * @brief Parse a no-data strategy name, "manifest" or "empty_chunks".
 * @throw xzarrguard::Error with XzgStatusCode_UnsupportedStrategy for any other
 * name.
 */
XzgNoDataStrategy
parse_no_data_strategy(std::string_view name);

const char*
no_data_strategy_to_string(XzgNoDataStrategy strategy);

struct CreateOptions
{
    /// Replace an existing target.
    bool overwrite{ false };

    /// Number of threads used for chunk writes and the final check.
    unsigned int n_threads{ std::thread::hardware_concurrency() };
};

struct CreateReport
{
    std::string store_path;
    XzgNoDataStrategy strategy{ XzgNoDataStrategy_Manifest };
    std::vector<std::string> manifests_written;

    /// Declared no-data chunks left out of the store, by variable.
    std::map<std::string, std::vector<ChunkRef>> absent_chunks;
    size_t chunks_written{ 0 };

    nlohmann::json to_json() const;
};

/**
 * @brief Write @p dataset as a Zarr v3 store, applying a policy to the chunks
 * declared as no-data.
 * @details With XzgNoDataStrategy_Manifest the declared chunks are not written
 * and each affected variable gets a manifest sanctioning their absence. With
 * XzgNoDataStrategy_EmptyChunks the declared chunks are written filled with
 * the fill value and no manifest is written. Manifests are only written after
 * every chunk has been written. The new store is checked before returning.
 * @throw xzarrguard::Error with XzgStatusCode_InvalidArgument if a declared
 * variable is not in the dataset, XzgStatusCode_InvalidCoordinate if a declared
 * coordinate is outside its variable's grid,
 * XzgStatusCode_UnsupportedStrategy for an unknown strategy,
 * XzgStatusCode_IOError if the target exists and @p options does not allow
 * overwriting it or a write fails, and XzgStatusCode_InternalError if the new
 * store fails its check.
 */
CreateReport
create_store(const Dataset& dataset,
             const std::filesystem::path& target_path,
             const NoDataChunks& no_data_chunks,
             XzgNoDataStrategy strategy = XzgNoDataStrategy_Manifest,
             const CreateOptions& options = {});
} // namespace xzarrguard
