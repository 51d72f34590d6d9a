#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xzarrguard {
/**
 * @brief Read-only view of a key/value store holding a Zarr hierarchy.
 * @details Keys are '/'-separated and relative to the store root. Every
 * operation throws xzarrguard::Error with XzgStatusCode_StoreUnreadable when
 * the underlying storage cannot be queried; a key that simply does not exist
 * is not an error.
 */
class Store
{
  public:
    virtual ~Store() = default;

    /// @brief Human-readable location of the store, e.g. a path or s3:// URL.
    virtual std::string location() const = 0;

    /**
     * @brief Check whether a key exists, without reading its contents.
     * @details Safe to call concurrently from several threads.
     */
    [[nodiscard]] virtual bool exists(std::string_view key) const = 0;

    /// @brief Read the full value of a key, or nullopt if it does not exist.
    [[nodiscard]] virtual std::optional<std::string> read(
      std::string_view key) const = 0;

    /**
     * @brief List the immediate children of a prefix.
     * @param prefix A key prefix without trailing separator; empty for the
     * root.
     * @return The names (not full keys) of the child nodes, sorted.
     */
    [[nodiscard]] virtual std::vector<std::string> list_children(
      std::string_view prefix) const = 0;
};

/// @brief Join two key segments with '/', skipping empty segments.
std::string
join_key(std::string_view prefix, std::string_view name);

struct S3Settings;

/**
 * @brief Open a store by location.
 * @param location A filesystem path, optionally prefixed with "file://", or an
 * "s3://<bucket>/<prefix>" URL.
 * @param s3_settings Endpoint and credentials, required for s3:// locations.
 * @param n_connections Number of S3 connections to pool.
 * @throw xzarrguard::Error with XzgStatusCode_InvalidArgument if an s3://
 * location is given without settings, or XzgStatusCode_StoreUnreadable if the
 * bucket cannot be reached.
 */
std::unique_ptr<Store>
open_store(std::string_view location,
           const S3Settings* s3_settings = nullptr,
           size_t n_connections = 1);
} // namespace xzarrguard
