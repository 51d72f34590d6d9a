#pragma once

#include "xzarrguard.types.h"

#define XZARRGUARD_API_VERSION "0.1.0"

#ifdef __cplusplus
extern "C"
{
#endif

    /**
     * @brief Get the version of the xzarrguard API.
     * @return The version of the xzarrguard API.
     */
    const char* Xzg_get_api_version();

    /**
     * @brief Set the log level for the xzarrguard API.
     * @param level The log level.
     * @return XzgStatusCode_Success on success, or an error code on failure.
     */
    XzgStatusCode Xzg_set_log_level(XzgLogLevel level);

    /**
     * @brief Get the log level for the xzarrguard API.
     * @return The log level for the xzarrguard API.
     */
    XzgLogLevel Xzg_get_log_level();

    /**
     * @brief Get the message for the given status code.
     * @param status The status code.
     * @return A human-readable status message.
     */
    const char* Xzg_get_status_message(XzgStatusCode status);

    /**
     * @brief Check that every chunk of every array in a local Zarr v3 store is
     * either present or sanctioned by a no-data manifest.
     * @param[in] store_path Path to the store.
     * @param[in] strict_stale Whether stale manifest entries fail the check.
     * @param[out] ok Set to true if the store is complete, false otherwise.
     * @return XzgStatusCode_Success if the check ran, whatever its verdict,
     * XzgStatusCode_StoreUnreadable if the store could not be read, or another
     * error code on failure.
     */
    XzgStatusCode Xzg_check_store(const char* store_path,
                                  bool strict_stale,
                                  bool* ok);

    /**
     * @brief Copy the arrays of a source Zarr v3 store into a new store,
     * applying a no-data policy.
     * @param[in] source_path Path to the source store.
     * @param[in] target_path Path to the store to create.
     * @param[in] no_data_path Optional path to a JSON file mapping variable
     * names to lists of chunk coordinates. May be NULL.
     * @param[in] strategy How to represent no-data chunks.
     * @param[in] overwrite Whether to replace an existing target.
     * @return XzgStatusCode_Success on success, or an error code on failure.
     */
    XzgStatusCode Xzg_create_store(const char* source_path,
                                   const char* target_path,
                                   const char* no_data_path,
                                   XzgNoDataStrategy strategy,
                                   bool overwrite);

#ifdef __cplusplus
}
#endif
