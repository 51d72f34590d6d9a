#pragma once

#include "integrity.report.hh"
#include "store.hh"

#include <string_view>
#include <thread>

namespace xzarrguard {
struct S3Settings;

struct CheckOptions
{
    /// Fail variables with stale manifest entries.
    bool strict_stale{ false };

    /// Attach a timing breakdown to the report.
    bool timing{ false };

    /// Number of threads used for presence checks.
    unsigned int n_threads{ std::thread::hardware_concurrency() };

    /// Number of chunks whose presence is checked per batch.
    size_t batch_size{ 4096 };
};

/**
 * @brief Check that every chunk of every array in @p store is present, or
 * sanctioned as missing by the array's manifest.
 * @details The store is never modified. A failure confined to one variable,
 * such as a corrupt manifest, is recorded on that variable and the remaining
 * variables are still checked. A failure to discover the arrays of the store
 * is recorded as a store-level error.
 */
IntegrityReport
check_store(const Store& store, const CheckOptions& options = {});

/**
 * @brief Check the store at @p location, a local directory or an s3:// URL.
 * @details A missing location, a location that is not a directory, or an S3
 * location that cannot be opened is reported as a store-level error.
 */
IntegrityReport
check_store(std::string_view location,
            const CheckOptions& options = {},
            const S3Settings* s3_settings = nullptr);
} // namespace xzarrguard
