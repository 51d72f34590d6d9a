#include "integrity.checker.hh"
#include "array.metadata.hh"
#include "chunk.grid.hh"
#include "chunk.key.hh"
#include "file.store.hh"
#include "macros.hh"
#include "manifest.hh"
#include "s3.connection.hh"
#include "thread.pool.hh"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <latch>
#include <map>
#include <set>

namespace fs = std::filesystem;

namespace {
using Clock = std::chrono::steady_clock;

double
seconds_since(Clock::time_point start)
{
    return std::chrono::duration<double>(Clock::now() - start).count();
}

/**
 * @brief Query the presence of each key, spreading the queries over the
 * pool's threads.
 * @return One flag per key, in the order of @p keys.
 * @throw xzarrguard::Error with XzgStatusCode_StoreUnreadable if any query
 * fails.
 */
std::vector<uint8_t>
query_presence(const xzarrguard::Store& store,
               const std::vector<std::string>& keys,
               xzarrguard::ThreadPool& thread_pool)
{
    std::vector<uint8_t> present(keys.size(), 0);
    if (keys.empty()) {
        return present;
    }

    const size_t n_jobs = std::min(thread_pool.n_threads(), keys.size());
    const size_t keys_per_job = (keys.size() + n_jobs - 1) / n_jobs;

    std::vector<std::string> errors(n_jobs);
    std::latch latch(n_jobs);
    for (auto j = 0; j < n_jobs; ++j) {
        const size_t begin = j * keys_per_job;
        const size_t end = std::min(begin + keys_per_job, keys.size());

        EXPECT(
          thread_pool.push_job(
            [&store, &keys, &present, &errors, &latch, begin, end, j](
              std::string& err) -> bool {
                bool success = false;
                try {
                    for (auto i = begin; i < end; ++i) {
                        present[i] = store.exists(keys[i]) ? 1 : 0;
                    }
                    success = true;
                } catch (const std::exception& exc) {
                    err = exc.what();
                    errors[j] = err;
                }
                latch.count_down();

                return success;
            }),
          "Failed to push to job queue");
    }

    // wait for all threads to finish
    latch.wait();

    for (const auto& error : errors) {
        EXPECT_STATUS(error.empty(),
                      XzgStatusCode_StoreUnreadable,
                      "Presence check failed: ",
                      error);
    }

    return present;
}

void
check_variable(const xzarrguard::Store& store,
               const xzarrguard::ArraySpec& spec,
               const xzarrguard::CheckOptions& options,
               xzarrguard::ThreadPool& thread_pool,
               xzarrguard::VariableIntegrity& variable,
               xzarrguard::VariableTiming& timing)
{
    using namespace xzarrguard;

    const ChunkGrid grid(spec.shape, spec.chunk_shape);
    variable.expected_chunks = grid.size();

    auto start = Clock::now();
    const auto manifest = load_manifest(store, spec.name);
    variable.has_manifest = manifest.has_value();

    // entries that still describe a chunk of the current grid
    std::map<ChunkCoordinate, const ManifestEntry*> sanctioned;
    // in-grid entries whose key no longer matches; already recorded as stale
    std::set<ChunkCoordinate> mismatched;
    if (manifest) {
        for (const auto& entry : manifest->allowed_missing) {
            if (!grid.contains(entry.coord)) {
                variable.stale.push_back(
                  { entry.coord, entry.key, StaleReason::OutOfGrid });
            } else if (entry.key != chunk_key(spec, entry.coord)) {
                variable.stale.push_back(
                  { entry.coord, entry.key, StaleReason::KeyMismatch });
                mismatched.insert(entry.coord);
            } else {
                sanctioned.emplace(entry.coord, &entry);
            }
        }
    }
    timing.manifest_seconds = seconds_since(start);

    start = Clock::now();
    const size_t batch_size = std::max<size_t>(options.batch_size, 1);

    std::vector<ChunkCoordinate> coords;
    std::vector<std::string> keys;
    coords.reserve(std::min<uint64_t>(batch_size, grid.size()));
    keys.reserve(coords.capacity());

    auto classify_batch = [&] {
        const auto present = query_presence(store, keys, thread_pool);
        timing.exists_calls += keys.size();

        for (auto i = 0; i < coords.size(); ++i) {
            const auto it = sanctioned.find(coords[i]);
            const bool is_sanctioned = it != sanctioned.end();

            if (!present[i] && is_sanctioned) {
                variable.missing_allowed.push_back(
                  { std::move(coords[i]), std::move(keys[i]) });
            } else if (!present[i] && !mismatched.contains(coords[i])) {
                variable.missing.push_back(
                  { std::move(coords[i]), std::move(keys[i]) });
            } else if (is_sanctioned) {
                variable.stale.push_back({ it->second->coord,
                                           it->second->key,
                                           StaleReason::Present });
            }
        }

        coords.clear();
        keys.clear();
    };

    for (const auto& coord : grid) {
        keys.push_back(chunk_key(spec, coord));
        coords.push_back(coord);
        if (coords.size() == batch_size) {
            classify_batch();
        }
    }
    if (!coords.empty()) {
        classify_batch();
    }
    timing.chunk_scan_seconds = seconds_since(start);

    variable.ok = variable.missing.empty() &&
                  !(options.strict_stale && !variable.stale.empty());
}
} // namespace

xzarrguard::IntegrityReport
xzarrguard::check_store(const Store& store, const CheckOptions& options)
{
    const auto start = Clock::now();

    IntegrityReport report;
    report.store_path = store.location();
    report.strict_stale = options.strict_stale;

    IntegrityTiming timing;

    std::vector<ArraySpec> specs;
    try {
        const auto scan_start = Clock::now();
        specs = scan_array_specs(store);
        timing.scan_specs_seconds = seconds_since(scan_start);
    } catch (const std::exception& exc) {
        report.errors.emplace_back(exc.what());
    }

    ThreadPool thread_pool(options.n_threads, [](const std::string& err) {
        LOG_ERROR("Presence check failed: ", err);
    });

    for (const auto& spec : specs) {
        VariableIntegrity variable;
        variable.name = spec.name;

        VariableTiming variable_timing;
        try {
            check_variable(
              store, spec, options, thread_pool, variable, variable_timing);
        } catch (const std::exception& exc) {
            LOG_WARNING("Failed to check '", spec.name, "': ", exc.what());
            variable.ok = false;
            variable.error = exc.what();
        }

        timing.manifest_seconds += variable_timing.manifest_seconds;
        timing.chunk_scan_seconds += variable_timing.chunk_scan_seconds;
        timing.exists_calls += variable_timing.exists_calls;
        timing.variables.emplace(spec.name, variable_timing);

        report.variables.emplace(spec.name, std::move(variable));
    }

    if (report.errors.empty()) {
        try {
            for (auto& name : list_manifest_variables(store)) {
                if (!report.variables.contains(name)) {
                    LOG_WARNING("Manifest for '", name, "' has no array");
                    report.orphan_manifests.push_back(std::move(name));
                }
            }
        } catch (const std::exception& exc) {
            LOG_WARNING("Failed to list manifests: ", exc.what());
        }
    }

    report.ok = report.errors.empty() &&
                std::all_of(report.variables.begin(),
                            report.variables.end(),
                            [](const auto& item) { return item.second.ok; });

    if (options.timing) {
        timing.total_seconds = seconds_since(start);
        report.timing = timing;
    }

    LOG_DEBUG("Checked ",
              report.store_path,
              ": ",
              report.variables.size(),
              " variables, ",
              report.ok ? "PASS" : "FAIL");

    return report;
}

xzarrguard::IntegrityReport
xzarrguard::check_store(std::string_view location,
                        const CheckOptions& options,
                        const S3Settings* s3_settings)
{
    auto failed = [&](std::string message) {
        IntegrityReport report;
        report.store_path = location;
        report.strict_stale = options.strict_stale;
        report.ok = false;
        report.errors.push_back(std::move(message));
        return report;
    };

    if (!location.starts_with("s3://")) {
        auto path = location;
        if (path.starts_with("file://")) {
            path.remove_prefix(7);
        }

        std::error_code ec;
        const auto status = fs::status(fs::path(path), ec);
        if (!fs::exists(status)) {
            return failed("Store does not exist: " + std::string(path));
        }
        if (!fs::is_directory(status)) {
            return failed("Store path is not a directory: " +
                          std::string(path));
        }

        return check_store(FileStore(fs::path(path)), options);
    }

    std::unique_ptr<Store> store;
    try {
        store = open_store(location,
                           s3_settings,
                           std::max(options.n_threads, 1u));
    } catch (const std::exception& exc) {
        return failed(exc.what());
    }

    return check_store(*store, options);
}
