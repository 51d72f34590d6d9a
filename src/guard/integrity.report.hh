#pragma once

#include "xzarrguard.common.hh"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace xzarrguard {
struct ChunkRef
{
    ChunkCoordinate coord;
    std::string key;
};

enum class StaleReason
{
    KeyMismatch,
    OutOfGrid,
    Present,
};

const char*
stale_reason_to_string(StaleReason reason);

/// @brief A manifest entry that no longer describes the store.
struct StaleEntry
{
    ChunkCoordinate coord;
    std::string key;
    StaleReason reason;
};

struct VariableIntegrity
{
    std::string name;
    bool ok{ true };
    bool has_manifest{ false };
    uint64_t expected_chunks{ 0 };

    /// Absent chunks not sanctioned by a manifest, in grid order.
    std::vector<ChunkRef> missing;

    /// Absent chunks sanctioned by a manifest, in grid order.
    std::vector<ChunkRef> missing_allowed;
    std::vector<StaleEntry> stale;

    /// Set when the variable could not be checked.
    std::optional<std::string> error;

    nlohmann::json to_json() const;
};

struct VariableTiming
{
    double manifest_seconds{ 0 };
    double chunk_scan_seconds{ 0 };
    uint64_t exists_calls{ 0 };
};

struct IntegrityTiming
{
    double total_seconds{ 0 };
    double scan_specs_seconds{ 0 };
    double manifest_seconds{ 0 };
    double chunk_scan_seconds{ 0 };
    uint64_t exists_calls{ 0 };
    std::map<std::string, VariableTiming> variables;

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of checking a store for completeness.
 * @details The report is ok when there are no store-level errors and every
 * variable is ok.
 */
struct IntegrityReport
{
    std::string store_path;
    bool strict_stale{ false };
    bool ok{ true };

    /// Failures that prevented checking the store as a whole.
    std::vector<std::string> errors;

    /// Variables with a manifest but no array in the store.
    std::vector<std::string> orphan_manifests;
    std::map<std::string, VariableIntegrity> variables;
    std::optional<IntegrityTiming> timing;

    explicit operator bool() const noexcept { return ok; }

    nlohmann::json to_json() const;
};
} // namespace xzarrguard
