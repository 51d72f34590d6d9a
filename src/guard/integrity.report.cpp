#include "integrity.report.hh"

namespace {
nlohmann::json
chunk_to_json(const xzarrguard::ChunkCoordinate& coord, const std::string& key)
{
    return nlohmann::json::object({ { "coord", coord }, { "key", key } });
}
} // namespace

const char*
xzarrguard::stale_reason_to_string(StaleReason reason)
{
    switch (reason) {
        case StaleReason::KeyMismatch:
            return "key_mismatch";
        case StaleReason::OutOfGrid:
            return "out_of_grid";
        case StaleReason::Present:
            return "present";
    }

    return "unknown";
}

nlohmann::json
xzarrguard::VariableIntegrity::to_json() const
{
    auto missing_json = nlohmann::json::array();
    for (const auto& chunk : missing) {
        missing_json.push_back(chunk_to_json(chunk.coord, chunk.key));
    }

    auto allowed_json = nlohmann::json::array();
    for (const auto& chunk : missing_allowed) {
        allowed_json.push_back(chunk_to_json(chunk.coord, chunk.key));
    }

    auto stale_json = nlohmann::json::array();
    for (const auto& entry : stale) {
        auto item = chunk_to_json(entry.coord, entry.key);
        item["reason"] = stale_reason_to_string(entry.reason);
        stale_json.push_back(item);
    }

    nlohmann::json out = {
        { "ok", ok },
        { "has_manifest", has_manifest },
        { "expected_chunks", expected_chunks },
        { "missing", missing_json },
        { "missing_allowed", allowed_json },
        { "stale", stale_json },
        { "error", nullptr },
    };
    if (error) {
        out["error"] = *error;
    }

    return out;
}

nlohmann::json
xzarrguard::IntegrityTiming::to_json() const
{
    auto per_variable = nlohmann::json::object();
    for (const auto& [name, t] : variables) {
        per_variable[name] = {
            { "manifest_seconds", t.manifest_seconds },
            { "chunk_scan_seconds", t.chunk_scan_seconds },
            { "exists_calls", t.exists_calls },
        };
    }

    return {
        { "total_seconds", total_seconds },
        { "scan_specs_seconds", scan_specs_seconds },
        { "manifest_seconds", manifest_seconds },
        { "chunk_scan_seconds", chunk_scan_seconds },
        { "exists_calls", exists_calls },
        { "variables", per_variable },
    };
}

nlohmann::json
xzarrguard::IntegrityReport::to_json() const
{
    auto variables_json = nlohmann::json::object();
    for (const auto& [name, variable] : variables) {
        variables_json[name] = variable.to_json();
    }

    nlohmann::json out = {
        { "store_path", store_path },
        { "strict_stale", strict_stale },
        { "ok", ok },
        { "errors", errors },
        { "orphan_manifests", orphan_manifests },
        { "variables", variables_json },
    };
    if (timing) {
        out["timing"] = timing->to_json();
    }

    return out;
}
