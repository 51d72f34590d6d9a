#include "store.creator.hh"
#include "array.writer.hh"
#include "chunk.grid.hh"
#include "chunk.key.hh"
#include "file.sink.hh"
#include "integrity.checker.hh"
#include "macros.hh"

#include <algorithm>
#include <set>

namespace fs = std::filesystem;

namespace {
void
write_group_metadata(const fs::path& group_path,
                     const nlohmann::json& attributes)
{
    const nlohmann::json metadata = {
        { "zarr_format", 3 },
        { "node_type", "group" },
        { "attributes", attributes },
    };

    xzarrguard::write_file((group_path / "zarr.json").string(),
                           metadata.dump(2) + "\n");
}

void
validate_no_data_chunks(const xzarrguard::Dataset& dataset,
                        const xzarrguard::NoDataChunks& no_data_chunks)
{
    std::vector<std::string> unknown;
    for (const auto& [name, coords] : no_data_chunks) {
        if (dataset.find(name) == nullptr) {
            unknown.push_back(name);
        }
    }

    if (!unknown.empty()) {
        std::string names;
        for (const auto& name : unknown) {
            names += (names.empty() ? "" : ", ") + name;
        }
        EXPECT_STATUS(false,
                      XzgStatusCode_InvalidArgument,
                      "Unknown variables in no-data chunks: ",
                      names);
    }

    for (const auto& [name, coords] : no_data_chunks) {
        const auto* variable = dataset.find(name);
        const xzarrguard::ChunkGrid grid(variable->shape,
                                         variable->chunk_shape);
        for (const auto& coord : coords) {
            EXPECT_STATUS(grid.contains(coord),
                          XzgStatusCode_InvalidCoordinate,
                          "Chunk coordinate ",
                          xzarrguard::to_string(coord),
                          " is out of bounds for variable '",
                          name,
                          "'");
        }
    }
}

void
prepare_target(const fs::path& target_path, bool overwrite)
{
    std::error_code ec;
    if (fs::exists(target_path, ec)) {
        EXPECT_STATUS(overwrite,
                      XzgStatusCode_IOError,
                      "Store already exists: ",
                      target_path.string());

        fs::remove_all(target_path, ec);
        EXPECT_STATUS(!ec,
                      XzgStatusCode_IOError,
                      "Failed to remove '",
                      target_path.string(),
                      "': ",
                      ec.message());
    }

    fs::create_directories(target_path, ec);
    EXPECT_STATUS(!ec,
                  XzgStatusCode_IOError,
                  "Failed to create '",
                  target_path.string(),
                  "': ",
                  ec.message());
}
} // namespace

XzgNoDataStrategy
xzarrguard::parse_no_data_strategy(std::string_view name)
{
    for (int i = 0; i < XzgNoDataStrategyCount; ++i) {
        const auto strategy = static_cast<XzgNoDataStrategy>(i);
        if (name == no_data_strategy_to_string(strategy)) {
            return strategy;
        }
    }

    EXPECT_STATUS(false,
                  XzgStatusCode_UnsupportedStrategy,
                  "No-data strategy must be 'manifest' or 'empty_chunks', got '",
                  name,
                  "'");
    return XzgNoDataStrategyCount; // unreachable
}

const char*
xzarrguard::no_data_strategy_to_string(XzgNoDataStrategy strategy)
{
    switch (strategy) {
        case XzgNoDataStrategy_Manifest:
            return "manifest";
        case XzgNoDataStrategy_EmptyChunks:
            return "empty_chunks";
        default:
            return "(unknown)";
    }
}

nlohmann::json
xzarrguard::CreateReport::to_json() const
{
    auto absent = nlohmann::json::object();
    for (const auto& [name, chunks] : absent_chunks) {
        auto& refs = absent[name] = nlohmann::json::array();
        for (const auto& chunk : chunks) {
            refs.push_back({ { "coord", chunk.coord }, { "key", chunk.key } });
        }
    }

    return {
        { "store_path", store_path },
        { "no_data_strategy", no_data_strategy_to_string(strategy) },
        { "manifests_written", manifests_written },
        { "absent_chunks", absent },
        { "chunks_written", chunks_written },
    };
}

xzarrguard::CreateReport
xzarrguard::create_store(const Dataset& dataset,
                         const fs::path& target_path,
                         const NoDataChunks& no_data_chunks,
                         XzgNoDataStrategy strategy,
                         const CreateOptions& options)
{
    EXPECT_STATUS(strategy == XzgNoDataStrategy_Manifest ||
                    strategy == XzgNoDataStrategy_EmptyChunks,
                  XzgStatusCode_UnsupportedStrategy,
                  "Unsupported no-data strategy: ",
                  static_cast<int>(strategy));
    EXPECT_STATUS(!target_path.empty(),
                  XzgStatusCode_InvalidArgument,
                  "Target path must not be empty");

    dataset.validate();
    validate_no_data_chunks(dataset, no_data_chunks);
    prepare_target(target_path, options.overwrite);

    CreateReport report;
    report.store_path = target_path.string();
    report.strategy = strategy;

    // the root group, then every group between the root and an array
    write_group_metadata(target_path, dataset.attributes);

    std::set<std::string> groups;
    for (const auto& variable : dataset.variables) {
        for (auto pos = variable.name.find('/'); pos != std::string::npos;
             pos = variable.name.find('/', pos + 1)) {
            groups.insert(variable.name.substr(0, pos));
        }
    }
    for (const auto& group : groups) {
        write_group_metadata(target_path / fs::path(group),
                             nlohmann::json::object());
    }

    auto thread_pool = std::make_shared<ThreadPool>(
      options.n_threads,
      [](const std::string& err) { LOG_ERROR("Error: ", err); });

    for (const auto& variable : dataset.variables) {
        ArrayWriterConfig config{
            .store_path = target_path,
            .compression_params = variable.compression ? variable.compression
                                                       : dataset.compression,
        };

        if (const auto it = no_data_chunks.find(variable.name);
            it != no_data_chunks.end()) {
            if (strategy == XzgNoDataStrategy_Manifest) {
                config.skipped_chunks = it->second;
            } else {
                config.fill_chunks = it->second;
            }
        }

        ArrayWriter writer(variable, std::move(config), thread_pool);
        writer.write_array_metadata();
        report.chunks_written += writer.write_chunks();
    }

    if (strategy == XzgNoDataStrategy_Manifest) {
        for (const auto& [name, coords] : no_data_chunks) {
            if (coords.empty()) {
                continue;
            }

            const auto spec = dataset.find(name)->spec();

            Manifest manifest;
            manifest.variable = name;
            auto& absent = report.absent_chunks[name];
            for (const auto& coord : coords) {
                const auto key = chunk_key(spec, coord);
                manifest.allowed_missing.push_back({ coord, key });
                absent.push_back({ coord, key });
            }

            report.manifests_written.push_back(
              save_manifest(target_path, manifest).string());
        }
    }

    CheckOptions check_options;
    check_options.n_threads = options.n_threads;
    const auto integrity = check_store(target_path.string(), check_options);
    EXPECT_STATUS(integrity.ok,
                  XzgStatusCode_InternalError,
                  "Created store failed integrity validation: ",
                  integrity.to_json().dump());

    LOG_INFO("Created ",
             report.store_path,
             " with ",
             report.chunks_written,
             " chunks and ",
             report.manifests_written.size(),
             " manifests");
    return report;
}
