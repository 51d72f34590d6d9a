#include "manifest.hh"
#include "array.metadata.hh"
#include "file.sink.hh"
#include "macros.hh"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {
constexpr std::string_view manifest_directory = "manifests";
constexpr std::string_view manifest_suffix = ".json";

std::optional<xzarrguard::ChunkCoordinate>
parse_coordinate(const nlohmann::json& value)
{
    if (!value.is_array()) {
        return std::nullopt;
    }

    xzarrguard::ChunkCoordinate coord;
    coord.reserve(value.size());
    for (const auto& item : value) {
        if (item.is_number_unsigned()) {
            coord.push_back(item.get<uint64_t>());
        } else if (item.is_number_integer() && item.get<int64_t>() >= 0) {
            coord.push_back(static_cast<uint64_t>(item.get<int64_t>()));
        } else {
            return std::nullopt;
        }
    }

    return coord;
}

bool
is_integer_equal_to(const nlohmann::json& document,
                    std::string_view field,
                    int expected)
{
    const auto it = document.find(field);
    return it != document.end() && it->is_number_integer() &&
           it->get<int64_t>() == expected;
}

std::string
read_text_file(const fs::path& path)
{
    std::ifstream ifs(path, std::ios::binary);
    EXPECT_STATUS(ifs.is_open(),
                  XzgStatusCode_IOError,
                  "Failed to open '",
                  path.string(),
                  "' for reading");

    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}
} // namespace

std::string
xzarrguard::manifest_key(std::string_view variable)
{
    return join_key(join_key(guard_directory, manifest_directory),
                    percent_encode(variable) + std::string(manifest_suffix));
}

fs::path
xzarrguard::manifest_path(const fs::path& store_root, std::string_view variable)
{
    return store_root / fs::path(manifest_key(variable));
}

std::vector<std::string>
xzarrguard::list_manifest_variables(const Store& store)
{
    std::vector<std::string> variables;
    for (const auto& name :
         store.list_children(join_key(guard_directory, manifest_directory))) {
        if (!name.ends_with(manifest_suffix)) {
            continue;
        }

        const auto stem = std::string_view(name).substr(
          0, name.size() - manifest_suffix.size());
        try {
            variables.push_back(percent_decode(stem));
        } catch (const Error& exc) {
            LOG_WARNING("Ignoring manifest file '", name, "': ", exc.what());
        }
    }

    std::sort(variables.begin(), variables.end());
    return variables;
}

nlohmann::json
xzarrguard::to_json(const Manifest& manifest)
{
    using json = nlohmann::json;

    json entries = json::array();
    for (const auto& entry : manifest.allowed_missing) {
        entries.push_back(json::object({
          { "coord", entry.coord },
          { "key", entry.key },
        }));
    }

    return json::object({
      { "schema_version", manifest.schema_version },
      { "zarr_format", manifest.zarr_format },
      { "variable", manifest.variable },
      { "allowed_missing", entries },
    });
}

xzarrguard::Manifest
xzarrguard::parse_manifest(std::string_view text, std::string_view variable)
{
    const auto document = nlohmann::json::parse(text,
                                                nullptr, // callback
                                                false    // allow exceptions
    );
    EXPECT_STATUS(!document.is_discarded() && document.is_object(),
                  XzgStatusCode_ManifestCorrupt,
                  "Manifest for '",
                  variable,
                  "' is not a JSON object");

    EXPECT_STATUS(
      is_integer_equal_to(document, "schema_version", manifest_schema_version),
      XzgStatusCode_ManifestCorrupt,
      "Unsupported manifest schema_version for '",
      variable,
      "'");
    EXPECT_STATUS(
      is_integer_equal_to(document, "zarr_format", manifest_zarr_format),
      XzgStatusCode_ManifestCorrupt,
      "Unsupported manifest zarr_format for '",
      variable,
      "'");

    const auto name = document.find("variable");
    EXPECT_STATUS(name != document.end() && name->is_string(),
                  XzgStatusCode_ManifestCorrupt,
                  "Manifest for '",
                  variable,
                  "' has no variable name");
    EXPECT_STATUS(name->get<std::string>() == variable,
                  XzgStatusCode_ManifestCorrupt,
                  "Manifest for '",
                  variable,
                  "' describes '",
                  name->get<std::string>(),
                  "'");

    const auto entries = document.find("allowed_missing");
    EXPECT_STATUS(entries != document.end() && entries->is_array(),
                  XzgStatusCode_ManifestCorrupt,
                  "Manifest for '",
                  variable,
                  "' has no allowed_missing array");

    Manifest manifest;
    manifest.variable = variable;

    std::set<ChunkCoordinate> seen;
    for (const auto& item : *entries) {
        EXPECT_STATUS(item.is_object() && item.contains("coord") &&
                        item.contains("key") && item["key"].is_string(),
                      XzgStatusCode_ManifestCorrupt,
                      "Malformed entry in manifest for '",
                      variable,
                      "': ",
                      item.dump());

        auto coord = parse_coordinate(item["coord"]);
        EXPECT_STATUS(coord.has_value(),
                      XzgStatusCode_ManifestCorrupt,
                      "Invalid coordinate in manifest for '",
                      variable,
                      "': ",
                      item["coord"].dump());
        EXPECT_STATUS(seen.insert(*coord).second,
                      XzgStatusCode_ManifestCorrupt,
                      "Duplicate coordinate ",
                      to_string(*coord),
                      " in manifest for '",
                      variable,
                      "'");

        manifest.allowed_missing.push_back(
          { std::move(*coord), item["key"].get<std::string>() });
    }

    return manifest;
}

std::optional<xzarrguard::Manifest>
xzarrguard::load_manifest(const Store& store, std::string_view variable)
{
    const auto key = manifest_key(variable);
    const auto text = store.read(key);
    if (!text) {
        return std::nullopt;
    }

    LOG_DEBUG("Loaded manifest ", key);
    return parse_manifest(*text, variable);
}

fs::path
xzarrguard::save_manifest(const fs::path& store_root, const Manifest& manifest)
{
    std::set<ChunkCoordinate> seen;
    for (const auto& entry : manifest.allowed_missing) {
        EXPECT_STATUS(seen.insert(entry.coord).second,
                      XzgStatusCode_InvalidCoordinate,
                      "Duplicate coordinate ",
                      to_string(entry.coord),
                      " in manifest for '",
                      manifest.variable,
                      "'");
    }

    const auto path = manifest_path(store_root, manifest.variable);
    write_file(path.string(), to_json(manifest).dump(2) + "\n");

    LOG_DEBUG("Wrote manifest ", path.string());
    return path;
}

xzarrguard::NoDataChunks
xzarrguard::parse_no_data_chunks(std::string_view text)
{
    const auto document = nlohmann::json::parse(text,
                                                nullptr, // callback
                                                false    // allow exceptions
    );
    EXPECT_STATUS(!document.is_discarded() && document.is_object(),
                  XzgStatusCode_InvalidArgument,
                  "No-data mapping must be an object");

    NoDataChunks no_data_chunks;
    for (const auto& [variable, coords] : document.items()) {
        EXPECT_STATUS(coords.is_array(),
                      XzgStatusCode_InvalidArgument,
                      "No-data chunks for '",
                      variable,
                      "' must be an array");

        auto& declared = no_data_chunks[variable];
        for (const auto& item : coords) {
            auto coord = parse_coordinate(item);
            EXPECT_STATUS(coord.has_value(),
                          XzgStatusCode_InvalidCoordinate,
                          "Invalid no-data coordinate for '",
                          variable,
                          "': ",
                          item.dump());
            declared.insert(std::move(*coord));
        }
    }

    return no_data_chunks;
}

xzarrguard::NoDataChunks
xzarrguard::load_no_data_chunks(const fs::path& path)
{
    return parse_no_data_chunks(read_text_file(path));
}

void
xzarrguard::dump_no_data_chunks(const fs::path& path,
                                const NoDataChunks& no_data_chunks)
{
    auto document = nlohmann::json::object();
    for (const auto& [variable, coords] : no_data_chunks) {
        auto& entries = document[variable] = nlohmann::json::array();
        for (const auto& coord : coords) {
            entries.push_back(coord);
        }
    }

    write_file(path.string(), document.dump(2) + "\n");
}
