#include "array.metadata.hh"
#include "macros.hh"

#include <algorithm>

namespace {
constexpr std::string_view metadata_key = "zarr.json";

nlohmann::json
read_metadata(const xzarrguard::Store& store, const std::string& key)
{
    auto text = store.read(key);
    if (!text) {
        return nullptr;
    }

    auto metadata = nlohmann::json::parse(*text,
                                          nullptr, // callback
                                          false    // allow exceptions
    );
    EXPECT_STATUS(!metadata.is_discarded() && metadata.is_object(),
                  XzgStatusCode_StoreUnreadable,
                  "Invalid JSON in ",
                  key);

    return metadata;
}

void
expect_zarr_v3(const nlohmann::json& metadata, std::string_view where)
{
    const auto it = metadata.find("zarr_format");
    EXPECT_STATUS(it != metadata.end() && it->is_number_integer() &&
                    it->get<int64_t>() == 3,
                  XzgStatusCode_StoreUnreadable,
                  "Only zarr_format=3 is supported: ",
                  where);
}

std::string
node_type(const nlohmann::json& metadata)
{
    const auto it = metadata.find("node_type");
    if (it == metadata.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

std::vector<uint64_t>
parse_extents(const nlohmann::json& value,
              std::string_view field,
              std::string_view name)
{
    EXPECT_STATUS(value.is_array(),
                  XzgStatusCode_InvalidShape,
                  "Expected '",
                  field,
                  "' to be an array for '",
                  name,
                  "'");

    std::vector<uint64_t> extents;
    extents.reserve(value.size());
    for (const auto& item : value) {
        EXPECT_STATUS(item.is_number_unsigned() ||
                        (item.is_number_integer() && item.get<int64_t>() >= 0),
                      XzgStatusCode_InvalidShape,
                      "Invalid entry in '",
                      field,
                      "' for '",
                      name,
                      "': ",
                      item.dump());
        extents.push_back(item.get<uint64_t>());
    }

    return extents;
}

void
walk_hierarchy(const xzarrguard::Store& store,
               const std::string& prefix,
               std::vector<xzarrguard::ArraySpec>& specs)
{
    for (const auto& child : store.list_children(prefix)) {
        if (child == xzarrguard::guard_directory || child == metadata_key) {
            continue;
        }

        const auto path = xzarrguard::join_key(prefix, child);
        const auto meta_key = xzarrguard::join_key(path, metadata_key);
        const auto metadata = read_metadata(store, meta_key);

        if (metadata.is_null()) {
            // not a node; arrays may still live further down
            walk_hierarchy(store, path, specs);
            continue;
        }

        expect_zarr_v3(metadata, meta_key);
        if (node_type(metadata) == "array") {
            specs.push_back(xzarrguard::parse_array_metadata(path, metadata));
        } else {
            walk_hierarchy(store, path, specs);
        }
    }
}
} // namespace

xzarrguard::ArraySpec
xzarrguard::parse_array_metadata(std::string_view name,
                                 const nlohmann::json& metadata)
{
    expect_zarr_v3(metadata, name);
    EXPECT_STATUS(node_type(metadata) == "array",
                  XzgStatusCode_StoreUnreadable,
                  "Node '",
                  name,
                  "' is not an array");

    ArraySpec spec;
    spec.name = name;
    spec.metadata = metadata;

    EXPECT_STATUS(metadata.contains("shape"),
                  XzgStatusCode_InvalidShape,
                  "Missing shape for '",
                  name,
                  "'");
    spec.shape = parse_extents(metadata["shape"], "shape", name);

    const auto grid = metadata.value("chunk_grid", nlohmann::json::object());
    EXPECT_STATUS(grid.is_object() && grid.value("name", "") == "regular",
                  XzgStatusCode_StoreUnreadable,
                  "Only regular chunk grids are supported: '",
                  name,
                  "'");

    const auto grid_config =
      grid.value("configuration", nlohmann::json::object());
    EXPECT_STATUS(grid_config.is_object() && grid_config.contains("chunk_shape"),
                  XzgStatusCode_InvalidShape,
                  "Missing chunk shape for '",
                  name,
                  "'");
    spec.chunk_shape =
      parse_extents(grid_config["chunk_shape"], "chunk_shape", name);

    EXPECT_STATUS(spec.shape.size() == spec.chunk_shape.size(),
                  XzgStatusCode_InvalidShape,
                  "Shape/chunk rank mismatch for '",
                  name,
                  "'");
    EXPECT_STATUS(std::all_of(spec.chunk_shape.begin(),
                              spec.chunk_shape.end(),
                              [](uint64_t c) { return c > 0; }),
                  XzgStatusCode_InvalidShape,
                  "Chunk sizes must be positive for '",
                  name,
                  "'");

    auto encoding = metadata.value(
      "chunk_key_encoding",
      nlohmann::json{ { "name", "default" },
                      { "configuration", { { "separator", "/" } } } });
    EXPECT_STATUS(encoding.is_object(),
                  XzgStatusCode_StoreUnreadable,
                  "Invalid chunk_key_encoding for '",
                  name,
                  "'");

    const auto encoding_name = encoding.value("name", "default");
    if (encoding_name == "default") {
        spec.chunk_key_encoding = ChunkKeyEncoding::Default;
        spec.separator = '/';
    } else if (encoding_name == "v2") {
        spec.chunk_key_encoding = ChunkKeyEncoding::V2;
        spec.separator = '.';
    } else {
        EXPECT_STATUS(false,
                      XzgStatusCode_StoreUnreadable,
                      "Unsupported chunk_key_encoding '",
                      encoding_name,
                      "' for '",
                      name,
                      "'");
    }

    const auto encoding_config =
      encoding.value("configuration", nlohmann::json::object());
    if (encoding_config.is_object() && encoding_config.contains("separator")) {
        const auto& separator = encoding_config["separator"];
        EXPECT_STATUS(separator.is_string() &&
                        (separator == "/" || separator == "."),
                      XzgStatusCode_StoreUnreadable,
                      "Separator can only be '/' or '.' for '",
                      name,
                      "'");
        spec.separator = separator.get<std::string>().front();
    }

    return spec;
}

std::vector<xzarrguard::ArraySpec>
xzarrguard::scan_array_specs(const Store& store)
{
    std::vector<ArraySpec> specs;

    const auto root = read_metadata(store, std::string(metadata_key));
    if (!root.is_null()) {
        expect_zarr_v3(root, metadata_key);

        if (node_type(root) == "array") {
            specs.push_back(parse_array_metadata("", root));
            return specs;
        }

        const auto consolidated = root.find("consolidated_metadata");
        if (consolidated != root.end() && consolidated->is_object() &&
            consolidated->contains("metadata") &&
            (*consolidated)["metadata"].is_object()) {
            LOG_DEBUG("Using consolidated metadata for ", store.location());
            for (const auto& [name, metadata] :
                 (*consolidated)["metadata"].items()) {
                EXPECT_STATUS(metadata.is_object(),
                              XzgStatusCode_StoreUnreadable,
                              "Invalid consolidated metadata for '",
                              name,
                              "'");
                expect_zarr_v3(metadata, name);
                if (node_type(metadata) == "array") {
                    specs.push_back(parse_array_metadata(name, metadata));
                }
            }

            std::sort(specs.begin(),
                      specs.end(),
                      [](const ArraySpec& a, const ArraySpec& b) {
                          return a.name < b.name;
                      });
            return specs;
        }
    }

    walk_hierarchy(store, "", specs);

    std::sort(
      specs.begin(), specs.end(), [](const ArraySpec& a, const ArraySpec& b) {
          return a.name < b.name;
      });
    return specs;
}
