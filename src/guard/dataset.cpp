#include "dataset.hh"
#include "chunk.grid.hh"
#include "chunk.key.hh"
#include "macros.hh"

#include <algorithm>
#include <cstring>
#include <limits>
#include <set>

namespace {
template<typename T>
std::vector<std::byte>
encode_element(T value)
{
    std::vector<std::byte> out(sizeof(T));
    std::memcpy(out.data(), &value, sizeof(T));
    return out;
}

template<typename T>
std::optional<std::vector<std::byte>>
encode_integer(const nlohmann::json& value)
{
    if (value.is_boolean()) {
        return encode_element(static_cast<T>(value.get<bool>()));
    }

    if (value.is_number_unsigned()) {
        const auto v = value.get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            return std::nullopt;
        }
        return encode_element(static_cast<T>(v));
    }

    if (value.is_number_integer()) {
        const auto v = value.get<int64_t>();
        if (v < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
            (v > 0 &&
             static_cast<uint64_t>(v) >
               static_cast<uint64_t>(std::numeric_limits<T>::max()))) {
            return std::nullopt;
        }
        return encode_element(static_cast<T>(v));
    }

    return std::nullopt;
}

template<typename T>
std::optional<std::vector<std::byte>>
encode_float(const nlohmann::json& value)
{
    if (value.is_number()) {
        return encode_element(static_cast<T>(value.get<double>()));
    }

    if (value.is_string()) {
        const auto s = value.get<std::string>();
        if (s == "NaN") {
            return encode_element(std::numeric_limits<T>::quiet_NaN());
        }
        if (s == "Infinity") {
            return encode_element(std::numeric_limits<T>::infinity());
        }
        if (s == "-Infinity") {
            return encode_element(-std::numeric_limits<T>::infinity());
        }
    }

    return std::nullopt;
}

/**
 * @brief Copy the intersection of a chunk and its array between the array's
 * buffer and a full chunk buffer.
 */
void
copy_chunk_region(const xzarrguard::Variable& variable,
                  const xzarrguard::ChunkCoordinate& coord,
                  std::byte* array,
                  std::byte* chunk,
                  bool to_chunk)
{
    const auto bpe = variable.bytes_per_element();
    const auto& shape = variable.shape;
    const auto& chunk_shape = variable.chunk_shape;
    const auto ndims = shape.size();

    if (ndims == 0) {
        to_chunk ? std::memcpy(chunk, array, bpe)
                 : std::memcpy(array, chunk, bpe);
        return;
    }

    std::vector<uint64_t> origin(ndims), extent(ndims);
    std::vector<uint64_t> array_strides(ndims, 1), chunk_strides(ndims, 1);
    for (auto i = 0; i < ndims; ++i) {
        origin[i] = coord[i] * chunk_shape[i];
        extent[i] = std::min(chunk_shape[i], shape[i] - origin[i]);
    }
    for (auto i = static_cast<int>(ndims) - 2; i >= 0; --i) {
        array_strides[i] = array_strides[i + 1] * shape[i + 1];
        chunk_strides[i] = chunk_strides[i + 1] * chunk_shape[i + 1];
    }

    // copy one run along the last dimension at a time
    const auto bytes_per_run = extent.back() * bpe;
    std::vector<uint64_t> index(ndims, 0);
    while (true) {
        uint64_t array_offset = 0, chunk_offset = 0;
        for (auto i = 0; i < ndims; ++i) {
            array_offset += (origin[i] + index[i]) * array_strides[i];
            chunk_offset += index[i] * chunk_strides[i];
        }

        auto* a = array + array_offset * bpe;
        auto* c = chunk + chunk_offset * bpe;
        to_chunk ? std::memcpy(c, a, bytes_per_run)
                 : std::memcpy(a, c, bytes_per_run);

        auto d = static_cast<int>(ndims) - 2;
        for (; d >= 0; --d) {
            if (++index[d] < extent[d]) {
                break;
            }
            index[d] = 0;
        }
        if (d < 0) {
            break;
        }
    }
}

void
validate_name(std::string_view name)
{
    EXPECT_STATUS(!name.empty(),
                  XzgStatusCode_InvalidArgument,
                  "Variable name must not be empty");

    size_t begin = 0;
    while (begin <= name.size()) {
        const auto end = std::min(name.find('/', begin), name.size());
        const auto segment = name.substr(begin, end - begin);
        EXPECT_STATUS(!segment.empty() && segment != "." && segment != ".." &&
                        segment != "zarr.json",
                      XzgStatusCode_InvalidArgument,
                      "Invalid variable name '",
                      name,
                      "'");
        EXPECT_STATUS(begin > 0 || segment != xzarrguard::guard_directory,
                      XzgStatusCode_InvalidArgument,
                      "Variable name '",
                      name,
                      "' is reserved");
        begin = end + 1;
    }
}

std::vector<std::byte>
decode_chunk(const std::string& encoded,
             const std::optional<xzarrguard::BloscCompressionParams>& blosc,
             size_t expected_size,
             std::string_view key)
{
    const std::span<const std::byte> bytes(
      reinterpret_cast<const std::byte*>(encoded.data()), encoded.size());

    if (blosc) {
        return xzarrguard::blosc_decompress(bytes, expected_size);
    }

    EXPECT_STATUS(bytes.size() == expected_size,
                  XzgStatusCode_StoreUnreadable,
                  "Chunk '",
                  key,
                  "' has ",
                  bytes.size(),
                  " bytes, expected ",
                  expected_size);
    return std::vector<std::byte>(bytes.begin(), bytes.end());
}

std::optional<xzarrguard::BloscCompressionParams>
parse_codecs(const nlohmann::json& codecs, std::string_view name)
{
    EXPECT_STATUS(codecs.is_array() && !codecs.empty(),
                  XzgStatusCode_InvalidArgument,
                  "Missing codecs for '",
                  name,
                  "'");

    std::optional<xzarrguard::BloscCompressionParams> blosc;
    for (auto i = 0; i < codecs.size(); ++i) {
        const auto& codec = codecs[i];
        const auto codec_name =
          codec.is_object() ? codec.value("name", "") : std::string();
        const auto configuration =
          codec.is_object()
            ? codec.value("configuration", nlohmann::json::object())
            : nlohmann::json::object();

        if (i == 0) {
            EXPECT_STATUS(codec_name == "bytes",
                          XzgStatusCode_InvalidArgument,
                          "Unsupported codec '",
                          codec_name,
                          "' for '",
                          name,
                          "'");
            EXPECT_STATUS(configuration.value("endian", "little") == "little",
                          XzgStatusCode_InvalidArgument,
                          "Only little-endian arrays are supported: '",
                          name,
                          "'");
        } else {
            EXPECT_STATUS(i == 1 && codec_name == "blosc",
                          XzgStatusCode_InvalidArgument,
                          "Unsupported codec '",
                          codec_name,
                          "' for '",
                          name,
                          "'");
            blosc = xzarrguard::parse_blosc_codec(configuration);
        }
    }

    return blosc;
}
} // namespace

size_t
xzarrguard::Variable::n_elements() const
{
    size_t n = 1;
    for (const auto& extent : shape) {
        n *= extent;
    }
    return n;
}

size_t
xzarrguard::Variable::bytes_per_element() const
{
    return bytes_of_type(data_type);
}

size_t
xzarrguard::Variable::bytes_per_chunk() const
{
    size_t n = bytes_per_element();
    for (const auto& extent : chunk_shape) {
        n *= extent;
    }
    return n;
}

void
xzarrguard::Variable::validate() const
{
    validate_name(name);

    EXPECT_STATUS(shape.size() == chunk_shape.size(),
                  XzgStatusCode_InvalidShape,
                  "Shape/chunk rank mismatch for '",
                  name,
                  "'");
    for (const auto& extent : chunk_shape) {
        EXPECT_STATUS(extent > 0,
                      XzgStatusCode_InvalidShape,
                      "Chunk sizes must be positive for '",
                      name,
                      "'");
    }

    EXPECT_STATUS(dimension_names.empty() ||
                    dimension_names.size() == shape.size(),
                  XzgStatusCode_InvalidArgument,
                  "Expected ",
                  shape.size(),
                  " dimension names for '",
                  name,
                  "', got ",
                  dimension_names.size());
    EXPECT_STATUS(separator == '/' || separator == '.',
                  XzgStatusCode_InvalidArgument,
                  "Separator can only be '/' or '.' for '",
                  name,
                  "'");
    EXPECT_STATUS(attributes.is_object(),
                  XzgStatusCode_InvalidArgument,
                  "Attributes of '",
                  name,
                  "' must be an object");

    const auto expected_bytes = n_elements() * bytes_per_element();
    EXPECT_STATUS(data.size() == expected_bytes,
                  XzgStatusCode_InvalidArgument,
                  "Expected ",
                  expected_bytes,
                  " bytes of data for '",
                  name,
                  "', got ",
                  data.size());

    [[maybe_unused]] const auto fill = fill_bytes();
}

xzarrguard::ArraySpec
xzarrguard::Variable::spec() const
{
    ArraySpec spec;
    spec.name = name;
    spec.shape = shape;
    spec.chunk_shape = chunk_shape;
    spec.chunk_key_encoding = chunk_key_encoding;
    spec.separator = separator;

    return spec;
}

std::vector<std::byte>
xzarrguard::Variable::fill_bytes() const
{
    std::optional<std::vector<std::byte>> bytes;
    switch (data_type) {
        case XzgDataType_uint8:
            bytes = encode_integer<uint8_t>(fill_value);
            break;
        case XzgDataType_uint16:
            bytes = encode_integer<uint16_t>(fill_value);
            break;
        case XzgDataType_uint32:
            bytes = encode_integer<uint32_t>(fill_value);
            break;
        case XzgDataType_uint64:
            bytes = encode_integer<uint64_t>(fill_value);
            break;
        case XzgDataType_int8:
            bytes = encode_integer<int8_t>(fill_value);
            break;
        case XzgDataType_int16:
            bytes = encode_integer<int16_t>(fill_value);
            break;
        case XzgDataType_int32:
            bytes = encode_integer<int32_t>(fill_value);
            break;
        case XzgDataType_int64:
            bytes = encode_integer<int64_t>(fill_value);
            break;
        case XzgDataType_float32:
            bytes = encode_float<float>(fill_value);
            break;
        case XzgDataType_float64:
            bytes = encode_float<double>(fill_value);
            break;
        default:
            break;
    }

    EXPECT_STATUS(bytes.has_value(),
                  XzgStatusCode_InvalidArgument,
                  "Invalid fill value ",
                  fill_value.dump(),
                  " for '",
                  name,
                  "'");
    return *bytes;
}

std::vector<std::byte>
xzarrguard::Variable::chunk_data(const ChunkCoordinate& coord) const
{
    const auto fill = fill_bytes();
    const auto bpe = fill.size();

    std::vector<std::byte> chunk(bytes_per_chunk());
    for (size_t offset = 0; offset < chunk.size(); offset += bpe) {
        std::memcpy(chunk.data() + offset, fill.data(), bpe);
    }

    copy_chunk_region(*this,
                      coord,
                      const_cast<std::byte*>(data.data()),
                      chunk.data(),
                      true);
    return chunk;
}

void
xzarrguard::Variable::set_chunk_data(const ChunkCoordinate& coord,
                                     std::span<const std::byte> chunk)
{
    EXPECT(chunk.size() == bytes_per_chunk(),
           "Expected ",
           bytes_per_chunk(),
           " bytes of chunk data, got ",
           chunk.size());

    copy_chunk_region(
      *this, coord, data.data(), const_cast<std::byte*>(chunk.data()), false);
}

const xzarrguard::Variable*
xzarrguard::Dataset::find(std::string_view name) const
{
    for (const auto& variable : variables) {
        if (variable.name == name) {
            return &variable;
        }
    }
    return nullptr;
}

void
xzarrguard::Dataset::validate() const
{
    EXPECT_STATUS(attributes.is_object(),
                  XzgStatusCode_InvalidArgument,
                  "Dataset attributes must be an object");

    std::set<std::string> names;
    for (const auto& variable : variables) {
        variable.validate();
        EXPECT_STATUS(names.insert(variable.name).second,
                      XzgStatusCode_InvalidArgument,
                      "Duplicate variable name '",
                      variable.name,
                      "'");
    }

    for (const auto& name : names) {
        for (auto pos = name.find('/'); pos != std::string::npos;
             pos = name.find('/', pos + 1)) {
            EXPECT_STATUS(!names.contains(name.substr(0, pos)),
                          XzgStatusCode_InvalidArgument,
                          "Variable '",
                          name,
                          "' is nested inside variable '",
                          name.substr(0, pos),
                          "'");
        }
    }
}

xzarrguard::Dataset
xzarrguard::read_dataset(const Store& store)
{
    Dataset dataset;

    if (const auto root = store.read("zarr.json"); root) {
        const auto metadata = nlohmann::json::parse(*root,
                                                    nullptr, // callback
                                                    false // allow exceptions
        );
        if (metadata.is_object() && metadata.value("node_type", "") == "group") {
            dataset.attributes =
              metadata.value("attributes", nlohmann::json::object());
        }
    }

    for (const auto& spec : scan_array_specs(store)) {
        const auto& metadata = spec.metadata;

        Variable variable;
        variable.name = spec.name;
        variable.shape = spec.shape;
        variable.chunk_shape = spec.chunk_shape;
        variable.chunk_key_encoding = spec.chunk_key_encoding;
        variable.separator = spec.separator;

        const auto data_type = metadata.value("data_type", nlohmann::json());
        EXPECT_STATUS(data_type.is_string(),
                      XzgStatusCode_InvalidArgument,
                      "Unsupported data type ",
                      data_type.dump(),
                      " for '",
                      spec.name,
                      "'");
        variable.data_type = data_type_from_string(data_type.get<std::string>());

        variable.fill_value = metadata.value("fill_value", nlohmann::json(0));
        if (variable.fill_value.is_null()) {
            variable.fill_value = 0;
        }
        variable.attributes =
          metadata.value("attributes", nlohmann::json::object());

        if (const auto it = metadata.find("dimension_names");
            it != metadata.end() && it->is_array()) {
            for (const auto& dim : *it) {
                variable.dimension_names.push_back(
                  dim.is_string() ? dim.get<std::string>() : std::string());
            }
        }

        const auto blosc =
          parse_codecs(metadata.value("codecs", nlohmann::json()), spec.name);
        variable.compression = blosc;

        const auto fill = variable.fill_bytes();
        const auto bpe = fill.size();
        variable.data.resize(variable.n_elements() * bpe);
        for (size_t offset = 0; offset < variable.data.size(); offset += bpe) {
            std::memcpy(variable.data.data() + offset, fill.data(), bpe);
        }

        const ChunkGrid grid(spec.shape, spec.chunk_shape);
        size_t n_read = 0;
        for (const auto& coord : grid) {
            const auto key = chunk_key(spec, coord);
            const auto encoded = store.read(key);
            if (!encoded) {
                continue;
            }

            const auto chunk =
              decode_chunk(*encoded, blosc, variable.bytes_per_chunk(), key);
            variable.set_chunk_data(coord, chunk);
            ++n_read;
        }

        LOG_DEBUG("Read ",
                  n_read,
                  " of ",
                  grid.size(),
                  " chunks of '",
                  spec.name,
                  "'");
        dataset.variables.push_back(std::move(variable));
    }

    return dataset;
}
