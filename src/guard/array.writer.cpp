#include "array.writer.hh"
#include "chunk.grid.hh"
#include "chunk.key.hh"
#include "file.sink.hh"
#include "macros.hh"

#include <cstring>
#include <latch>
#include <mutex>

namespace fs = std::filesystem;

xzarrguard::ArrayWriter::ArrayWriter(const Variable& variable,
                                     ArrayWriterConfig&& config,
                                     std::shared_ptr<ThreadPool> thread_pool)
  : variable_{ variable }
  , config_{ std::move(config) }
  , thread_pool_{ thread_pool }
{
    EXPECT(thread_pool_, "Thread pool must not be null.");
}

fs::path
xzarrguard::ArrayWriter::array_path_() const
{
    return config_.store_path / fs::path(variable_.name);
}

nlohmann::json
xzarrguard::ArrayWriter::make_metadata() const
{
    using json = nlohmann::json;

    const auto is_default =
      variable_.chunk_key_encoding == ChunkKeyEncoding::Default;

    json codecs = json::array();
    codecs.push_back({ { "name", "bytes" },
                       { "configuration", { { "endian", "little" } } } });
    if (config_.compression_params) {
        codecs.push_back(blosc_codec_metadata(*config_.compression_params,
                                              variable_.bytes_per_element()));
    }

    json metadata;
    metadata["zarr_format"] = 3;
    metadata["node_type"] = "array";
    metadata["shape"] = variable_.shape;
    metadata["data_type"] = data_type_to_string(variable_.data_type);
    metadata["chunk_grid"] = json{
        { "name", "regular" },
        { "configuration", { { "chunk_shape", variable_.chunk_shape } } },
    };
    metadata["chunk_key_encoding"] = json{
        { "name", is_default ? "default" : "v2" },
        { "configuration",
          { { "separator", std::string(1, variable_.separator) } } },
    };
    metadata["fill_value"] = variable_.fill_value;
    metadata["codecs"] = codecs;
    metadata["attributes"] = variable_.attributes;
    metadata["storage_transformers"] = json::array();
    if (!variable_.dimension_names.empty()) {
        metadata["dimension_names"] = variable_.dimension_names;
    }

    return metadata;
}

void
xzarrguard::ArrayWriter::write_array_metadata()
{
    const auto path = array_path_() / "zarr.json";
    write_file(path.string(), make_metadata().dump(2) + "\n");
}

std::vector<std::byte>
xzarrguard::ArrayWriter::encode_chunk_(const ChunkCoordinate& coord) const
{
    std::vector<std::byte> chunk;
    if (config_.fill_chunks.contains(coord)) {
        const auto fill = variable_.fill_bytes();
        chunk.resize(variable_.bytes_per_chunk());
        for (size_t offset = 0; offset < chunk.size(); offset += fill.size()) {
            std::memcpy(chunk.data() + offset, fill.data(), fill.size());
        }
    } else {
        chunk = variable_.chunk_data(coord);
    }

    if (config_.compression_params) {
        return blosc_compress(*config_.compression_params,
                              variable_.bytes_per_element(),
                              chunk);
    }

    return chunk;
}

size_t
xzarrguard::ArrayWriter::write_chunks()
{
    const ChunkGrid grid(variable_.shape, variable_.chunk_shape);
    const auto spec = variable_.spec();

    std::vector<ChunkCoordinate> coords;
    for (const auto& coord : grid) {
        if (!config_.skipped_chunks.contains(coord)) {
            coords.push_back(coord);
        }
    }

    std::mutex errors_mutex;
    std::vector<std::string> errors;

    std::latch latch(static_cast<ptrdiff_t>(coords.size()));
    for (const auto& coord : coords) {
        const auto path = config_.store_path / fs::path(chunk_key(spec, coord));
        EXPECT(thread_pool_->push_job(
                 [this, &coord, path, &latch, &errors, &errors_mutex](
                   std::string& err) -> bool {
                     bool success = false;
                     try {
                         const auto chunk = encode_chunk_(coord);
                         write_file(path.string(), chunk);
                         success = true;
                     } catch (const std::exception& exc) {
                         err = "Failed to write chunk '" + path.string() +
                               "': " + exc.what();

                         std::scoped_lock lock(errors_mutex);
                         errors.push_back(err);
                     }

                     latch.count_down();
                     return success;
                 }),
               "Failed to push job to thread pool");
    }

    // wait for all threads to finish
    latch.wait();

    EXPECT_STATUS(errors.empty(),
                  XzgStatusCode_IOError,
                  "Failed to write ",
                  errors.size(),
                  " chunk(s) of '",
                  variable_.name,
                  "': ",
                  errors.front());

    LOG_DEBUG("Wrote ", coords.size(), " chunks of '", variable_.name, "'");
    return coords.size();
}
