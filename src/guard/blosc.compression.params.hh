#pragma once

#include "xzarrguard.types.h"

#include <blosc.h>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace xzarrguard {
const char*
blosc_codec_to_string(XzgCompressionCodec codec);

/// @brief Zarr v3 name of a Blosc shuffle mode, e.g. "bitshuffle".
const char*
blosc_shuffle_to_string(uint8_t shuffle);

struct BloscCompressionParams
{
    std::string codec_id;
    uint8_t clevel{ 1 };
    uint8_t shuffle{ BLOSC_SHUFFLE };

    BloscCompressionParams() = default;
    BloscCompressionParams(std::string_view codec_id,
                           uint8_t clevel,
                           uint8_t shuffle);

    bool operator==(const BloscCompressionParams&) const = default;
};

/**
 * @brief The "blosc" entry of a Zarr v3 codec pipeline.
 * @param params Compression parameters.
 * @param typesize Size in bytes of one array element.
 */
nlohmann::json
blosc_codec_metadata(const BloscCompressionParams& params, size_t typesize);

/**
 * @brief Parse the configuration of a Zarr v3 "blosc" codec.
 * @throw xzarrguard::Error with XzgStatusCode_InvalidArgument if the
 * configuration is malformed or names an unknown shuffle mode.
 */
BloscCompressionParams
parse_blosc_codec(const nlohmann::json& configuration);

/**
 * @brief Compress one chunk.
 * @throw xzarrguard::Error with XzgStatusCode_CompressionError on failure.
 */
std::vector<std::byte>
blosc_compress(const BloscCompressionParams& params,
               size_t typesize,
               std::span<const std::byte> data);

/**
 * @brief Decompress one chunk.
 * @param data The compressed chunk.
 * @param expected_size The size in bytes of the decompressed chunk.
 * @throw xzarrguard::Error with XzgStatusCode_CompressionError if @p data is
 * not a Blosc buffer of @p expected_size bytes.
 */
std::vector<std::byte>
blosc_decompress(std::span<const std::byte> data, size_t expected_size);
} // namespace xzarrguard
