#include "blosc.compression.params.hh"
#include "macros.hh"

const char*
xzarrguard::blosc_codec_to_string(XzgCompressionCodec codec)
{
    switch (codec) {
        case XzgCompressionCodec_BloscZstd:
            return "zstd";
        case XzgCompressionCodec_BloscLZ4:
            return "lz4";
        default:
            return "unrecognized codec";
    }
}

const char*
xzarrguard::blosc_shuffle_to_string(uint8_t shuffle)
{
    switch (shuffle) {
        case BLOSC_NOSHUFFLE:
            return "noshuffle";
        case BLOSC_SHUFFLE:
            return "shuffle";
        case BLOSC_BITSHUFFLE:
            return "bitshuffle";
        default:
            return "unrecognized shuffle";
    }
}

xzarrguard::BloscCompressionParams::BloscCompressionParams(
  std::string_view codec_id,
  uint8_t clevel,
  uint8_t shuffle)
  : codec_id{ codec_id }
  , clevel{ clevel }
  , shuffle{ shuffle }
{
}

nlohmann::json
xzarrguard::blosc_codec_metadata(const BloscCompressionParams& params,
                                 size_t typesize)
{
    return {
        { "name", "blosc" },
        { "configuration",
          {
            { "cname", params.codec_id },
            { "clevel", params.clevel },
            { "shuffle", blosc_shuffle_to_string(params.shuffle) },
            { "typesize", typesize },
            { "blocksize", 0 },
          } },
    };
}

xzarrguard::BloscCompressionParams
xzarrguard::parse_blosc_codec(const nlohmann::json& configuration)
{
    EXPECT_STATUS(configuration.is_object(),
                  XzgStatusCode_InvalidArgument,
                  "Blosc configuration must be an object");

    BloscCompressionParams params;
    params.codec_id = configuration.value("cname", "lz4");

    const auto clevel = configuration.value("clevel", 1);
    EXPECT_STATUS(clevel >= 0 && clevel <= 9,
                  XzgStatusCode_InvalidArgument,
                  "Invalid Blosc clevel: ",
                  clevel);
    params.clevel = static_cast<uint8_t>(clevel);

    const auto shuffle = configuration.value("shuffle", "shuffle");
    if (shuffle == "noshuffle") {
        params.shuffle = BLOSC_NOSHUFFLE;
    } else if (shuffle == "shuffle") {
        params.shuffle = BLOSC_SHUFFLE;
    } else if (shuffle == "bitshuffle") {
        params.shuffle = BLOSC_BITSHUFFLE;
    } else {
        EXPECT_STATUS(false,
                      XzgStatusCode_InvalidArgument,
                      "Invalid Blosc shuffle: ",
                      shuffle);
    }

    return params;
}

std::vector<std::byte>
xzarrguard::blosc_compress(const BloscCompressionParams& params,
                           size_t typesize,
                           std::span<const std::byte> data)
{
    const auto tmp_size = data.size() + BLOSC_MAX_OVERHEAD;
    std::vector<std::byte> tmp(tmp_size);
    const auto nb = blosc_compress_ctx(params.clevel,
                                       params.shuffle,
                                       typesize,
                                       data.size(),
                                       data.data(),
                                       tmp.data(),
                                       tmp_size,
                                       params.codec_id.c_str(),
                                       0 /* blocksize - 0:automatic */,
                                       1);
    EXPECT_STATUS(nb > 0,
                  XzgStatusCode_CompressionError,
                  "Failed to compress chunk with codec '",
                  params.codec_id,
                  "': ",
                  nb);

    tmp.resize(nb);
    return tmp;
}

std::vector<std::byte>
xzarrguard::blosc_decompress(std::span<const std::byte> data,
                             size_t expected_size)
{
    EXPECT_STATUS(data.size() >= BLOSC_MIN_HEADER_LENGTH,
                  XzgStatusCode_CompressionError,
                  "Blosc buffer too small: ",
                  data.size(),
                  " bytes");

    size_t nbytes = 0, cbytes = 0, blocksize = 0;
    blosc_cbuffer_sizes(data.data(), &nbytes, &cbytes, &blocksize);
    EXPECT_STATUS(nbytes == expected_size && cbytes <= data.size(),
                  XzgStatusCode_CompressionError,
                  "Expected ",
                  expected_size,
                  " decompressed bytes, Blosc header reports ",
                  nbytes);

    std::vector<std::byte> out(expected_size);
    const auto nb =
      blosc_decompress_ctx(data.data(), out.data(), out.size(), 1);
    EXPECT_STATUS(nb >= 0 && static_cast<size_t>(nb) == expected_size,
                  XzgStatusCode_CompressionError,
                  "Failed to decompress chunk: ",
                  nb);

    return out;
}
