#include "manifest.hh"
#include "unit.test.macros.hh"

#include <filesystem>

namespace fs = std::filesystem;

int
main()
{
    int retval = 1;
    const fs::path path = fs::temp_directory_path() / (TEST ".json");

    try {
        const auto chunks = xzarrguard::parse_no_data_chunks(
          R"({"temperature": [[1, 0], [0, 1], [1, 0]], "scalar": [[]],
              "unused": []})");
        EXPECT_EQ(size_t, chunks.size(), 3);

        // deduplicated and sorted
        const auto& temperature = chunks.at("temperature");
        EXPECT_EQ(size_t, temperature.size(), 2);
        CHECK(*temperature.begin() == xzarrguard::ChunkCoordinate({ 0, 1 }));
        CHECK(*temperature.rbegin() == xzarrguard::ChunkCoordinate({ 1, 0 }));

        EXPECT_EQ(size_t, chunks.at("scalar").size(), 1);
        CHECK(chunks.at("scalar").begin()->empty());
        CHECK(chunks.at("unused").empty());

        EXPECT_THROWS_STATUS(xzarrguard::parse_no_data_chunks("[]"),
                             XzgStatusCode_InvalidArgument);
        EXPECT_THROWS_STATUS(xzarrguard::parse_no_data_chunks("not json"),
                             XzgStatusCode_InvalidArgument);
        EXPECT_THROWS_STATUS(
          xzarrguard::parse_no_data_chunks(R"({"t": [0, 1]})"),
          XzgStatusCode_InvalidCoordinate);
        EXPECT_THROWS_STATUS(
          xzarrguard::parse_no_data_chunks(R"({"t": [[0, -1]]})"),
          XzgStatusCode_InvalidCoordinate);
        EXPECT_THROWS_STATUS(
          xzarrguard::parse_no_data_chunks(R"({"t": [[0, 1.5]]})"),
          XzgStatusCode_InvalidCoordinate);
        EXPECT_THROWS_STATUS(xzarrguard::parse_no_data_chunks(R"({"t": 1})"),
                             XzgStatusCode_InvalidArgument);

        // file round trip
        xzarrguard::dump_no_data_chunks(path, chunks);
        const auto reloaded = xzarrguard::load_no_data_chunks(path);
        CHECK(reloaded == chunks);

        EXPECT_THROWS_STATUS(
          xzarrguard::load_no_data_chunks(path.string() + ".missing"),
          XzgStatusCode_IOError);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    std::error_code ec;
    fs::remove(path, ec);

    return retval;
}
