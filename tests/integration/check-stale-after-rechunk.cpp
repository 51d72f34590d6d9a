#include "file.sink.hh"
#include "integrity.checker.hh"
#include "store.creator.hh"
#include "test.dataset.hh"
#include "test.macros.hh"

#include <fstream>

namespace fs = std::filesystem;

int
main()
{
    int retval = 1;
    const xzarrguard::test::ScratchDirectory scratch(TEST);
    const auto store_path = scratch.path() / "store.zarr";

    try {
        xzarrguard::create_store(xzarrguard::test::make_dataset(),
                                 store_path,
                                 { { "temperature", { { 1, 1 } } } });

        // rechunk to a single 4x4 chunk, leaving the manifest behind
        const auto metadata_path = store_path / "temperature" / "zarr.json";
        nlohmann::json metadata;
        {
            std::ifstream ifs(metadata_path);
            metadata = nlohmann::json::parse(ifs);
        }
        metadata["chunk_grid"]["configuration"]["chunk_shape"] = { 4, 4 };
        xzarrguard::write_file(metadata_path.string(), metadata.dump(2));

        auto report = xzarrguard::check_store(store_path.string());
        CHECK(report.ok);

        const auto& loose = report.variables.at("temperature");
        CHECK(loose.ok);
        CHECK(loose.has_manifest);
        EXPECT_EQ(int, loose.expected_chunks, 1);
        CHECK(loose.missing.empty());
        CHECK(loose.missing_allowed.empty());
        EXPECT_EQ(size_t, loose.stale.size(), 1);
        CHECK(loose.stale[0].coord == xzarrguard::ChunkCoordinate({ 1, 1 }));
        CHECK(loose.stale[0].reason == xzarrguard::StaleReason::OutOfGrid);

        xzarrguard::CheckOptions options;
        options.strict_stale = true;
        report = xzarrguard::check_store(store_path.string(), options);
        CHECK(!report.ok);
        CHECK(!report.variables.at("temperature").ok);

        const auto json = report.to_json();
        EXPECT_STR_EQ(json["variables"]["temperature"]["stale"][0]["reason"]
                        .get<std::string>()
                        .c_str(),
                      "out_of_grid");

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
