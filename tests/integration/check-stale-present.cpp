#include "file.sink.hh"
#include "integrity.checker.hh"
#include "store.creator.hh"
#include "test.dataset.hh"
#include "test.macros.hh"

namespace fs = std::filesystem;

int
main()
{
    int retval = 1;
    const xzarrguard::test::ScratchDirectory scratch(TEST);
    const auto store_path = scratch.path() / "store.zarr";

    try {
        const auto dataset = xzarrguard::test::make_dataset();
        xzarrguard::create_store(
          dataset, store_path, { { "temperature", { { 1, 1 } } } });

        // the chunk declared as no-data shows up after all
        const auto chunk_path = store_path / "temperature" / "c" / "1" / "1";
        CHECK(!fs::exists(chunk_path));
        xzarrguard::write_file(
          chunk_path.string(),
          dataset.find("temperature")->chunk_data({ 1, 1 }));

        auto report = xzarrguard::check_store(store_path.string());
        CHECK(report.ok);

        const auto& loose = report.variables.at("temperature");
        CHECK(loose.ok);
        CHECK(loose.missing.empty());
        CHECK(loose.missing_allowed.empty());
        EXPECT_EQ(size_t, loose.stale.size(), 1);
        CHECK(loose.stale[0].coord == xzarrguard::ChunkCoordinate({ 1, 1 }));
        EXPECT_STR_EQ(loose.stale[0].key.c_str(), "temperature/c/1/1");
        CHECK(loose.stale[0].reason == xzarrguard::StaleReason::Present);

        xzarrguard::CheckOptions options;
        options.strict_stale = true;
        report = xzarrguard::check_store(store_path.string(), options);
        CHECK(!report.ok);

        const auto& strict = report.variables.at("temperature");
        CHECK(!strict.ok);
        CHECK(strict.missing.empty());
        EXPECT_EQ(size_t, strict.stale.size(), 1);
        CHECK(report.variables.at("group/counts").ok);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
