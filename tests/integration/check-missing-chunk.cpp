#include "integrity.checker.hh"
#include "store.creator.hh"
#include "test.dataset.hh"
#include "test.macros.hh"

namespace fs = std::filesystem;

namespace {
void
expect_missing(const xzarrguard::IntegrityReport& report)
{
    CHECK(!report.ok);
    CHECK(report.errors.empty());

    const auto& temperature = report.variables.at("temperature");
    CHECK(!temperature.ok);
    EXPECT_EQ(size_t, temperature.missing.size(), 2);

    // grid order
    CHECK(temperature.missing[0].coord == xzarrguard::ChunkCoordinate({ 0, 1 }));
    EXPECT_STR_EQ(temperature.missing[0].key.c_str(), "temperature/c/0/1");
    CHECK(temperature.missing[1].coord == xzarrguard::ChunkCoordinate({ 1, 0 }));
    EXPECT_STR_EQ(temperature.missing[1].key.c_str(), "temperature/c/1/0");

    CHECK(report.variables.at("group/counts").ok);
}
} // namespace

int
main()
{
    int retval = 1;
    const xzarrguard::test::ScratchDirectory scratch(TEST);
    const auto store_path = scratch.path() / "store.zarr";

    try {
        xzarrguard::create_store(
          xzarrguard::test::make_dataset(), store_path, {});

        CHECK(fs::remove(store_path / "temperature" / "c" / "1" / "0"));
        CHECK(fs::remove(store_path / "temperature" / "c" / "0" / "1"));

        expect_missing(xzarrguard::check_store(store_path.string()));

        // small batches spread over several threads give the same answer
        xzarrguard::CheckOptions options;
        options.batch_size = 1;
        options.n_threads = 3;
        expect_missing(xzarrguard::check_store(store_path.string(), options));

        options.batch_size = 3;
        options.n_threads = 1;
        expect_missing(xzarrguard::check_store(store_path.string(), options));

        // a missing chunk with no manifest fails regardless of strictness
        options.strict_stale = true;
        const auto strict =
          xzarrguard::check_store(store_path.string(), options);
        expect_missing(strict);
        CHECK(strict.strict_stale);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
