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
        const auto created =
          xzarrguard::create_store(dataset, store_path, {});
        EXPECT_EQ(size_t, created.chunks_written, 7);
        CHECK(created.manifests_written.empty());
        CHECK(created.absent_chunks.empty());

        CHECK(fs::is_regular_file(store_path / "zarr.json"));
        CHECK(fs::is_regular_file(store_path / "group" / "zarr.json"));
        CHECK(fs::is_regular_file(store_path / "temperature" / "zarr.json"));
        CHECK(fs::is_regular_file(store_path / "temperature" / "c" / "1" / "1"));
        CHECK(fs::is_regular_file(store_path / "group" / "counts" / "c" / "2"));
        CHECK(!fs::exists(store_path / ".xzarrguard"));

        xzarrguard::CheckOptions options;
        options.timing = true;
        const auto report =
          xzarrguard::check_store(store_path.string(), options);

        CHECK(report.ok);
        CHECK(static_cast<bool>(report));
        CHECK(report.errors.empty());
        CHECK(report.orphan_manifests.empty());
        CHECK(!report.strict_stale);
        EXPECT_STR_EQ(report.store_path.c_str(), store_path.string().c_str());
        EXPECT_EQ(size_t, report.variables.size(), 2);

        const auto& temperature = report.variables.at("temperature");
        CHECK(temperature.ok);
        CHECK(!temperature.has_manifest);
        EXPECT_EQ(int, temperature.expected_chunks, 4);
        CHECK(temperature.missing.empty());
        CHECK(temperature.missing_allowed.empty());
        CHECK(temperature.stale.empty());
        CHECK(!temperature.error);

        const auto& counts = report.variables.at("group/counts");
        CHECK(counts.ok);
        EXPECT_EQ(int, counts.expected_chunks, 3);

        CHECK(report.timing.has_value());
        EXPECT_EQ(int, report.timing->exists_calls, 7);
        EXPECT_EQ(int, report.timing->variables.at("temperature").exists_calls, 4);
        EXPECT_EQ(
          int, report.timing->variables.at("group/counts").exists_calls, 3);

        // the check never writes to the store
        size_t n_files = 0;
        for (const auto& entry : fs::recursive_directory_iterator(store_path)) {
            n_files += entry.is_regular_file() ? 1 : 0;
        }
        EXPECT_EQ(size_t, n_files, 11);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
