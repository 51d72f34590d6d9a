#include "integrity.checker.hh"
#include "manifest.hh"
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
        xzarrguard::create_store(
          xzarrguard::test::make_dataset(), store_path, {});

        // a manifest written for a dot-separated layout
        xzarrguard::Manifest manifest;
        manifest.variable = "temperature";
        manifest.allowed_missing.push_back({ { 1, 1 }, "temperature/c.1.1" });
        xzarrguard::save_manifest(store_path, manifest);

        // while the chunk is present, the entry is merely stale
        auto report = xzarrguard::check_store(store_path.string());
        CHECK(report.ok);
        auto temperature = report.variables.at("temperature");
        EXPECT_EQ(size_t, temperature.stale.size(), 1);
        CHECK(temperature.stale[0].reason ==
              xzarrguard::StaleReason::KeyMismatch);
        EXPECT_STR_EQ(temperature.stale[0].key.c_str(), "temperature/c.1.1");

        // a missing chunk with a mismatched entry is stale, not missing
        CHECK(fs::remove(store_path / "temperature" / "c" / "1" / "1"));
        report = xzarrguard::check_store(store_path.string());
        CHECK(report.ok);

        temperature = report.variables.at("temperature");
        CHECK(temperature.ok);
        CHECK(temperature.missing.empty());
        CHECK(temperature.missing_allowed.empty());
        EXPECT_EQ(size_t, temperature.stale.size(), 1);
        CHECK(temperature.stale[0].reason ==
              xzarrguard::StaleReason::KeyMismatch);

        // strict mode fails on it
        xzarrguard::CheckOptions strict;
        strict.strict_stale = true;
        report = xzarrguard::check_store(store_path.string(), strict);
        CHECK(!report.ok);
        temperature = report.variables.at("temperature");
        CHECK(!temperature.ok);
        CHECK(temperature.missing.empty());
        EXPECT_EQ(size_t, temperature.stale.size(), 1);

        // an entry with the right key sanctions it again
        manifest.allowed_missing[0].key = "temperature/c/1/1";
        xzarrguard::save_manifest(store_path, manifest);
        report = xzarrguard::check_store(store_path.string());
        CHECK(report.ok);
        temperature = report.variables.at("temperature");
        EXPECT_EQ(size_t, temperature.missing_allowed.size(), 1);
        CHECK(temperature.stale.empty());

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
