#include "xzarrguard.h"
#include "manifest.hh"
#include "store.creator.hh"
#include "test.dataset.hh"
#include "test.macros.hh"

#include <cstring>

namespace fs = std::filesystem;

int
main()
{
    int retval = 1;
    const xzarrguard::test::ScratchDirectory scratch(TEST);
    const auto source_path = scratch.path() / "source.zarr";
    const auto target_path = scratch.path() / "target.zarr";
    const auto no_data_path = scratch.path() / "no-data.json";

    try {
        EXPECT_STR_EQ(Xzg_get_api_version(), XZARRGUARD_API_VERSION);

        CHECK_OK(Xzg_set_log_level(XzgLogLevel_Debug));
        EXPECT_EQ(int, Xzg_get_log_level(), XzgLogLevel_Debug);
        CHECK(Xzg_set_log_level(XzgLogLevelCount) ==
              XzgStatusCode_InvalidArgument);
        CHECK_OK(Xzg_set_log_level(XzgLogLevel_Warning));

        EXPECT_STR_EQ(Xzg_get_status_message(XzgStatusCode_ManifestCorrupt),
                      "Corrupt manifest");

        xzarrguard::create_store(
          xzarrguard::test::make_dataset(), source_path, {});
        xzarrguard::dump_no_data_chunks(
          no_data_path, { { "temperature", { { 1, 0 } } } });

        CHECK_OK(Xzg_create_store(source_path.string().c_str(),
                                  target_path.string().c_str(),
                                  no_data_path.string().c_str(),
                                  XzgNoDataStrategy_Manifest,
                                  false));
        CHECK(!fs::exists(target_path / "temperature" / "c" / "1" / "0"));
        CHECK(fs::is_regular_file(
          xzarrguard::manifest_path(target_path, "temperature")));

        bool ok = false;
        CHECK_OK(Xzg_check_store(target_path.string().c_str(), true, &ok));
        CHECK(ok);

        // a check that runs and fails still succeeds as a call
        CHECK(fs::remove(target_path / "temperature" / "c" / "0" / "0"));
        ok = true;
        CHECK_OK(Xzg_check_store(target_path.string().c_str(), false, &ok));
        CHECK(!ok);

        // errors
        CHECK(Xzg_check_store(nullptr, false, &ok) ==
              XzgStatusCode_InvalidArgument);
        CHECK(Xzg_check_store(target_path.string().c_str(), false, nullptr) ==
              XzgStatusCode_InvalidArgument);
        CHECK(Xzg_check_store((scratch.path() / "nowhere").string().c_str(),
                              false,
                              &ok) == XzgStatusCode_StoreUnreadable);
        CHECK(!ok);

        CHECK(Xzg_create_store(source_path.string().c_str(),
                               target_path.string().c_str(),
                               nullptr,
                               XzgNoDataStrategy_EmptyChunks,
                               false) == XzgStatusCode_IOError);
        CHECK(Xzg_create_store(source_path.string().c_str(),
                               target_path.string().c_str(),
                               nullptr,
                               XzgNoDataStrategyCount,
                               true) == XzgStatusCode_UnsupportedStrategy);
        CHECK(Xzg_create_store(nullptr,
                               target_path.string().c_str(),
                               nullptr,
                               XzgNoDataStrategy_Manifest,
                               true) == XzgStatusCode_InvalidArgument);

        // replacing the target with empty chunks drops the manifest
        CHECK_OK(Xzg_create_store(source_path.string().c_str(),
                                  target_path.string().c_str(),
                                  no_data_path.string().c_str(),
                                  XzgNoDataStrategy_EmptyChunks,
                                  true));
        CHECK(fs::is_regular_file(target_path / "temperature" / "c" / "1" / "0"));
        CHECK(!fs::exists(target_path / ".xzarrguard"));
        CHECK_OK(Xzg_check_store(target_path.string().c_str(), true, &ok));
        CHECK(ok);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
