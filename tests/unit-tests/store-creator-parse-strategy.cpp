#include "store.creator.hh"
#include "unit.test.macros.hh"

int
main()
{
    int retval = 1;

    try {
        EXPECT_EQ(int,
                  xzarrguard::parse_no_data_strategy("manifest"),
                  XzgNoDataStrategy_Manifest);
        EXPECT_EQ(int,
                  xzarrguard::parse_no_data_strategy("empty_chunks"),
                  XzgNoDataStrategy_EmptyChunks);

        EXPECT_STR_EQ(
          xzarrguard::no_data_strategy_to_string(XzgNoDataStrategy_Manifest),
          "manifest");
        EXPECT_STR_EQ(
          xzarrguard::no_data_strategy_to_string(XzgNoDataStrategy_EmptyChunks),
          "empty_chunks");

        EXPECT_THROWS_STATUS(xzarrguard::parse_no_data_strategy("zeros"),
                             XzgStatusCode_UnsupportedStrategy);
        EXPECT_THROWS_STATUS(xzarrguard::parse_no_data_strategy(""),
                             XzgStatusCode_UnsupportedStrategy);
        EXPECT_THROWS_STATUS(xzarrguard::parse_no_data_strategy("Manifest"),
                             XzgStatusCode_UnsupportedStrategy);

        // the strategy is also checked when creating a store
        xzarrguard::Dataset dataset;
        EXPECT_THROWS_STATUS(
          xzarrguard::create_store(dataset,
                                   fs::temp_directory_path() / TEST,
                                   {},
                                   XzgNoDataStrategyCount),
          XzgStatusCode_UnsupportedStrategy);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
