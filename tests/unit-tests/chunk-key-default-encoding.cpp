#include "chunk.key.hh"
#include "unit.test.macros.hh"

int
main()
{
    int retval = 1;

    try {
        xzarrguard::ArraySpec spec;
        spec.name = "temperature";
        spec.shape = { 4, 6 };
        spec.chunk_shape = { 2, 3 };

        EXPECT_STR_EQ(xzarrguard::array_chunk_key(spec, { 0, 1 }).c_str(),
                      "c/0/1");
        EXPECT_STR_EQ(xzarrguard::chunk_key(spec, { 0, 1 }).c_str(),
                      "temperature/c/0/1");
        EXPECT_STR_EQ(xzarrguard::chunk_key(spec, { 12, 345 }).c_str(),
                      "temperature/c/12/345");

        // the separator is only used between key parts
        spec.separator = '.';
        EXPECT_STR_EQ(xzarrguard::chunk_key(spec, { 1, 0 }).c_str(),
                      "temperature/c.1.0");

        // nested arrays keep their group path
        spec.name = "obs/surface/t2m";
        spec.separator = '/';
        EXPECT_STR_EQ(xzarrguard::chunk_key(spec, { 1, 1 }).c_str(),
                      "obs/surface/t2m/c/1/1");

        // rank 0
        xzarrguard::ArraySpec scalar;
        scalar.name = "scalar";
        EXPECT_STR_EQ(xzarrguard::chunk_key(scalar, {}).c_str(), "scalar/c");

        // a root array has no prefix
        scalar.name = "";
        EXPECT_STR_EQ(xzarrguard::chunk_key(scalar, {}).c_str(), "c");

        EXPECT_THROWS_STATUS(xzarrguard::chunk_key(spec, { 0 }),
                             XzgStatusCode_InvalidCoordinate);
        EXPECT_THROWS_STATUS(xzarrguard::chunk_key(spec, { 0, 0, 0 }),
                             XzgStatusCode_InvalidCoordinate);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
