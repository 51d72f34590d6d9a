#include "dataset.hh"
#include "unit.test.macros.hh"

#include <cmath>
#include <cstring>

namespace {
xzarrguard::Variable
make_variable()
{
    xzarrguard::Variable variable;
    variable.name = "counts";
    variable.shape = { 3, 5 };
    variable.chunk_shape = { 2, 2 };
    variable.data_type = XzgDataType_uint16;
    variable.fill_value = 65535;

    variable.data.resize(variable.n_elements() * sizeof(uint16_t));
    auto* values = reinterpret_cast<uint16_t*>(variable.data.data());
    for (auto i = 0; i < variable.n_elements(); ++i) {
        values[i] = static_cast<uint16_t>(i);
    }

    return variable;
}

uint16_t
value_at(const std::vector<std::byte>& chunk, size_t index)
{
    uint16_t value;
    std::memcpy(&value, chunk.data() + index * sizeof(value), sizeof(value));
    return value;
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        auto variable = make_variable();
        variable.validate();

        EXPECT_EQ(size_t, variable.bytes_per_element(), 2);
        EXPECT_EQ(size_t, variable.bytes_per_chunk(), 8);

        // interior chunk: rows 0-1, columns 2-3
        auto chunk = variable.chunk_data({ 0, 1 });
        EXPECT_EQ(size_t, chunk.size(), 8);
        EXPECT_EQ(int, value_at(chunk, 0), 2);
        EXPECT_EQ(int, value_at(chunk, 1), 3);
        EXPECT_EQ(int, value_at(chunk, 2), 7);
        EXPECT_EQ(int, value_at(chunk, 3), 8);

        // corner chunk: only (2, 4) lies inside the array
        chunk = variable.chunk_data({ 1, 2 });
        EXPECT_EQ(int, value_at(chunk, 0), 14);
        EXPECT_EQ(int, value_at(chunk, 1), 65535);
        EXPECT_EQ(int, value_at(chunk, 2), 65535);
        EXPECT_EQ(int, value_at(chunk, 3), 65535);

        // writing a chunk back only touches the part inside the array
        std::vector<uint16_t> replacement{ 100, 101, 102, 103 };
        variable.set_chunk_data(
          { 1, 2 },
          std::as_bytes(std::span<const uint16_t>(replacement)));
        const auto* values =
          reinterpret_cast<const uint16_t*>(variable.data.data());
        EXPECT_EQ(int, values[14], 100);
        EXPECT_EQ(int, values[13], 13);
        EXPECT_EQ(int, values[9], 9);

        // fill values
        auto fill = variable.fill_bytes();
        EXPECT_EQ(size_t, fill.size(), 2);

        variable.fill_value = 65536;
        EXPECT_THROWS_STATUS(variable.fill_bytes(),
                             XzgStatusCode_InvalidArgument);
        variable.fill_value = -1;
        EXPECT_THROWS_STATUS(variable.fill_bytes(),
                             XzgStatusCode_InvalidArgument);
        variable.fill_value = "NaN";
        EXPECT_THROWS_STATUS(variable.fill_bytes(),
                             XzgStatusCode_InvalidArgument);

        variable.data_type = XzgDataType_float32;
        fill = variable.fill_bytes();
        float nan;
        std::memcpy(&nan, fill.data(), sizeof(nan));
        CHECK(std::isnan(nan));
        variable.data_type = XzgDataType_uint16;
        variable.fill_value = 0;

        // validation
        {
            auto v = make_variable();
            v.chunk_shape = { 2 };
            EXPECT_THROWS_STATUS(v.validate(), XzgStatusCode_InvalidShape);

            v = make_variable();
            v.chunk_shape = { 2, 0 };
            EXPECT_THROWS_STATUS(v.validate(), XzgStatusCode_InvalidShape);

            v = make_variable();
            v.data.pop_back();
            EXPECT_THROWS_STATUS(v.validate(), XzgStatusCode_InvalidArgument);

            v = make_variable();
            v.dimension_names = { "y" };
            EXPECT_THROWS_STATUS(v.validate(), XzgStatusCode_InvalidArgument);

            v = make_variable();
            v.separator = '-';
            EXPECT_THROWS_STATUS(v.validate(), XzgStatusCode_InvalidArgument);

            for (const auto* name :
                 { "", "a//b", "a/../b", "zarr.json", ".xzarrguard/x" }) {
                v = make_variable();
                v.name = name;
                EXPECT_THROWS_STATUS(v.validate(),
                                     XzgStatusCode_InvalidArgument);
            }

            v = make_variable();
            v.name = "group/.xzarrguard";
            v.validate();
        }

        // datasets reject nested and duplicate names
        {
            xzarrguard::Dataset dataset;
            dataset.variables.push_back(make_variable());
            dataset.variables.push_back(make_variable());
            dataset.variables.back().name = "group/counts";
            dataset.validate();
            CHECK(dataset.find("group/counts") != nullptr);
            CHECK(dataset.find("group") == nullptr);

            dataset.variables.push_back(make_variable());
            EXPECT_THROWS_STATUS(dataset.validate(),
                                 XzgStatusCode_InvalidArgument);

            dataset.variables.back().name = "counts/inner";
            EXPECT_THROWS_STATUS(dataset.validate(),
                                 XzgStatusCode_InvalidArgument);
        }

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
