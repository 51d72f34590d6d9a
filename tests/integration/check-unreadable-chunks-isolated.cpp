#include "error.hh"
#include "file.store.hh"
#include "integrity.checker.hh"
#include "store.creator.hh"
#include "test.dataset.hh"
#include "test.macros.hh"

namespace {
/// A local store that refuses to stat the chunks of one array.
class UnreadableChunksStore : public xzarrguard::FileStore
{
  public:
    UnreadableChunksStore(const std::filesystem::path& root,
                          std::string chunk_prefix)
      : FileStore(root)
      , chunk_prefix_{ std::move(chunk_prefix) }
    {
    }

    bool exists(std::string_view key) const override
    {
        if (key.starts_with(chunk_prefix_)) {
            throw xzarrguard::Error(XzgStatusCode_StoreUnreadable,
                                    "Permission denied: " + std::string(key));
        }
        return FileStore::exists(key);
    }

  private:
    std::string chunk_prefix_;
};
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

        const UnreadableChunksStore store(store_path, "temperature/c/");

        xzarrguard::CheckOptions options;
        options.n_threads = 2;
        const auto report = xzarrguard::check_store(store, options);
        CHECK(!report.ok);
        CHECK(report.errors.empty());
        EXPECT_EQ(size_t, report.variables.size(), 2);

        const auto& temperature = report.variables.at("temperature");
        CHECK(!temperature.ok);
        CHECK(temperature.error.has_value());
        CHECK(temperature.error->find("Permission denied") !=
              std::string::npos);

        // the other array is still checked in full
        const auto& counts = report.variables.at("group/counts");
        CHECK(counts.ok);
        CHECK(!counts.error);
        EXPECT_EQ(int, counts.expected_chunks, 3);
        CHECK(counts.missing.empty());

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
