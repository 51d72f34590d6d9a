#include "file.store.hh"
#include "file.sink.hh"
#include "unit.test.macros.hh"

#include <filesystem>

namespace fs = std::filesystem;

int
main()
{
    int retval = 1;
    const auto root = fs::temp_directory_path() / TEST;
    fs::remove_all(root);

    try {
        fs::create_directories(root / "group" / "array" / "c" / "0");
        xzarrguard::write_file((root / "zarr.json").string(), "{}");
        xzarrguard::write_file((root / "group" / "zarr.json").string(), "{}");
        xzarrguard::write_file((root / "group" / "array" / "c" / "0" / "1").string(),
                               "chunk");
        xzarrguard::write_file((root / "group" / "b").string(), "");

        xzarrguard::FileStore store(root);
        EXPECT_STR_EQ(store.location().c_str(), root.string().c_str());

        CHECK(store.exists("zarr.json"));
        CHECK(store.exists("group/array/c/0/1"));
        CHECK(store.exists("group/b"));
        CHECK(!store.exists("group/array/c/0/2"));

        // directories are not keys
        CHECK(!store.exists("group"));
        CHECK(!store.exists("group/array/c/0"));

        // a path through a file is simply absent
        CHECK(!store.exists("group/b/c"));

        const auto chunk = store.read("group/array/c/0/1");
        CHECK(chunk.has_value());
        EXPECT_STR_EQ(chunk->c_str(), "chunk");
        CHECK(!store.read("group/missing").has_value());
        CHECK(store.read("group/b").has_value());

        auto children = store.list_children("");
        EXPECT_EQ(size_t, children.size(), 2);
        EXPECT_STR_EQ(children[0].c_str(), "group");
        EXPECT_STR_EQ(children[1].c_str(), "zarr.json");

        children = store.list_children("group");
        EXPECT_EQ(size_t, children.size(), 3);
        EXPECT_STR_EQ(children[0].c_str(), "array");
        EXPECT_STR_EQ(children[1].c_str(), "b");
        EXPECT_STR_EQ(children[2].c_str(), "zarr.json");

        CHECK(store.list_children("nowhere").empty());
        CHECK(store.list_children("group/b").empty());

        EXPECT_STR_EQ(xzarrguard::join_key("", "a").c_str(), "a");
        EXPECT_STR_EQ(xzarrguard::join_key("a", "").c_str(), "a");
        EXPECT_STR_EQ(xzarrguard::join_key("a", "b").c_str(), "a/b");

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    fs::remove_all(root);
    return retval;
}
