#include "file.store.hh"
#include "macros.hh"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

xzarrguard::FileStore::FileStore(const fs::path& root)
  : root_{ root }
{
}

std::string
xzarrguard::FileStore::location() const
{
    return root_.string();
}

fs::path
xzarrguard::FileStore::path_of_(std::string_view key) const
{
    return key.empty() ? root_ : root_ / fs::path(key);
}

bool
xzarrguard::FileStore::exists(std::string_view key) const
{
    const auto path = path_of_(key);

    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory &&
        ec != std::errc::not_a_directory) {
        EXPECT_STATUS(false,
                      XzgStatusCode_StoreUnreadable,
                      "Failed to stat '",
                      path.string(),
                      "': ",
                      ec.message());
    }

    return fs::is_regular_file(status);
}

std::optional<std::string>
xzarrguard::FileStore::read(std::string_view key) const
{
    if (!exists(key)) {
        return std::nullopt;
    }

    const auto path = path_of_(key);
    std::ifstream ifs(path, std::ios::binary);
    EXPECT_STATUS(ifs.is_open(),
                  XzgStatusCode_StoreUnreadable,
                  "Failed to open '",
                  path.string(),
                  "' for reading");

    std::ostringstream ss;
    ss << ifs.rdbuf();
    EXPECT_STATUS(!ifs.bad(),
                  XzgStatusCode_StoreUnreadable,
                  "Failed to read '",
                  path.string(),
                  "'");

    return ss.str();
}

std::vector<std::string>
xzarrguard::FileStore::list_children(std::string_view prefix) const
{
    const auto path = path_of_(prefix);

    std::vector<std::string> children;
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return children;
    }

    for (fs::directory_iterator it(path, ec), end; !ec && it != end;
         it.increment(ec)) {
        children.push_back(it->path().filename().string());
    }
    EXPECT_STATUS(!ec,
                  XzgStatusCode_StoreUnreadable,
                  "Failed to list '",
                  path.string(),
                  "': ",
                  ec.message());

    std::sort(children.begin(), children.end());
    return children;
}
