#include "macros.hh"
#include "xzarrguard.common.hh"
#include "file.store.hh"
#include "s3.store.hh"

#include <algorithm>

std::string
xzarrguard::join_key(std::string_view prefix, std::string_view name)
{
    if (prefix.empty()) {
        return std::string(name);
    }
    if (name.empty()) {
        return std::string(prefix);
    }

    std::string key(prefix);
    key += '/';
    key += name;
    return key;
}

std::unique_ptr<xzarrguard::Store>
xzarrguard::open_store(std::string_view location,
                       const S3Settings* s3_settings,
                       size_t n_connections)
{
    if (location.starts_with("s3://")) {
        EXPECT_STATUS(s3_settings != nullptr,
                      XzgStatusCode_InvalidArgument,
                      "S3 settings are required to open ",
                      location);
        EXPECT_STATUS(!is_empty_string(s3_settings->endpoint,
                                       "S3 endpoint is empty"),
                      XzgStatusCode_InvalidArgument,
                      "Invalid S3 settings for ",
                      location);

        auto path = location.substr(5);
        const auto slash = path.find('/');
        const auto bucket_name = path.substr(0, slash);
        const auto prefix =
          slash == std::string_view::npos ? std::string_view{}
                                          : path.substr(slash + 1);
        EXPECT_STATUS(!bucket_name.empty(),
                      XzgStatusCode_InvalidArgument,
                      "No bucket name in ",
                      location);

        auto pool = std::make_shared<S3ConnectionPool>(
          std::max<size_t>(n_connections, 1),
          s3_settings->endpoint,
          s3_settings->access_key_id,
          s3_settings->secret_access_key);
        return std::make_unique<S3Store>(bucket_name, prefix, pool);
    }

    if (location.starts_with("file://")) {
        location = location.substr(7);
    }
    EXPECT_STATUS(!location.empty(),
                  XzgStatusCode_InvalidArgument,
                  "Store path must not be empty.");

    return std::make_unique<FileStore>(std::filesystem::path(location));
}
