#include "macros.hh"
#include "s3.connection.hh"

#include <miniocpp/client.h>

#include <algorithm>

namespace {
bool
is_missing_object(const minio::s3::Response& response)
{
    return response.status_code == 404 || response.code == "NoSuchKey" ||
           response.code == "NotFound";
}
} // namespace

xzarrguard::S3Connection::S3Connection(const std::string& endpoint,
                                       const std::string& access_key_id,
                                       const std::string& secret_access_key)
{
    minio::s3::BaseUrl url(endpoint);
    url.https = endpoint.starts_with("https");

    provider_ = std::make_unique<minio::creds::StaticProvider>(
      access_key_id, secret_access_key);
    client_ = std::make_unique<minio::s3::Client>(url, provider_.get());

    CHECK(client_);
}

xzarrguard::S3Connection::~S3Connection() noexcept
{
    client_.reset();
    provider_.reset();
}

bool
xzarrguard::S3Connection::is_connection_valid()
{
    return static_cast<bool>(client_->ListBuckets());
}

bool
xzarrguard::S3Connection::bucket_exists(std::string_view bucket_name)
{
    minio::s3::BucketExistsArgs args;
    args.bucket = bucket_name;

    auto response = client_->BucketExists(args);
    return response.exist;
}

bool
xzarrguard::S3Connection::object_exists(std::string_view bucket_name,
                                        std::string_view object_name)
{
    minio::s3::StatObjectArgs args;
    args.bucket = bucket_name;
    args.object = object_name;

    auto response = client_->StatObject(args);
    if (response) {
        return true;
    }

    EXPECT_STATUS(is_missing_object(response),
                  XzgStatusCode_StoreUnreadable,
                  "Failed to stat object ",
                  object_name,
                  " in bucket ",
                  bucket_name,
                  ": ",
                  response.Error().String());
    return false;
}

std::optional<std::string>
xzarrguard::S3Connection::get_object(std::string_view bucket_name,
                                     std::string_view object_name)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");

    std::string data;

    LOG_DEBUG("Getting object ", object_name, " from bucket ", bucket_name);
    minio::s3::GetObjectArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.datafunc = [&data](minio::http::DataFunctionArgs chunk) -> bool {
        data.append(chunk.datachunk);
        return true;
    };

    auto response = client_->GetObject(args);
    if (!response) {
        if (is_missing_object(response)) {
            return std::nullopt;
        }

        EXPECT_STATUS(false,
                      XzgStatusCode_StoreUnreadable,
                      "Failed to get object ",
                      object_name,
                      " from bucket ",
                      bucket_name,
                      ": ",
                      response.Error().String());
    }

    return data;
}

std::vector<std::string>
xzarrguard::S3Connection::list_children(std::string_view bucket_name,
                                        std::string_view prefix)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");

    std::string full_prefix(prefix);
    if (!full_prefix.empty() && !full_prefix.ends_with('/')) {
        full_prefix += '/';
    }

    minio::s3::ListObjectsArgs args;
    args.bucket = bucket_name;
    args.prefix = full_prefix;
    args.recursive = false;

    std::vector<std::string> children;
    auto result = client_->ListObjects(args);
    for (; result; result++) {
        minio::s3::Item item = *result;
        EXPECT_STATUS(static_cast<bool>(item),
                      XzgStatusCode_StoreUnreadable,
                      "Failed to list prefix '",
                      full_prefix,
                      "' in bucket ",
                      bucket_name,
                      ": ",
                      item.Error().String());

        std::string name = item.name.substr(full_prefix.size());
        if (name.ends_with('/')) {
            name.pop_back();
        }
        if (!name.empty()) {
            children.push_back(std::move(name));
        }
    }

    std::sort(children.begin(), children.end());
    return children;
}

xzarrguard::S3ConnectionPool::S3ConnectionPool(
  size_t n_connections,
  const std::string& endpoint,
  const std::string& access_key_id,
  const std::string& secret_access_key)
{
    for (auto i = 0; i < n_connections; ++i) {
        auto connection = std::make_unique<S3Connection>(
          endpoint, access_key_id, secret_access_key);

        if (connection->is_connection_valid()) {
            connections_.push_back(std::move(connection));
        }
    }

    EXPECT_STATUS(!connections_.empty(),
                  XzgStatusCode_StoreUnreadable,
                  "Failed to connect to S3 endpoint ",
                  endpoint);
}

xzarrguard::S3ConnectionPool::~S3ConnectionPool() noexcept
{
    is_accepting_connections_ = false;
    cv_.notify_all();
}

std::unique_ptr<xzarrguard::S3Connection>
xzarrguard::S3ConnectionPool::get_connection()
{
    std::unique_lock lock(connections_mutex_);
    cv_.wait(lock, [this] {
        return !is_accepting_connections_ || !connections_.empty();
    });

    if (!is_accepting_connections_ || connections_.empty()) {
        return nullptr;
    }

    auto conn = std::move(connections_.back());
    connections_.pop_back();
    return conn;
}

void
xzarrguard::S3ConnectionPool::return_connection(
  std::unique_ptr<S3Connection>&& conn)
{
    std::unique_lock lock(connections_mutex_);
    connections_.push_back(std::move(conn));
    cv_.notify_one();
}
