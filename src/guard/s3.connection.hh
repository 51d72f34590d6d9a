#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace minio::s3 {
class Client;
} // namespace minio::s3

namespace minio::creds {
class StaticProvider;
} // namespace minio::creds

namespace xzarrguard {
struct S3Settings
{
    std::string endpoint;
    std::string access_key_id;
    std::string secret_access_key;
};

class S3Connection
{
  public:
    S3Connection(const S3Connection&) = delete;
    explicit S3Connection(const std::string& endpoint,
                          const std::string& access_key_id,
                          const std::string& secret_access_key);

    ~S3Connection() noexcept;

    /**
     * @brief Test a connection by listing all buckets at this connection's
     * endpoint.
     * @returns True if the connection is valid, otherwise false.
     */
    bool is_connection_valid();

    /* Bucket operations */

    /**
     * @brief Check whether a bucket exists.
     * @param bucket_name The name of the bucket.
     * @returns True if the bucket exists, otherwise false.
     */
    bool bucket_exists(std::string_view bucket_name);

    /* Object operations */

    /**
     * @brief Check whether an object exists.
     * @param bucket_name The name of the bucket containing the object.
     * @param object_name The name of the object.
     * @returns True if the object exists, false if the server reports it
     * missing.
     * @throws xzarrguard::Error with XzgStatusCode_StoreUnreadable on any other
     * server response.
     */
    bool object_exists(std::string_view bucket_name,
                       std::string_view object_name);

    /**
     * @brief Read an object in full.
     * @returns The object's data, or nullopt if the object does not exist.
     * @throws xzarrguard::Error with XzgStatusCode_StoreUnreadable on failure.
     */
    std::optional<std::string> get_object(std::string_view bucket_name,
                                          std::string_view object_name);

    /**
     * @brief List the names directly under @p prefix, treating '/' as the
     * delimiter.
     * @returns Child names with the prefix and any trailing '/' removed.
     * @throws xzarrguard::Error with XzgStatusCode_StoreUnreadable on failure.
     */
    std::vector<std::string> list_children(std::string_view bucket_name,
                                           std::string_view prefix);

  private:
    std::unique_ptr<minio::s3::Client> client_;
    std::unique_ptr<minio::creds::StaticProvider> provider_;
};

class S3ConnectionPool
{
  public:
    S3ConnectionPool(size_t n_connections,
                     const std::string& endpoint,
                     const std::string& access_key_id,
                     const std::string& secret_access_key);
    ~S3ConnectionPool() noexcept;

    std::unique_ptr<S3Connection> get_connection();
    void return_connection(std::unique_ptr<S3Connection>&& conn);

  private:
    std::vector<std::unique_ptr<S3Connection>> connections_;
    mutable std::mutex connections_mutex_;
    std::condition_variable cv_;

    std::atomic<bool> is_accepting_connections_{ true };
};
} // namespace xzarrguard
