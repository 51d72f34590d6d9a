#include "macros.hh"
#include "s3.store.hh"

namespace {
/// Returns a connection to the pool when it goes out of scope.
class ConnectionLease
{
  public:
    explicit ConnectionLease(xzarrguard::S3ConnectionPool& pool)
      : pool_{ pool }
      , conn_{ pool.get_connection() }
    {
        EXPECT_STATUS(conn_ != nullptr,
                      XzgStatusCode_StoreUnreadable,
                      "S3 connection pool is shutting down.");
    }

    ~ConnectionLease() noexcept
    {
        if (conn_) {
            pool_.return_connection(std::move(conn_));
        }
    }

    xzarrguard::S3Connection* operator->() { return conn_.get(); }

  private:
    xzarrguard::S3ConnectionPool& pool_;
    std::unique_ptr<xzarrguard::S3Connection> conn_;
};
} // namespace

xzarrguard::S3Store::S3Store(std::string_view bucket_name,
                             std::string_view root_prefix,
                             std::shared_ptr<S3ConnectionPool> connection_pool)
  : bucket_name_{ bucket_name }
  , root_prefix_{ root_prefix }
  , connection_pool_{ connection_pool }
{
    EXPECT(!bucket_name_.empty(), "Bucket name must not be empty.");
    EXPECT(connection_pool_, "S3 connection pool not provided.");

    while (root_prefix_.ends_with('/')) {
        root_prefix_.pop_back();
    }

    ConnectionLease conn(*connection_pool_);
    EXPECT_STATUS(conn->bucket_exists(bucket_name_),
                  XzgStatusCode_StoreUnreadable,
                  "Bucket '",
                  bucket_name_,
                  "' does not exist.");
}

std::string
xzarrguard::S3Store::location() const
{
    return "s3://" + join_key(bucket_name_, root_prefix_);
}

std::string
xzarrguard::S3Store::object_name_(std::string_view key) const
{
    return join_key(root_prefix_, key);
}

bool
xzarrguard::S3Store::exists(std::string_view key) const
{
    ConnectionLease conn(*connection_pool_);
    return conn->object_exists(bucket_name_, object_name_(key));
}

std::optional<std::string>
xzarrguard::S3Store::read(std::string_view key) const
{
    ConnectionLease conn(*connection_pool_);
    return conn->get_object(bucket_name_, object_name_(key));
}

std::vector<std::string>
xzarrguard::S3Store::list_children(std::string_view prefix) const
{
    ConnectionLease conn(*connection_pool_);
    return conn->list_children(bucket_name_, object_name_(prefix));
}
