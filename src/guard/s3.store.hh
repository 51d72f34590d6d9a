#pragma once

#include "store.hh"
#include "s3.connection.hh"

namespace xzarrguard {
/**
 * @brief A store rooted at a key prefix in an S3 bucket.
 * @details Only existence, listing and whole-object reads are supported.
 */
class S3Store : public Store
{
  public:
    S3Store(std::string_view bucket_name,
            std::string_view root_prefix,
            std::shared_ptr<S3ConnectionPool> connection_pool);

    std::string location() const override;
    bool exists(std::string_view key) const override;
    std::optional<std::string> read(std::string_view key) const override;
    std::vector<std::string> list_children(
      std::string_view prefix) const override;

  private:
    std::string bucket_name_;
    std::string root_prefix_;
    std::shared_ptr<S3ConnectionPool> connection_pool_;

    std::string object_name_(std::string_view key) const;
};
} // namespace xzarrguard
