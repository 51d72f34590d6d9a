#pragma once

#include "store.hh"

#include <filesystem>

namespace xzarrguard {
class FileStore : public Store
{
  public:
    explicit FileStore(const std::filesystem::path& root);

    const std::filesystem::path& root() const { return root_; }

    std::string location() const override;
    bool exists(std::string_view key) const override;
    std::optional<std::string> read(std::string_view key) const override;
    std::vector<std::string> list_children(
      std::string_view prefix) const override;

  private:
    std::filesystem::path root_;

    std::filesystem::path path_of_(std::string_view key) const;
};
} // namespace xzarrguard
