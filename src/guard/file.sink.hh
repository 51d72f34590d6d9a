#pragma once

#include "sink.hh"

#include <filesystem>
#include <fstream>
#include <string_view>

namespace xzarrguard {
/**
 * @brief A sink backed by a local file, published atomically.
 * @details Data goes to a temporary file next to the target. Finalizing the
 * sink renames the temporary file over the target, so readers see either the
 * previous file or the complete new one. A sink destroyed without being
 * finalized removes its temporary file.
 */
class FileSink : public Sink
{
  public:
    explicit FileSink(std::string_view filename);
    ~FileSink() override;

    bool write(size_t offset, std::span<const std::byte> data) override;

  protected:
    bool flush_() override;

  private:
    std::filesystem::path path_;
    std::filesystem::path tmp_path_;
    std::ofstream file_;
    bool published_{ false };
};

/**
 * @brief Create a FileSink, creating parent directories as needed.
 * @return The sink, or nullptr if the parent directory could not be created.
 */
std::unique_ptr<Sink>
make_file_sink(std::string_view file_path);

/**
 * @brief Atomically replace the file at @p file_path with @p data, creating
 * parent directories as needed.
 * @throw xzarrguard::Error with XzgStatusCode_IOError on failure.
 */
void
write_file(std::string_view file_path, std::span<const std::byte> data);

/// @copydoc write_file
void
write_file(std::string_view file_path, std::string_view text);
} // namespace xzarrguard
