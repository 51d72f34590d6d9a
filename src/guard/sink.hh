#pragma once

#include <cstddef> // size_t, std::byte
#include <memory>  // std::unique_ptr
#include <span>    // std::span
#include <string_view>

namespace xzarrguard {
class Sink
{
  public:
    virtual ~Sink() = default;

    /**
     * @brief Write data to the sink.
     * @param offset The offset in the sink to write to.
     * @param buf The buffer to write to the sink.
     * @return True if the write was successful, false otherwise.
     */
    [[nodiscard]] virtual bool write(size_t offset,
                                     std::span<const std::byte> buf) = 0;

  protected:
    /**
     * @brief Make everything written so far durable and visible.
     * @return True on success, false otherwise.
     */
    [[nodiscard]] virtual bool flush_() = 0;

    friend bool finalize_sink(std::unique_ptr<Sink>&& sink);
};

/**
 * @brief Flush and destroy a sink.
 * @return True if the sink was null or flushed successfully, false otherwise.
 */
bool
finalize_sink(std::unique_ptr<Sink>&& sink);

/// @brief Write the whole of @p text at offset 0.
[[nodiscard]] bool
write_string(Sink& sink, std::string_view text);
} // namespace xzarrguard
