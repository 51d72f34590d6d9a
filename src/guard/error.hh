#pragma once

#include "xzarrguard.types.h"

#include <stdexcept>
#include <string>

namespace xzarrguard {
/**
 * @brief An error raised by the library, tagged with the status code the C API
 * reports for it.
 */
class Error : public std::runtime_error
{
  public:
    Error(XzgStatusCode code, const std::string& what)
      : std::runtime_error(what)
      , code_{ code }
    {
    }

    XzgStatusCode code() const noexcept { return code_; }

  private:
    XzgStatusCode code_;
};

/// @brief Name of a status code, e.g. "ManifestCorrupt".
const char*
status_code_name(XzgStatusCode code);
} // namespace xzarrguard
