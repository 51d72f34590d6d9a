#pragma once

#include "xzarrguard.types.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace xzarrguard {
using ChunkCoordinate = std::vector<uint64_t>;

/**
 * @brief Trim whitespace from a string.
 * @param s The string to trim.
 * @return The string with leading and trailing whitespace removed.
 */
[[nodiscard]]
std::string
trim(std::string_view s);

/**
 * @brief Check if a string is empty, including whitespace.
 * @param s The string to check.
 * @param err_on_empty The message to log if the string is empty.
 * @return True if the string is empty, false otherwise.
 */
bool
is_empty_string(std::string_view s, std::string_view err_on_empty);

/**
 * @brief Percent-encode a string so that it can be used as a single path
 * segment.
 * @details Every byte other than ASCII letters, digits, and '-', '_', '.',
 * '~' is replaced by '%XX' with uppercase hexadecimal digits.
 */
[[nodiscard]]
std::string
percent_encode(std::string_view s);

/**
 * @brief Invert percent_encode.
 * @throw xzarrguard::Error with XzgStatusCode_InvalidArgument on a truncated
 * or non-hexadecimal escape.
 */
[[nodiscard]]
std::string
percent_decode(std::string_view s);

/**
 * @brief Get the number of chunks along a dimension.
 * @param array_size The size of the array along the dimension.
 * @param chunk_size The size of a chunk along the dimension.
 * @return The number of, possibly ragged, chunks along the dimension.
 * @throw xzarrguard::Error with XzgStatusCode_InvalidShape if the chunk size is
 * zero.
 */
uint64_t
chunks_along_dimension(uint64_t array_size, uint64_t chunk_size);

/**
 * @brief Get the number of bytes for a given data type.
 * @param data_type The data type.
 * @return The number of bytes for the data type.
 * @throw std::invalid_argument if the data type is not recognized.
 */
size_t
bytes_of_type(XzgDataType data_type);

/// @brief The Zarr v3 name of a data type, e.g. "float32".
const char*
data_type_to_string(XzgDataType data_type);

/**
 * @brief Parse a Zarr v3 data type name.
 * @throw xzarrguard::Error with XzgStatusCode_InvalidArgument if the name is
 * not a supported data type.
 */
XzgDataType
data_type_from_string(std::string_view name);

/// @brief Render a coordinate as "(i, j, k)".
std::string
to_string(const ChunkCoordinate& coord);
} // namespace xzarrguard
