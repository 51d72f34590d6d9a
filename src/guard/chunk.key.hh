#pragma once

#include "array.metadata.hh"
#include "xzarrguard.common.hh"

#include <string>

namespace xzarrguard {
/**
 * @brief Encode a chunk coordinate relative to its array node.
 * @details With the default encoding this is "c" followed by each index, all
 * joined by the separator ("c/0/1"); a rank-0 array has key "c". With the v2
 * encoding the indices alone are joined ("0.1"); a rank-0 array has key "0".
 * @throw xzarrguard::Error with XzgStatusCode_InvalidCoordinate if the rank of
 * @p coord differs from the rank of the array.
 */
std::string
array_chunk_key(const ArraySpec& spec, const ChunkCoordinate& coord);

/**
 * @brief Encode a chunk coordinate relative to the store root, i.e. the
 * array's name followed by array_chunk_key ("temperature/c/0/1").
 * @throw xzarrguard::Error with XzgStatusCode_InvalidCoordinate if the rank of
 * @p coord differs from the rank of the array.
 */
std::string
chunk_key(const ArraySpec& spec, const ChunkCoordinate& coord);
} // namespace xzarrguard
