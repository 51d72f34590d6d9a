#include "chunk.key.hh"
#include "macros.hh"
#include "store.hh"

std::string
xzarrguard::array_chunk_key(const ArraySpec& spec,
                            const ChunkCoordinate& coord)
{
    EXPECT_STATUS(coord.size() == spec.ndims(),
                  XzgStatusCode_InvalidCoordinate,
                  "Chunk coordinate ",
                  to_string(coord),
                  " has rank ",
                  coord.size(),
                  " but '",
                  spec.name,
                  "' has rank ",
                  spec.ndims());

    std::string key;
    switch (spec.chunk_key_encoding) {
        case ChunkKeyEncoding::Default:
            key = "c";
            for (const auto& index : coord) {
                key += spec.separator;
                key += std::to_string(index);
            }
            break;
        case ChunkKeyEncoding::V2:
            if (coord.empty()) {
                key = "0";
            }
            for (auto i = 0; i < coord.size(); ++i) {
                if (i > 0) {
                    key += spec.separator;
                }
                key += std::to_string(coord[i]);
            }
            break;
    }

    return key;
}

std::string
xzarrguard::chunk_key(const ArraySpec& spec, const ChunkCoordinate& coord)
{
    return join_key(spec.name, array_chunk_key(spec, coord));
}
