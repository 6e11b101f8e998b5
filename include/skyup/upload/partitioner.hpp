#pragma once

#include "skyup/core/result.hpp"
#include "skyup/upload/types.hpp"

#include <cstdint>

namespace skyup::upload {

/**
 * @brief Split [0, totalSize) into `part_count` contiguous ranges whose
 * sizes are whole multiples of `chunk_size`, except for one part that
 * absorbs the unaligned remainder.
 *
 * Whole chunks are dealt round-robin over the parts. The remainder goes to
 * part min(fullChunks, part_count - 1): the part after the last one that
 * received a chunk, or the last part once every part has been visited.
 * Parts are chunk-aligned so an interrupted session can always resume on a
 * chunk boundary.
 *
 * Fails with InvalidArgument when part_count < 1, chunk_size < 1, or when
 * total_size <= chunk_size and more than one part is requested.
 */
Result<PartitionPlan> split_into_chunk_aligned_parts(std::uint64_t total_size,
                                                     std::int64_t part_count,
                                                     std::int64_t chunk_size);

} // namespace skyup::upload
