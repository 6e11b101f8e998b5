#include "skyup/upload/partitioner.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace skyup::upload {

Result<PartitionPlan> split_into_chunk_aligned_parts(std::uint64_t total_size,
                                                     std::int64_t part_count,
                                                     std::int64_t chunk_size) {
    if (part_count < 1) {
        return Err<PartitionPlan>(invalid_argument(
            "Expected parameter 'partCount' to be greater than or equal to 1, was '" +
            std::to_string(part_count) + "'"));
    }
    if (chunk_size < 1) {
        return Err<PartitionPlan>(invalid_argument(
            "Expected parameter 'chunkSize' to be greater than or equal to 1, was '" +
            std::to_string(chunk_size) + "'"));
    }

    const auto parts = static_cast<std::uint64_t>(part_count);
    const auto chunk = static_cast<std::uint64_t>(chunk_size);

    if (parts > 1 && total_size <= chunk) {
        return Err<PartitionPlan>(invalid_argument(
            "Expected parameter 'totalSize' to be greater than the size of a chunk ('" +
            std::to_string(chunk) + "'), was '" + std::to_string(total_size) + "'"));
    }

    std::vector<std::uint64_t> sizes(static_cast<std::size_t>(parts), 0);

    // Round-robin whole chunks over the parts. Only the first `parts` chunks
    // can land on an empty slot, the rest is plain division, so assign them
    // arithmetically instead of looping once per chunk.
    const std::uint64_t full_chunks = total_size / chunk;
    const std::uint64_t rounds = full_chunks / parts;
    const std::uint64_t extra = full_chunks % parts;
    for (std::uint64_t i = 0; i < parts; ++i) {
        sizes[i] = (rounds + (i < extra ? 1 : 0)) * chunk;
    }

    const std::uint64_t leftover = total_size % chunk;
    if (leftover > 0) {
        const std::uint64_t index = std::min(full_chunks, parts - 1);
        sizes[index] += leftover;
    }

    PartitionPlan plan;
    plan.reserve(sizes.size());
    std::uint64_t boundary = 0;
    for (const auto size : sizes) {
        plan.push_back(Part{boundary, boundary + size});
        boundary += size;
    }
    return Ok(std::move(plan));
}

} // namespace skyup::upload
