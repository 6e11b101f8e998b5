#pragma once

#include "skyup/core/cancellation.hpp"
#include "skyup/core/result.hpp"
#include "skyup/network/http_types.hpp"
#include "skyup/upload/options.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace skyup::transfer {

/// Reported while a request body is on the wire: bytes of it written so far.
using ChunkProgress = std::function<void(std::uint64_t bytes_written)>;

/**
 * @brief Metadata attached to every resumable upload
 */
struct UploadMetadata {
    std::string filename;
    std::string filetype;
};

struct CreateRequest {
    std::uint64_t length = 0;
    UploadMetadata metadata;
    bool partial = false;  ///< Part of a later concatenation
};

/**
 * @brief Server side of a resumable, offset-tracked upload
 *
 * Locations are absolute URLs identifying one upload on the server.
 * Transient failures are reported as TransportError with `transient` set;
 * every other failure is final for the calling session.
 */
class ResumableProtocol {
public:
    virtual ~ResumableProtocol() = default;

    /// Announce an upload of `length` bytes; returns its location.
    virtual Result<std::string> create(const CreateRequest& request) = 0;

    /**
     * @brief Append `size` bytes at `offset`
     *
     * A trip of `cancel` while the bytes are on the wire abandons the write
     * with a Cancelled error.
     *
     * RETURNS: the offset the server acknowledged after the write
     */
    virtual Result<std::uint64_t> patch(const std::string& location,
                                        std::uint64_t offset,
                                        const std::uint8_t* data,
                                        std::size_t size,
                                        const ChunkProgress& progress,
                                        const CancellationToken* cancel = nullptr) = 0;

    /// Offset the server currently holds for `location`.
    virtual Result<std::uint64_t> offset(const std::string& location) = 0;

    /// Join finished partial uploads, in order, into one final upload.
    virtual Result<std::string> concatenate(const std::vector<std::string>& part_locations,
                                            const UploadMetadata& metadata) = 0;

    /// Response headers of a metadata request on a finished upload.
    virtual Result<network::HeaderMap> probe(const std::string& location) = 0;
};

/**
 * @brief Single-request upload endpoint used below the large-file threshold
 */
class SingleRequestUploader {
public:
    virtual ~SingleRequestUploader() = default;

    /**
     * @brief Upload the whole payload in one request
     *
     * RETURNS: the skylink exactly as the portal sent it
     */
    virtual Result<std::string> post(const std::vector<std::uint8_t>& data,
                                     const std::string& filename,
                                     const upload::UploadOptions& options,
                                     const ChunkProgress& progress,
                                     const CancellationToken* cancel = nullptr) = 0;
};

} // namespace skyup::transfer
