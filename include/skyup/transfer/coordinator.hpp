#pragma once

#include "skyup/core/result.hpp"
#include "skyup/transfer/protocol.hpp"
#include "skyup/upload/options.hpp"
#include "skyup/upload/source.hpp"
#include "skyup/upload/types.hpp"

#include <string>

namespace skyup::transfer {

/**
 * @brief Runs one upload call end to end
 *
 * 1. Validates the merged options (InvalidArgument, no I/O on failure).
 * 2. Picks the strategy from the payload size.
 * 3. SmallFile: one request through the SingleRequestUploader.
 * 4. LargeFile: clamps the parallelism, partitions the payload into
 *    chunk-aligned parts and runs one ResumableSession per part on its own
 *    task. Session i+1 starts once session i has delivered
 *    `stagger_percent` of its first chunk, or has ended. Any failure cancels
 *    the remaining sessions.
 * 5. Concatenates the parts when there is more than one, probes the final
 *    upload for its skylink and normalizes it.
 *
 * Progress is pushed to the context's channel, which is closed before
 * upload() returns.
 */
class ParallelUploadCoordinator {
public:
    ParallelUploadCoordinator(ResumableProtocol& protocol, SingleRequestUploader& single_request);

    Result<upload::UploadOutcome> upload(const upload::ByteSource& source,
                                         const std::string& filename,
                                         const upload::UploadOptions& options,
                                         const upload::UploadContext& context = {});

private:
    Result<upload::UploadOutcome> run(const upload::ByteSource& source,
                                      const std::string& filename,
                                      const upload::UploadOptions& options,
                                      const upload::UploadContext& context);

    Result<upload::UploadOutcome> upload_small(const upload::ByteSource& source,
                                               const std::string& filename,
                                               const upload::UploadOptions& options,
                                               const upload::UploadContext& context);

    Result<upload::UploadOutcome> upload_large(const upload::ByteSource& source,
                                               const std::string& filename,
                                               const upload::UploadOptions& options,
                                               const upload::UploadContext& context);

    /// Concatenate (when needed), probe and normalize the skylink.
    Result<std::string> finalize(const std::vector<std::string>& locations,
                                 const UploadMetadata& metadata);

    ResumableProtocol& protocol_;
    SingleRequestUploader& single_request_;
};

} // namespace skyup::transfer
