#include "skyup/upload/types.hpp"

namespace skyup::upload {

const char* to_string(UploadStrategy strategy) {
    switch (strategy) {
        case UploadStrategy::SmallFile: return "small-file";
        case UploadStrategy::LargeFile: return "large-file";
    }
    return "unknown";
}

const char* to_string(ProgressKind kind) {
    switch (kind) {
        case ProgressKind::Started: return "started";
        case ProgressKind::PartStarted: return "part-started";
        case ProgressKind::BytesSent: return "bytes-sent";
        case ProgressKind::Retrying: return "retrying";
        case ProgressKind::PartCompleted: return "part-completed";
        case ProgressKind::Finalizing: return "finalizing";
        case ProgressKind::Completed: return "completed";
        case ProgressKind::Failed: return "failed";
    }
    return "unknown";
}

} // namespace skyup::upload
