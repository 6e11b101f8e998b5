#include "skyup/upload/strategy.hpp"

namespace skyup::upload {

UploadStrategy select_strategy(std::uint64_t size_in_bytes, std::uint64_t large_file_size) noexcept {
    return size_in_bytes < large_file_size ? UploadStrategy::SmallFile : UploadStrategy::LargeFile;
}

} // namespace skyup::upload
