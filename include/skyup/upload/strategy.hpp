#pragma once

#include "skyup/upload/types.hpp"

#include <cstdint>

namespace skyup::upload {

/// SmallFile when size_in_bytes < large_file_size, LargeFile otherwise.
UploadStrategy select_strategy(std::uint64_t size_in_bytes, std::uint64_t large_file_size) noexcept;

} // namespace skyup::upload
