#pragma once

#include "skyup/core/result.hpp"
#include "skyup/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <mutex>
#include <vector>

namespace skyup::upload {

/**
 * @brief Reader confined to one byte range of a source
 *
 * Offsets passed to read_at() are relative to the start of the range.
 */
class RangeReader {
public:
    virtual ~RangeReader() = default;

    [[nodiscard]] virtual std::uint64_t size() const = 0;

    /**
     * @brief Read up to `count` bytes at `offset` into `out`
     *
     * RETURNS: bytes read; fewer than `count` only at the end of the range
     */
    virtual Result<std::size_t> read_at(std::uint64_t offset, std::uint8_t* out, std::size_t count) = 0;
};

/**
 * @brief Data to upload
 *
 * Sources that report supports_ranges() hand out any number of independent
 * readers, each with its own cursor, so several sessions can read
 * concurrently. Other sources allow a single sequential reader over the
 * whole payload.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    [[nodiscard]] virtual std::uint64_t size() const = 0;
    [[nodiscard]] virtual bool supports_ranges() const = 0;

    virtual Result<std::unique_ptr<RangeReader>> open_range(const Part& range) const = 0;

    /// Whole payload in memory; used by the single-request path.
    Result<std::vector<std::uint8_t>> read_all() const;
};

class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<std::uint8_t> data);
    explicit MemorySource(const std::string& text);

    std::uint64_t size() const override;
    bool supports_ranges() const override { return true; }
    Result<std::unique_ptr<RangeReader>> open_range(const Part& range) const override;

private:
    std::shared_ptr<const std::vector<std::uint8_t>> data_;
};

/**
 * @brief File on disk; every reader opens its own stream
 */
class FileSource : public ByteSource {
public:
    static Result<std::unique_ptr<FileSource>> open(const std::filesystem::path& path);

    std::uint64_t size() const override { return size_; }
    bool supports_ranges() const override { return true; }
    Result<std::unique_ptr<RangeReader>> open_range(const Part& range) const override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    FileSource(std::filesystem::path path, std::uint64_t size);

    std::filesystem::path path_;
    std::uint64_t size_;
};

/**
 * @brief Sequential stream of known size (pipes, sockets, stdin)
 *
 * Only one reader over the full payload may be opened, and it can only move
 * forward.
 */
class StreamSource : public ByteSource {
public:
    StreamSource(std::istream& stream, std::uint64_t size);

    std::uint64_t size() const override { return size_; }
    bool supports_ranges() const override { return false; }
    Result<std::unique_ptr<RangeReader>> open_range(const Part& range) const override;

private:
    std::istream& stream_;
    std::uint64_t size_;
    mutable std::mutex mutex_;
    mutable bool opened_ = false;
};

} // namespace skyup::upload
