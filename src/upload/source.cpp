#include "skyup/upload/source.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <string>

namespace skyup::upload {
namespace fs = std::filesystem;
namespace {

Result<void> check_range(const Part& range, std::uint64_t size) {
    if (range.start > range.end || range.end > size) {
        return Err<void>(invalid_argument(
            "range [" + std::to_string(range.start) + ", " + std::to_string(range.end) +
            ") is outside the source of " + std::to_string(size) + " bytes"));
    }
    return Ok();
}

class MemoryRangeReader : public RangeReader {
public:
    MemoryRangeReader(std::shared_ptr<const std::vector<std::uint8_t>> data, Part range)
        : data_(std::move(data)), range_(range) {}

    std::uint64_t size() const override { return range_.length(); }

    Result<std::size_t> read_at(std::uint64_t offset, std::uint8_t* out, std::size_t count) override {
        if (offset > range_.length()) {
            return Err<std::size_t>(upload_failed("read past the end of the range"));
        }
        const auto available = range_.length() - offset;
        const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(count, available));
        if (n > 0) {
            std::memcpy(out, data_->data() + range_.start + offset, n);
        }
        return Ok(n);
    }

private:
    std::shared_ptr<const std::vector<std::uint8_t>> data_;
    Part range_;
};

class FileRangeReader : public RangeReader {
public:
    FileRangeReader(fs::path path, Part range)
        : path_(std::move(path)), range_(range), input_(path_, std::ios::binary) {}

    bool is_open() const { return static_cast<bool>(input_); }

    std::uint64_t size() const override { return range_.length(); }

    Result<std::size_t> read_at(std::uint64_t offset, std::uint8_t* out, std::size_t count) override {
        if (offset > range_.length()) {
            return Err<std::size_t>(upload_failed("read past the end of the range"));
        }
        const auto available = range_.length() - offset;
        const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(count, available));
        if (n == 0) {
            return Ok(std::size_t{0});
        }

        input_.clear();
        input_.seekg(static_cast<std::streamoff>(range_.start + offset));
        input_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(n));
        const auto got = static_cast<std::size_t>(input_.gcount());
        if (got != n) {
            return Err<std::size_t>(upload_failed(
                "short read from " + path_.string() + " at offset " +
                std::to_string(range_.start + offset)));
        }
        return Ok(got);
    }

private:
    fs::path path_;
    Part range_;
    std::ifstream input_;
};

class StreamRangeReader : public RangeReader {
public:
    StreamRangeReader(std::istream& stream, std::uint64_t size) : stream_(stream), size_(size) {}

    std::uint64_t size() const override { return size_; }

    Result<std::size_t> read_at(std::uint64_t offset, std::uint8_t* out, std::size_t count) override {
        if (offset < cursor_) {
            return Err<std::size_t>(upload_failed(
                "stream source cannot rewind to offset " + std::to_string(offset)));
        }
        if (offset > size_) {
            return Err<std::size_t>(upload_failed("read past the end of the stream"));
        }

        char discard[4096];
        while (cursor_ < offset) {
            const auto step = static_cast<std::streamsize>(
                std::min<std::uint64_t>(sizeof(discard), offset - cursor_));
            stream_.read(discard, step);
            if (stream_.gcount() != step) {
                return Err<std::size_t>(upload_failed("stream ended early"));
            }
            cursor_ += static_cast<std::uint64_t>(step);
        }

        const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(count, size_ - offset));
        if (n == 0) {
            return Ok(std::size_t{0});
        }
        stream_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(n));
        const auto got = static_cast<std::size_t>(stream_.gcount());
        cursor_ += got;
        if (got != n) {
            return Err<std::size_t>(upload_failed("stream ended early"));
        }
        return Ok(got);
    }

private:
    std::istream& stream_;
    std::uint64_t size_;
    std::uint64_t cursor_ = 0;
};

} // namespace

Result<std::vector<std::uint8_t>> ByteSource::read_all() const {
    auto reader = open_range(Part{0, size()});
    if (reader.is_error()) {
        return Err<std::vector<std::uint8_t>>(reader.error());
    }
    std::vector<std::uint8_t> data(static_cast<std::size_t>(size()));
    auto read = reader.value()->read_at(0, data.data(), data.size());
    if (read.is_error()) {
        return Err<std::vector<std::uint8_t>>(read.error());
    }
    data.resize(read.value());
    return Ok(std::move(data));
}

MemorySource::MemorySource(std::vector<std::uint8_t> data)
    : data_(std::make_shared<const std::vector<std::uint8_t>>(std::move(data))) {}

MemorySource::MemorySource(const std::string& text)
    : MemorySource(std::vector<std::uint8_t>(text.begin(), text.end())) {}

std::uint64_t MemorySource::size() const {
    return data_->size();
}

Result<std::unique_ptr<RangeReader>> MemorySource::open_range(const Part& range) const {
    if (auto res = check_range(range, size()); res.is_error()) {
        return Err<std::unique_ptr<RangeReader>>(res.error());
    }
    return Ok<std::unique_ptr<RangeReader>>(std::make_unique<MemoryRangeReader>(data_, range));
}

FileSource::FileSource(fs::path path, std::uint64_t size) : path_(std::move(path)), size_(size) {}

Result<std::unique_ptr<FileSource>> FileSource::open(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<std::unique_ptr<FileSource>>(invalid_argument("Not a regular file: " + path.string()));
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<std::unique_ptr<FileSource>>(
            invalid_argument("Failed to stat " + path.string() + ": " + ec.message()));
    }
    std::ifstream probe(path, std::ios::binary);
    if (!probe) {
        return Err<std::unique_ptr<FileSource>>(invalid_argument("Failed to open source file: " + path.string()));
    }
    return Ok(std::unique_ptr<FileSource>(new FileSource(path, size)));
}

Result<std::unique_ptr<RangeReader>> FileSource::open_range(const Part& range) const {
    if (auto res = check_range(range, size_); res.is_error()) {
        return Err<std::unique_ptr<RangeReader>>(res.error());
    }
    auto reader = std::make_unique<FileRangeReader>(path_, range);
    if (!reader->is_open()) {
        return Err<std::unique_ptr<RangeReader>>(upload_failed("Failed to open source file: " + path_.string()));
    }
    return Ok<std::unique_ptr<RangeReader>>(std::move(reader));
}

StreamSource::StreamSource(std::istream& stream, std::uint64_t size) : stream_(stream), size_(size) {}

Result<std::unique_ptr<RangeReader>> StreamSource::open_range(const Part& range) const {
    if (range.start != 0 || range.end != size_) {
        return Err<std::unique_ptr<RangeReader>>(invalid_argument(
            "stream source only supports a single reader over the whole payload"));
    }
    std::lock_guard lock(mutex_);
    if (opened_) {
        return Err<std::unique_ptr<RangeReader>>(invalid_argument("stream source was already consumed"));
    }
    opened_ = true;
    return Ok<std::unique_ptr<RangeReader>>(std::make_unique<StreamRangeReader>(stream_, size_));
}

} // namespace skyup::upload
