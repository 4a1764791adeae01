#include "mpu/upload/file_handle.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <limits>
#include <system_error>

namespace mpu::upload {
namespace fs = std::filesystem;

ByteRange::ByteRange(const FileHandle& file, std::uint64_t begin, std::uint64_t end)
    : file_(&file), begin_(begin), end_(std::max(begin, end)) {}

mpu::Result<std::vector<std::uint8_t>> ByteRange::read() const {
    return read(0, size());
}

mpu::Result<std::vector<std::uint8_t>> ByteRange::read(std::uint64_t offset, std::uint64_t length) const {
    if (offset > size()) {
        return mpu::Err<std::vector<std::uint8_t>>(std::string("Read offset past end of range"));
    }
    const std::uint64_t available = std::min(length, size() - offset);
    if (available > std::numeric_limits<std::size_t>::max()) {
        return mpu::Err<std::vector<std::uint8_t>>(std::string("Range too large to read at once"));
    }

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(available));
    if (buffer.empty()) {
        return mpu::Ok(std::move(buffer));
    }

    auto read_result = file_->read_at(begin_ + offset, buffer.data(), buffer.size());
    if (read_result.is_error()) {
        return mpu::Err<std::vector<std::uint8_t>>(read_result.error());
    }
    buffer.resize(read_result.value());
    return mpu::Ok(std::move(buffer));
}

ByteRange FileHandle::slice(std::uint64_t begin, std::uint64_t end) const {
    const std::uint64_t total = size();
    const std::uint64_t clamped_begin = std::min(begin, total);
    const std::uint64_t clamped_end = std::max(clamped_begin, std::min(end, total));
    return ByteRange(*this, clamped_begin, clamped_end);
}

MemoryFile::MemoryFile(std::string name, std::vector<std::uint8_t> bytes)
    : name_(std::move(name)), bytes_(std::move(bytes)) {}

MemoryFile::MemoryFile(std::string name, const std::string& contents)
    : name_(std::move(name)), bytes_(contents.begin(), contents.end()) {}

mpu::Result<std::size_t> MemoryFile::read_at(std::uint64_t offset,
                                             std::uint8_t* buffer,
                                             std::size_t length) const {
    if (offset >= bytes_.size()) {
        return mpu::Ok<std::size_t>(0);
    }
    const auto start = static_cast<std::size_t>(offset);
    const std::size_t count = std::min(length, bytes_.size() - start);
    std::memcpy(buffer, bytes_.data() + start, count);
    return mpu::Ok(count);
}

mpu::Result<std::unique_ptr<LocalFile>> LocalFile::open(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return mpu::Err<std::unique_ptr<LocalFile>>(std::string("Not a regular file: ") + path.string());
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return mpu::Err<std::unique_ptr<LocalFile>>(std::string("Failed to stat file: ") + path.string());
    }
    return mpu::Ok(std::unique_ptr<LocalFile>(new LocalFile(path, static_cast<std::uint64_t>(size))));
}

LocalFile::LocalFile(fs::path path, std::uint64_t size)
    : path_(std::move(path)), name_(path_.filename().string()), size_(size) {}

mpu::Result<std::size_t> LocalFile::read_at(std::uint64_t offset,
                                            std::uint8_t* buffer,
                                            std::size_t length) const {
    if (offset >= size_ || length == 0) {
        return mpu::Ok<std::size_t>(0);
    }

    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        return mpu::Err<std::size_t>(std::string("Failed to open source file: ") + path_.string());
    }

    input.seekg(static_cast<std::streamoff>(offset));
    input.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(length));
    if (input.bad()) {
        return mpu::Err<std::size_t>(std::string("Failed to read source file: ") + path_.string());
    }
    return mpu::Ok(static_cast<std::size_t>(input.gcount()));
}

} // namespace mpu::upload
