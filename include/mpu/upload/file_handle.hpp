#pragma once

#include "mpu/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace mpu::upload {

class ByteRange;

/**
 * @brief Read-only byte source being uploaded
 *
 * Implementations must be immutable for the lifetime of any session that
 * borrows them and must allow concurrent reads (read_at is const).
 */
class FileHandle {
public:
    virtual ~FileHandle() = default;

    [[nodiscard]] virtual std::uint64_t size() const = 0;
    [[nodiscard]] virtual const std::string& name() const = 0;

    /**
     * @brief Copy up to @p length bytes starting at @p offset into @p buffer
     *
     * @return Number of bytes copied; short only at end of file
     */
    virtual mpu::Result<std::size_t> read_at(std::uint64_t offset,
                                             std::uint8_t* buffer,
                                             std::size_t length) const = 0;

    /**
     * @brief View of [begin, end), clamped to the file bounds
     *
     * Out-of-range bounds are clamped and an inverted range becomes empty.
     * No data is read.
     */
    [[nodiscard]] ByteRange slice(std::uint64_t begin, std::uint64_t end) const;
};

/**
 * @brief Lazy view over a contiguous byte range of a FileHandle
 *
 * Creating a ByteRange never touches the underlying bytes. Data is read
 * only through read(), so many ranges over the same file can coexist
 * without holding the file contents in memory.
 */
class ByteRange {
public:
    ByteRange(const FileHandle& file, std::uint64_t begin, std::uint64_t end);

    [[nodiscard]] std::uint64_t begin() const noexcept { return begin_; }
    [[nodiscard]] std::uint64_t end() const noexcept { return end_; }
    [[nodiscard]] std::uint64_t size() const noexcept { return end_ - begin_; }
    [[nodiscard]] bool empty() const noexcept { return begin_ == end_; }
    [[nodiscard]] const FileHandle& file() const noexcept { return *file_; }

    /// Reads the whole range.
    mpu::Result<std::vector<std::uint8_t>> read() const;

    /// Reads up to @p length bytes starting @p offset bytes into the range.
    mpu::Result<std::vector<std::uint8_t>> read(std::uint64_t offset, std::uint64_t length) const;

private:
    const FileHandle* file_;
    std::uint64_t begin_;
    std::uint64_t end_;
};

/**
 * @brief FileHandle backed by an owned in-memory buffer
 */
class MemoryFile final : public FileHandle {
public:
    MemoryFile(std::string name, std::vector<std::uint8_t> bytes);
    MemoryFile(std::string name, const std::string& contents);

    [[nodiscard]] std::uint64_t size() const override { return bytes_.size(); }
    [[nodiscard]] const std::string& name() const override { return name_; }

    mpu::Result<std::size_t> read_at(std::uint64_t offset,
                                     std::uint8_t* buffer,
                                     std::size_t length) const override;

private:
    std::string name_;
    std::vector<std::uint8_t> bytes_;
};

/**
 * @brief FileHandle backed by a file on disk
 *
 * The size is captured when the handle is opened. Every read opens its own
 * stream so reads never share mutable state.
 */
class LocalFile final : public FileHandle {
public:
    static mpu::Result<std::unique_ptr<LocalFile>> open(const std::filesystem::path& path);

    [[nodiscard]] std::uint64_t size() const override { return size_; }
    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    mpu::Result<std::size_t> read_at(std::uint64_t offset,
                                     std::uint8_t* buffer,
                                     std::size_t length) const override;

private:
    LocalFile(std::filesystem::path path, std::uint64_t size);

    std::filesystem::path path_;
    std::string name_;
    std::uint64_t size_;
};

} // namespace mpu::upload
