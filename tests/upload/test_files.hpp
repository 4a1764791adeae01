#pragma once

#include "mpu/upload/file_handle.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>

namespace mpu::test {

/**
 * @brief FileHandle of a given size whose bytes are derived from the offset
 *
 * Holds no data, so multi-gigabyte sizes are cheap. Counts reads so tests can
 * check that planning and slicing stay lazy.
 */
class SizedFile final : public upload::FileHandle {
public:
    explicit SizedFile(std::uint64_t size, std::string name = "sized.bin")
        : size_(size), name_(std::move(name)) {}

    std::uint64_t size() const override { return size_; }
    const std::string& name() const override { return name_; }

    mpu::Result<std::size_t> read_at(std::uint64_t offset,
                                     std::uint8_t* buffer,
                                     std::size_t length) const override {
        ++reads_;
        if (offset >= size_) {
            return mpu::Ok<std::size_t>(0);
        }
        const auto count = static_cast<std::size_t>(std::min<std::uint64_t>(length, size_ - offset));
        for (std::size_t i = 0; i < count; ++i) {
            buffer[i] = static_cast<std::uint8_t>((offset + i) % 251);
        }
        return mpu::Ok(count);
    }

    std::size_t reads() const { return reads_; }

private:
    std::uint64_t size_;
    std::string name_;
    mutable std::size_t reads_ = 0;
};

} // namespace mpu::test
