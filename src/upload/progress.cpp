#include "mpu/upload/progress.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

namespace mpu::upload {
namespace {

std::uint64_t parse_decimal(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Expected a number, got an empty string");
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Expected a number, got '" + text + "'");
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            throw std::invalid_argument("Byte count out of range: " + text);
        }
        value = value * 10 + digit;
    }
    return value;
}

} // namespace

std::uint64_t ensure_int(const ProgressValue& value) {
    if (const auto* integer = std::get_if<std::uint64_t>(&value)) {
        return *integer;
    }
    if (const auto* real = std::get_if<double>(&value)) {
        if (!std::isfinite(*real) || *real < 0.0
            || *real >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
            throw std::invalid_argument("Expected a non-negative byte count, got " + std::to_string(*real));
        }
        return static_cast<std::uint64_t>(*real);
    }
    return parse_decimal(std::get<std::string>(value));
}

std::uint64_t total_uploaded(const std::vector<ChunkState>& states) noexcept {
    return std::accumulate(states.begin(), states.end(), std::uint64_t{0},
        [](std::uint64_t sum, const ChunkState& state) { return sum + state.uploaded_bytes; });
}

} // namespace mpu::upload
