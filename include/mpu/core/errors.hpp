#pragma once

#include <stdexcept>
#include <string>

namespace mpu {

/**
 * @brief Invalid uploader configuration detected before any upload starts
 *
 * Thrown synchronously from option validation, config parsing and chunk
 * planning. Never delivered through an upload's error callback.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace mpu
