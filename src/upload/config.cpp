#include "mpu/upload/config.hpp"

#include "mpu/core/errors.hpp"
#include "mpu/upload/progress.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace mpu::upload {
namespace {

using json = nlohmann::json;

std::uint64_t read_byte_count(const json& value, const char* key) {
    if (!value.is_number() && !value.is_string()) {
        throw ConfigurationError(std::string("Expected a number for '") + key + "', got " + value.type_name());
    }
    if (value.is_number_integer() && !value.is_number_unsigned()) {
        throw ConfigurationError(std::string("'") + key + "' must not be negative");
    }

    try {
        if (value.is_number_unsigned()) {
            return ensure_int(value.get<std::uint64_t>());
        }
        if (value.is_number_float()) {
            return ensure_int(value.get<double>());
        }
        return ensure_int(value.get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(std::string("Invalid '") + key + "': " + e.what());
    }
}

} // namespace

UploaderConfig parse_config(const json& document) {
    if (!document.is_object()) {
        throw ConfigurationError(std::string("Uploader config must be an object, got ") + document.type_name());
    }

    UploaderConfig config;

    if (auto it = document.find("chunk_size"); it != document.end() && !it->is_null()) {
        config.chunk_size = read_byte_count(*it, "chunk_size");
    }

    if (auto it = document.find("multipart"); it != document.end() && !it->is_null()) {
        if (it->is_boolean()) {
            config.multipart = it->get<bool>();
        } else if (it->is_object()) {
            const auto threshold = it->find("min_file_size");
            if (threshold == it->end()) {
                throw ConfigurationError("'multipart' object requires 'min_file_size'");
            }
            config.multipart = true;
            config.multipart_min_file_size = read_byte_count(*threshold, "multipart.min_file_size");
        } else {
            throw ConfigurationError(std::string("Expected a boolean or object for 'multipart', got ")
                                     + it->type_name());
        }
    }

    if (auto it = document.find("log_level"); it != document.end() && !it->is_null()) {
        if (!it->is_string()) {
            throw ConfigurationError(std::string("Expected a string for 'log_level', got ") + it->type_name());
        }
        const auto name = it->get<std::string>();
        const auto level = spdlog::level::from_str(name);
        // from_str maps unknown names to off
        if (level == spdlog::level::off && name != "off") {
            throw ConfigurationError("Unknown log level: " + name);
        }
        config.log_level = level;
    }

    return config;
}

mpu::Result<UploaderConfig> load_config_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return mpu::Err<UploaderConfig>(std::string("Failed to open config file: ") + path.string());
    }

    try {
        const auto document = json::parse(input);
        auto config = parse_config(document);
        spdlog::debug("Loaded uploader config from {}", path.string());
        return mpu::Ok(std::move(config));
    } catch (const json::exception& e) {
        return mpu::Err<UploaderConfig>(std::string("Malformed config file ") + path.string() + ": " + e.what());
    } catch (const ConfigurationError& e) {
        return mpu::Err<UploaderConfig>(std::string("Invalid config file ") + path.string() + ": " + e.what());
    }
}

void apply_config(const UploaderConfig& config, UploaderOptions& options) {
    if (config.chunk_size) {
        const std::uint64_t chunk_size = *config.chunk_size;
        options.get_chunk_size = [chunk_size](const FileHandle&) { return chunk_size; };
    }

    if (config.multipart_min_file_size) {
        const std::uint64_t threshold = *config.multipart_min_file_size;
        options.should_use_multipart = std::function<bool(const FileHandle&)>(
            [threshold](const FileHandle& file) { return file.size() >= threshold; });
    } else {
        options.should_use_multipart = config.multipart;
    }
}

} // namespace mpu::upload
