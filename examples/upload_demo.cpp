/**
 * @file upload_demo.cpp
 * @brief Uploads a local file through the simulated transport
 *
 * Usage: mpu_upload_demo <file> [config.json]
 *
 * The upload is paused once after its first part is stored and resumed
 * shortly afterwards, so the log shows the full pause/resume cycle. The
 * final session snapshot is printed as JSON.
 */

#include "mpu/core/errors.hpp"
#include "mpu/transport/simulated_transport.hpp"
#include "mpu/upload/config.hpp"
#include "mpu/upload/serialization.hpp"
#include "mpu/upload/session.hpp"

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace asio = boost::asio;
namespace fs = std::filesystem;
using mpu::transport::SimulatedTransport;
using mpu::upload::PartInfo;
using mpu::upload::TransportError;
using mpu::upload::UploadResult;
using mpu::upload::UploadSession;

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file> [config.json]\n";
        return 2;
    }

    mpu::upload::UploaderConfig config;
    if (argc > 2) {
        auto loaded = mpu::upload::load_config_file(argv[2]);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error());
            return 1;
        }
        config = loaded.value();
    }
    spdlog::set_level(config.log_level);

    auto opened = mpu::upload::LocalFile::open(fs::path(argv[1]));
    if (opened.is_error()) {
        spdlog::error("{}", opened.error());
        return 1;
    }
    const auto& file = *opened.value();

    asio::io_context io_context;
    SimulatedTransport::Options transport_options;
    transport_options.progress_step = 1024 * 1024;
    SimulatedTransport transport(io_context, transport_options);
    asio::steady_timer resume_timer(io_context);

    std::weak_ptr<UploadSession> weak_session;
    bool paused_once = false;
    int exit_code = 0;

    mpu::upload::UploaderOptions options;
    mpu::upload::apply_config(config, options);
    options.on_progress = [](std::uint64_t uploaded, std::uint64_t total) {
        const double percent = total == 0 ? 100.0 : 100.0 * static_cast<double>(uploaded) / static_cast<double>(total);
        spdlog::info("Progress: {}/{} bytes ({:.1f}%)", uploaded, total, percent);
    };
    options.on_part_complete = [&](const PartInfo& part) {
        spdlog::info("Part {} stored, ETag {}", part.part_number, part.etag);
        if (paused_once) {
            return;
        }
        auto session = weak_session.lock();
        if (!session || session->state() != mpu::upload::UploadState::Active) {
            return;
        }
        paused_once = true;
        session->pause();
        resume_timer.expires_after(std::chrono::milliseconds(50));
        resume_timer.async_wait([&weak_session](boost::system::error_code ec) {
            if (ec) {
                return;
            }
            if (auto resumed = weak_session.lock()) {
                auto result = resumed->start();
                if (result.is_error()) {
                    spdlog::error("Resume failed: {}", result.error());
                }
            }
        });
    };
    options.on_success = [](const UploadResult& result) {
        spdlog::info("Upload finished: {}", mpu::upload::upload_result_to_json(result).dump());
    };
    options.on_error = [&exit_code](const TransportError& error) {
        spdlog::error("Upload failed ({}): {}", error.code, error.message);
        exit_code = 1;
    };

    std::shared_ptr<UploadSession> session;
    try {
        session = UploadSession::create(file, transport, options);
    } catch (const mpu::ConfigurationError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }
    weak_session = session;

    spdlog::info("Uploading {} ({} bytes, {} part(s))", file.name(), file.size(), session->chunks().size());
    if (auto started = session->start(); started.is_error()) {
        spdlog::error("{}", started.error());
        return 1;
    }

    io_context.run();

    std::cout << mpu::upload::session_snapshot_to_json(*session).dump(2) << std::endl;
    return exit_code;
}
