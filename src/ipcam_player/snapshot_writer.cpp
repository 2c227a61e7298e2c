#include "ipcam_player/snapshot_writer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>

#include "ipcam_player/logging.hpp"

namespace ipcam_player {

namespace {

constexpr std::string_view k_default_extension{".png"};
constexpr std::array<std::string_view, 4> k_supported_extensions{".png", ".jpg", ".jpeg", ".bmp"};

std::string output_extension(const std::filesystem::path& destination_base) {
    std::string extension = destination_base.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char value) {
        return static_cast<char>(std::tolower(value));
    });
    const bool supported = std::find(k_supported_extensions.begin(), k_supported_extensions.end(), extension)
        != k_supported_extensions.end();
    return supported ? extension : std::string{k_default_extension};
}

SnapshotResult failure(SnapshotError error, std::filesystem::path path, std::string message) {
    SnapshotResult result{};
    result.path = std::move(path);
    result.error = error;
    result.message = std::move(message);
    return result;
}

}  // namespace

std::tm current_local_time() {
    return fmt::localtime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

SnapshotWriter::SnapshotWriter(LocalTimeSource time_source)
    : time_source_(std::move(time_source)),
      logger_(get_logger()) {}

std::string SnapshotWriter::format_timestamp(const std::tm& local_time) {
    return fmt::format("{:%m-%d-%Y_%I-%M-%S}{}", local_time, local_time.tm_hour < 12 ? "AM" : "PM");
}

std::filesystem::path SnapshotWriter::timestamped_path(const std::filesystem::path& destination_base) const {
    const std::string file_name = fmt::format(
        "{}_{}{}",
        destination_base.stem().string(),
        format_timestamp(time_source_()),
        output_extension(destination_base)
    );
    return destination_base.parent_path() / file_name;
}

SnapshotResult SnapshotWriter::save(const cv::Mat& rendered_image, const std::filesystem::path& destination_base) const {
    if (rendered_image.empty()) {
        logger_->warn("No rendered frame available for snapshot");
        return failure(SnapshotError::NoFrame, {}, "No frame available for snapshot");
    }
    if (destination_base.stem().empty()) {
        return failure(SnapshotError::WriteFailed, destination_base, "Snapshot destination has no file name");
    }

    const std::filesystem::path final_path = timestamped_path(destination_base);

    if (final_path.has_parent_path()) {
        std::error_code error_directory;
        std::filesystem::create_directories(final_path.parent_path(), error_directory);
        if (error_directory) {
            logger_->error("Unable to create snapshot directory {}: {}", final_path.parent_path().string(), error_directory.message());
            return failure(SnapshotError::WriteFailed, final_path, "Unable to create snapshot directory");
        }
    }

    bool written = false;
    try {
        written = cv::imwrite(final_path.string(), rendered_image);
    } catch (const cv::Exception& exc) {
        logger_->error("Snapshot encode raised: {}", exc.what());
        return failure(SnapshotError::EncodeFailed, final_path, fmt::format("Failed to encode snapshot: {}", exc.what()));
    }
    if (!written) {
        logger_->error("Failed to write snapshot to {}", final_path.string());
        return failure(SnapshotError::WriteFailed, final_path, "Failed to save snapshot");
    }

    logger_->info("Snapshot saved to {}", final_path.string());
    SnapshotResult result{};
    result.path = final_path;
    return result;
}

}  // namespace ipcam_player
