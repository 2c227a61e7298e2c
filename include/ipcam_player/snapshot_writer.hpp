// === Snapshot Writer =========================================================
//
// Saves the image currently on screen (already zoomed and panned) to disk.
// The operator supplies a base path; the writer appends a second-resolution
// timestamp so repeated captures never overwrite each other.

#pragma once

#include <ctime>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include <opencv2/core.hpp>

namespace spdlog {
class logger;
}

namespace ipcam_player {

/** @brief Why a snapshot could not be saved. */
enum class SnapshotError {
    None,
    NoFrame,      /**< Nothing has been rendered yet. */
    EncodeFailed, /**< The image could not be encoded in the requested format. */
    WriteFailed   /**< The encoded bytes could not be written. */
};

/** @brief Outcome of SnapshotWriter::save. */
struct SnapshotResult final {
    std::filesystem::path path{};
    SnapshotError error{SnapshotError::None};
    std::string message{};

    [[nodiscard]] bool ok() const noexcept { return error == SnapshotError::None; }
};

/** @brief Supplies the local wall-clock time used in snapshot names. */
using LocalTimeSource = std::function<std::tm()>;

/** @brief Current local time. */
[[nodiscard]] std::tm current_local_time();

/** @brief Encodes rendered images and writes them next to the chosen base path. */
class SnapshotWriter final {
  public:
    explicit SnapshotWriter(LocalTimeSource time_source = current_local_time);

    /**
     * @brief Write `rendered_image` as `<base>_<MM-DD-YYYY_hh-mm-ssAM>.<ext>`.
     *
     * Never throws; failures come back in the result and leave any stream
     * session untouched.
     */
    [[nodiscard]] SnapshotResult save(const cv::Mat& rendered_image, const std::filesystem::path& destination_base) const;

    /** @brief Destination path for `destination_base` at the current time. */
    [[nodiscard]] std::filesystem::path timestamped_path(const std::filesystem::path& destination_base) const;

    /** @brief "MM-DD-YYYY_hh-mm-ssAM" in 12-hour time. */
    [[nodiscard]] static std::string format_timestamp(const std::tm& local_time);

  private:
    LocalTimeSource time_source_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ipcam_player
