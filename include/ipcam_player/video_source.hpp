// === Video Source ============================================================
//
// Abstraction over the external decoding library. StreamSession only talks to
// a VideoSource obtained from a SourceOpener, which lets tests substitute
// scripted sources for a real camera.

#pragma once

#include <functional>
#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include "ipcam_player/types.hpp"

namespace cv {
class VideoCapture;
}

namespace ipcam_player {

/** @brief Opened (or failed-to-open) handle on a camera stream. */
class VideoSource {
  public:
    virtual ~VideoSource() = default;

    /** @brief True when the underlying stream was opened successfully. */
    [[nodiscard]] virtual bool is_opened() const = 0;
    /** @brief Resolution reported by the stream at connect time. */
    [[nodiscard]] virtual Resolution native_resolution() const = 0;
    /** @brief Decode the next frame into `frame`; false when the stream failed. */
    virtual bool read(cv::Mat& frame) = 0;
    /** @brief Release the underlying stream. Safe to call more than once. */
    virtual void release() = 0;
};

using VideoSourcePtr = std::unique_ptr<VideoSource>;

/**
 * @brief Blocking open call for a URI.
 *
 * May block indefinitely; StreamSession invokes it from a detached thread and
 * abandons it after the connect timeout.
 */
using SourceOpener = std::function<VideoSourcePtr(const std::string& uri)>;

/** @brief VideoSource backed by cv::VideoCapture. */
class OpenCvVideoSource final : public VideoSource {
  public:
    explicit OpenCvVideoSource(const std::string& uri);
    ~OpenCvVideoSource() override;

    OpenCvVideoSource(const OpenCvVideoSource&) = delete;
    OpenCvVideoSource& operator=(const OpenCvVideoSource&) = delete;

    [[nodiscard]] bool is_opened() const override;
    [[nodiscard]] Resolution native_resolution() const override;
    bool read(cv::Mat& frame) override;
    void release() override;

  private:
    std::unique_ptr<cv::VideoCapture> capture_;
};

/** @brief Opener producing OpenCvVideoSource instances. */
[[nodiscard]] SourceOpener make_opencv_source_opener();

}  // namespace ipcam_player
