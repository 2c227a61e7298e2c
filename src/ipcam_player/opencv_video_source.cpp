#include "ipcam_player/video_source.hpp"

#include <cmath>

#include <opencv2/videoio.hpp>

#include "ipcam_player/logging.hpp"

namespace ipcam_player {

OpenCvVideoSource::OpenCvVideoSource(const std::string& uri)
    : capture_(std::make_unique<cv::VideoCapture>(uri)) {
    if (capture_->isOpened()) {
        // Keep at most one decoded frame queued for low latency.
        capture_->set(cv::CAP_PROP_BUFFERSIZE, 1);
        get_logger()->debug("Video capture opened with backend {}", capture_->getBackendName());
    }
}

OpenCvVideoSource::~OpenCvVideoSource() {
    release();
}

bool OpenCvVideoSource::is_opened() const {
    return capture_ != nullptr && capture_->isOpened();
}

Resolution OpenCvVideoSource::native_resolution() const {
    if (!is_opened()) {
        return Resolution{};
    }
    return Resolution{
        static_cast<int>(std::lround(capture_->get(cv::CAP_PROP_FRAME_WIDTH))),
        static_cast<int>(std::lround(capture_->get(cv::CAP_PROP_FRAME_HEIGHT)))
    };
}

bool OpenCvVideoSource::read(cv::Mat& frame) {
    if (!is_opened()) {
        return false;
    }
    return capture_->read(frame) && !frame.empty();
}

void OpenCvVideoSource::release() {
    if (capture_ != nullptr && capture_->isOpened()) {
        capture_->release();
    }
}

SourceOpener make_opencv_source_opener() {
    return [](const std::string& uri) -> VideoSourcePtr {
        return std::make_unique<OpenCvVideoSource>(uri);
    };
}

}  // namespace ipcam_player
