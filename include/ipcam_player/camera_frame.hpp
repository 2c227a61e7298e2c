// === Camera Frame ============================================================
//
// Declares the decoded frame handed from the producer loop to the consumer.
// Frames are shared as pointers to const so nothing mutates one after it has
// been published.

#pragma once

#include <cstdint>
#include <memory>

#include <opencv2/core.hpp>

#include "ipcam_player/types.hpp"

namespace ipcam_player {

/** @brief Captured frame buffer plus metadata. */
struct CameraFrame final {
    cv::Mat image{};                          /**< Owned pixel data. */
    int width_px{};                           /**< Image width in pixels. */
    int height_px{};                          /**< Image height in pixels. */
    ChannelOrder channel_order{ChannelOrder::Bgr};
    std::uint64_t sequence_number{};          /**< Monotonic per session, starting at 1. */
    TimePoint captured_at{SteadyClock::now()};
};

using CameraFramePtr = std::shared_ptr<const CameraFrame>;

}  // namespace ipcam_player
