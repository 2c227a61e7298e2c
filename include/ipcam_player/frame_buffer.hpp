// === Frame Buffer ============================================================
//
// Single-slot exchange between the producer loop and the consumer. A publish
// replaces whatever is held; a slow consumer silently misses frames.

#pragma once

#include <mutex>

#include "ipcam_player/camera_frame.hpp"

namespace ipcam_player {

/** @brief Thread-safe latest-frame holder with drop-oldest semantics. */
class FrameBuffer final {
  public:
    /** @brief Replace the held frame; the previous one is dropped. */
    void publish(CameraFramePtr frame);
    /** @brief Most recently published frame, or null when none. */
    [[nodiscard]] CameraFramePtr latest() const;
    /** @brief True once a frame has been published since the last clear. */
    [[nodiscard]] bool has_frame() const;
    /** @brief Drop the held frame. */
    void clear();

  private:
    mutable std::mutex mutex_;
    CameraFramePtr frame_;
};

}  // namespace ipcam_player
