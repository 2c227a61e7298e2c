#include "ipcam_player/frame_buffer.hpp"

#include <utility>

namespace ipcam_player {

void FrameBuffer::publish(CameraFramePtr frame) {
    CameraFramePtr previous;
    {
        std::scoped_lock lock(mutex_);
        previous = std::exchange(frame_, std::move(frame));
    }
    // previous is released outside the lock
}

CameraFramePtr FrameBuffer::latest() const {
    std::scoped_lock lock(mutex_);
    return frame_;
}

bool FrameBuffer::has_frame() const {
    std::scoped_lock lock(mutex_);
    return frame_ != nullptr;
}

void FrameBuffer::clear() {
    CameraFramePtr previous;
    {
        std::scoped_lock lock(mutex_);
        previous = std::move(frame_);
        frame_.reset();
    }
}

}  // namespace ipcam_player
