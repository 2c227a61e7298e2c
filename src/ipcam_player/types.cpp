#include "ipcam_player/types.hpp"

#include <fmt/format.h>

namespace ipcam_player {

std::string_view to_string(StreamState state) noexcept {
    switch (state) {
        case StreamState::Idle:
            return "Idle";
        case StreamState::Connecting:
            return "Connecting";
        case StreamState::Streaming:
            return "Streaming";
        case StreamState::Paused:
            return "Paused";
        case StreamState::Stopping:
            return "Stopping";
        case StreamState::Failed:
            return "Failed";
    }
    return "Unknown";
}

std::string to_string(const Resolution& resolution) {
    return fmt::format("({}, {})", resolution.width_px, resolution.height_px);
}

}  // namespace ipcam_player
