// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the player (time primitives, resolutions, stream lifecycle states).

#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace ipcam_player {

/**
 * @brief Alias for the steady clock used for timeouts and frame timestamps.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Width/height pair in pixels.
 */
struct Resolution final {
    int width_px{};  /**< Horizontal pixel count. */
    int height_px{}; /**< Vertical pixel count. */

    friend bool operator==(const Resolution&, const Resolution&) = default;
};

/**
 * @brief Lifecycle states of a stream session.
 */
enum class StreamState {
    Idle,       /**< No session active; Start is accepted. */
    Connecting, /**< Waiting on the bounded open attempt. */
    Streaming,  /**< Producer loop pulling frames. */
    Paused,     /**< Producer loop alive but not pulling frames. */
    Stopping,   /**< Termination requested; waiting for the loop to exit. */
    Failed      /**< Session ended with an error; Start is accepted. */
};

/**
 * @brief Channel layout of decoded pixel data.
 */
enum class ChannelOrder {
    Bgr, /**< OpenCV native order. */
    Rgb
};

[[nodiscard]] std::string_view to_string(StreamState state) noexcept;

/** @brief Render a resolution as "(w, h)". */
[[nodiscard]] std::string to_string(const Resolution& resolution);

}  // namespace ipcam_player
