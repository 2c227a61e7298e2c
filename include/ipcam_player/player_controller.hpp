// === Player Controller =======================================================
//
// Glue between the viewer window and the stream pipeline. Runs entirely on the
// UI thread: translates operator intents into StreamSession calls, drains the
// session's event bus, and renders the latest frame through the viewport
// transform. The last rendered image is both what the window shows and what a
// snapshot saves.

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "ipcam_player/configuration.hpp"
#include "ipcam_player/frame_buffer.hpp"
#include "ipcam_player/snapshot_writer.hpp"
#include "ipcam_player/stream_event_bus.hpp"
#include "ipcam_player/stream_session.hpp"
#include "ipcam_player/video_source.hpp"
#include "ipcam_player/viewport_transform.hpp"

namespace ipcam_player {

/** @brief Which operator actions are currently available. */
struct ControlStates final {
    bool start_enabled{};
    bool stop_enabled{};
    bool pause_enabled{};
    bool snapshot_enabled{};
    bool settings_enabled{};
    std::string pause_label{"Pause"};
};

/** @brief Text shown in the status line. Never contains the camera secret. */
struct StatusLine final {
    std::string message{};
    std::string url{};
    std::string resolution{};

    /** @brief "Status: <msg>, Url: <url>, Resolution: <res>  SW Rev: <version>". */
    [[nodiscard]] std::string text() const;
};

/** @brief UI-thread coordinator for one StreamSession. */
class PlayerController final {
  public:
    PlayerController(Configuration configuration,
                     SourceOpener opener,
                     LocalTimeSource time_source = current_local_time);
    ~PlayerController();

    PlayerController(const PlayerController&) = delete;
    PlayerController& operator=(const PlayerController&) = delete;

    /** @brief Reset the view and start a session; false when no host is configured or one is active. */
    bool start_streaming();
    void stop_streaming();
    /** @brief Pause a playing stream or resume a paused one. */
    bool toggle_pause();

    /** @brief Replace the camera settings wholesale; refused while a session is active. */
    bool update_settings(const ConnectionConfig& connection);
    /** @brief Apply settings and start streaming immediately. */
    bool start_from_settings(const ConnectionConfig& connection);

    /** @brief Wheel input: positive steps zoom in, negative zoom out. */
    void zoom(int steps);
    void begin_pan(int pointer_x, int pointer_y);
    void pan_to(int pointer_x, int pointer_y);
    void end_pan();
    /** @brief Size of the area frames are projected into. */
    void set_viewport(const Resolution& viewport);

    /**
     * @brief Drain pending session events and re-render when a frame arrived.
     * @return Events handled during this call, oldest first.
     */
    std::vector<StreamEvent> poll();
    /** @brief Re-render the latest frame with the current view. */
    void render_latest_frame();

    /** @brief Save the last rendered image next to `destination_base` (or the configured base). */
    [[nodiscard]] SnapshotResult take_snapshot(const std::optional<std::string>& destination_base = std::nullopt);

    /** @brief Copy of the last rendered image; empty before the first frame. */
    [[nodiscard]] cv::Mat rendered_image() const;
    [[nodiscard]] ControlStates controls() const;
    [[nodiscard]] const StatusLine& status_line() const noexcept;
    [[nodiscard]] const ViewState& view() const noexcept;
    [[nodiscard]] const std::optional<std::string>& last_error() const noexcept;
    /** @brief True between Start and the first frame. */
    [[nodiscard]] bool is_loading() const;
    [[nodiscard]] const Configuration& configuration() const noexcept;
    [[nodiscard]] StreamSession& session() noexcept;

    /** @brief Stop streaming and persist the camera settings. */
    void shutdown();

  private:
    void handle_event(const StreamEvent& event);
    void refresh_connection_status();
    void clear_rendered_image();

    Configuration configuration_;
    std::shared_ptr<FrameBuffer> frame_buffer_;
    std::shared_ptr<StreamEventBus> event_bus_;
    StreamSession session_;
    SnapshotWriter snapshot_writer_;

    ViewState view_{};
    Resolution viewport_{};
    bool panning_{false};
    int last_pointer_x_{};
    int last_pointer_y_{};
    Resolution last_frame_size_{};

    mutable std::mutex render_mutex_; /**< Guards rendered_image_. */
    cv::Mat rendered_image_;

    StatusLine status_line_{};
    std::optional<std::string> optional_last_error_;
    bool first_frame_shown_{false};
    bool shut_down_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ipcam_player
