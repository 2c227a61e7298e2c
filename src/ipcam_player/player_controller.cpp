#include "ipcam_player/player_controller.hpp"

#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "ipcam_player/logging.hpp"
#include "ipcam_player/version.hpp"

namespace ipcam_player {

namespace {
constexpr char k_status_loading[] = "Loading stream";
constexpr char k_status_running[] = "Streaming running";
constexpr char k_status_idle[] = "Streaming stopped";
constexpr char k_label_pause[] = "Pause";
constexpr char k_label_unpause[] = "Unpause";
}  // namespace

std::string StatusLine::text() const {
    return fmt::format("Status: {}, Url: {}, Resolution: {}  SW Rev: {}", message, url, resolution, k_version);
}

PlayerController::PlayerController(Configuration configuration,
                                   SourceOpener opener,
                                   LocalTimeSource time_source)
    : configuration_(std::move(configuration)),
      frame_buffer_(std::make_shared<FrameBuffer>()),
      event_bus_(std::make_shared<StreamEventBus>()),
      session_(std::move(opener), frame_buffer_, event_bus_, configuration_.session),
      snapshot_writer_(std::move(time_source)),
      logger_(get_logger()) {
    status_line_.message = k_status_idle;
    refresh_connection_status();
}

PlayerController::~PlayerController() {
    shutdown();
}

bool PlayerController::start_streaming() {
    if (!configuration_.connection.is_startable()) {
        logger_->warn("Start requested without a configured camera host");
        return false;
    }
    if (!session_.start(configuration_.connection)) {
        return false;
    }
    view_ = ViewState{};
    panning_ = false;
    first_frame_shown_ = false;
    optional_last_error_.reset();
    clear_rendered_image();
    status_line_.message = k_status_loading;
    logger_->info("Loading camera stream, please wait...");
    return true;
}

void PlayerController::stop_streaming() {
    session_.stop();
}

bool PlayerController::toggle_pause() {
    switch (session_.state()) {
        case StreamState::Streaming:
            return session_.pause(true);
        case StreamState::Paused:
            return session_.pause(false);
        default:
            return false;
    }
}

bool PlayerController::update_settings(const ConnectionConfig& connection) {
    if (session_.is_active()) {
        logger_->warn("Camera settings cannot change while streaming");
        return false;
    }
    configuration_.connection = connection;
    refresh_connection_status();
    logger_->info("Camera settings updated: url={} resolution={}",
                  status_line_.url,
                  status_line_.resolution);
    return true;
}

bool PlayerController::start_from_settings(const ConnectionConfig& connection) {
    return update_settings(connection) && start_streaming();
}

void PlayerController::zoom(int steps) {
    if (steps == 0) {
        return;
    }
    view_ = apply_zoom_steps(view_, steps);
    logger_->debug("Zoom factor now {:.3f}", view_.zoom_factor);
    render_latest_frame();
}

void PlayerController::begin_pan(int pointer_x, int pointer_y) {
    panning_ = true;
    last_pointer_x_ = pointer_x;
    last_pointer_y_ = pointer_y;
}

void PlayerController::pan_to(int pointer_x, int pointer_y) {
    if (!panning_) {
        return;
    }
    const int delta_x = pointer_x - last_pointer_x_;
    const int delta_y = pointer_y - last_pointer_y_;
    last_pointer_x_ = pointer_x;
    last_pointer_y_ = pointer_y;
    view_ = apply_pan_drag(view_, delta_x, delta_y, last_frame_size_, viewport_);
    render_latest_frame();
}

void PlayerController::end_pan() {
    panning_ = false;
}

void PlayerController::set_viewport(const Resolution& viewport) {
    if (viewport == viewport_) {
        return;
    }
    viewport_ = viewport;
    render_latest_frame();
}

std::vector<StreamEvent> PlayerController::poll() {
    std::vector<StreamEvent> handled_events;
    while (true) {
        std::optional<StreamEvent> optional_event = event_bus_->try_consume();
        if (!optional_event.has_value()) {
            break;
        }
        handle_event(*optional_event);
        handled_events.push_back(std::move(*optional_event));
    }
    return handled_events;
}

void PlayerController::render_latest_frame() {
    const CameraFramePtr frame = frame_buffer_->latest();
    if (frame == nullptr || frame->image.empty()) {
        return;
    }
    const StreamState state = session_.state();
    if (state != StreamState::Streaming && state != StreamState::Paused) {
        return;
    }
    last_frame_size_ = Resolution{frame->width_px, frame->height_px};
    const Resolution viewport = viewport_.width_px > 0 && viewport_.height_px > 0 ? viewport_ : last_frame_size_;
    view_ = clamp_view(view_, last_frame_size_, viewport);
    cv::Mat rendered = render_view(frame->image, view_, viewport);

    std::scoped_lock lock(render_mutex_);
    rendered_image_ = std::move(rendered);
}

SnapshotResult PlayerController::take_snapshot(const std::optional<std::string>& destination_base) {
    // The writer works on a private copy so the render path is never blocked by encoding.
    const cv::Mat image = rendered_image();
    const std::filesystem::path base{destination_base.value_or(configuration_.viewer.snapshot_base)};
    SnapshotResult result = snapshot_writer_.save(image, base);
    if (!result.ok()) {
        logger_->warn("Snapshot failed: {}", result.message);
    }
    return result;
}

cv::Mat PlayerController::rendered_image() const {
    std::scoped_lock lock(render_mutex_);
    return rendered_image_.clone();
}

ControlStates PlayerController::controls() const {
    const StreamState state = session_.state();
    const bool stopped = state == StreamState::Idle || state == StreamState::Failed;
    const bool playing = state == StreamState::Streaming || state == StreamState::Paused;

    ControlStates controls{};
    controls.start_enabled = stopped && configuration_.connection.is_startable();
    controls.stop_enabled = state == StreamState::Connecting || playing;
    controls.pause_enabled = playing && first_frame_shown_;
    {
        std::scoped_lock lock(render_mutex_);
        controls.snapshot_enabled = controls.pause_enabled && !rendered_image_.empty();
    }
    controls.settings_enabled = stopped;
    controls.pause_label = state == StreamState::Paused ? k_label_unpause : k_label_pause;
    return controls;
}

const StatusLine& PlayerController::status_line() const noexcept {
    return status_line_;
}

const ViewState& PlayerController::view() const noexcept {
    return view_;
}

const std::optional<std::string>& PlayerController::last_error() const noexcept {
    return optional_last_error_;
}

bool PlayerController::is_loading() const {
    return session_.state() == StreamState::Connecting
        || (session_.state() == StreamState::Streaming && !first_frame_shown_);
}

const Configuration& PlayerController::configuration() const noexcept {
    return configuration_;
}

StreamSession& PlayerController::session() noexcept {
    return session_;
}

void PlayerController::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    session_.stop();
    poll();
    if (!configuration_.settings_path.empty() && !ConfigurationLoader::save(configuration_)) {
        logger_->warn("Camera settings were not persisted");
    }
}

void PlayerController::handle_event(const StreamEvent& event) {
    switch (event.type) {
        case StreamEventType::FrameReady:
            render_latest_frame();
            break;
        case StreamEventType::FirstFrameReady:
            first_frame_shown_ = true;
            status_line_.message = k_status_running;
            logger_->info("Streaming running");
            break;
        case StreamEventType::Status:
            status_line_.message = event.message;
            if (event.message == k_status_stopped) {
                status_line_.message = k_status_idle;
                first_frame_shown_ = false;
                panning_ = false;
                clear_rendered_image();
            }
            break;
        case StreamEventType::Error:
            status_line_.message = event.message;
            optional_last_error_ = event.message;
            break;
    }
}

void PlayerController::refresh_connection_status() {
    const ConnectionConfig& connection = configuration_.connection;
    if (connection.is_startable()) {
        status_line_.url = masked_uri(connection);
        status_line_.resolution = to_string(connection.requested_resolution);
    } else {
        status_line_.url = "none";
        status_line_.resolution = "none";
    }
}

void PlayerController::clear_rendered_image() {
    std::scoped_lock lock(render_mutex_);
    rendered_image_.release();
}

}  // namespace ipcam_player
