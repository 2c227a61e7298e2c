#include "ipcam_player/viewer_window.hpp"

#include <GLFW/glfw3.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "ipcam_player/logging.hpp"
#include "ipcam_player/version.hpp"

namespace ipcam_player {

namespace {

constexpr double k_double_click_interval_s{0.3};
constexpr double k_event_wait_timeout_s{0.01};
constexpr GLfloat k_loading_gray{0.83f};

std::once_flag glfw_once_flag;

void glfw_error_callback(int error_code, const char* description) {
    auto logger = get_logger();
    logger->error("GLFW error {}: {}", error_code, description ? description : "unknown");
}

void ensure_glfw_initialized() {
    std::call_once(
        glfw_once_flag,
        []() {
            glfwSetErrorCallback(glfw_error_callback);
            if (!glfwInit()) {
                throw std::runtime_error("Failed to initialize GLFW");
            }
        }
    );
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
}

ViewerWindow& window_owner(GLFWwindow* window) {
    return *static_cast<ViewerWindow*>(glfwGetWindowUserPointer(window));
}

GLenum pixel_format_for(int channels) {
    switch (channels) {
        case 1:
            return GL_LUMINANCE;
        case 4:
            return GL_BGRA;
        default:
            return GL_BGR;
    }
}

}  // namespace

ViewerWindow::ViewerWindow(ViewerConfig config, PlayerController& controller)
    : config_(std::move(config)),
      controller_(controller),
      logger_(get_logger()) {}

ViewerWindow::~ViewerWindow() {
    shutdown();
}

void ViewerWindow::initialize() {
    if (initialized_) {
        return;
    }
    ensure_glfw_initialized();

    logger_->info(
        "Opening viewer window ({}x{}, vsync={})",
        config_.window_width_px,
        config_.window_height_px,
        config_.enable_vsync ? "true" : "false"
    );

    window_ = glfwCreateWindow(config_.window_width_px, config_.window_height_px, std::string{k_application_name}.c_str(), nullptr, nullptr);
    if (window_ == nullptr) {
        throw std::runtime_error("Failed to create GLFW window");
    }

    glfwSetWindowUserPointer(window_, this);
    glfwSetKeyCallback(window_, &ViewerWindow::on_key);
    glfwSetScrollCallback(window_, &ViewerWindow::on_scroll);
    glfwSetMouseButtonCallback(window_, &ViewerWindow::on_mouse_button);
    glfwSetCursorPosCallback(window_, &ViewerWindow::on_cursor_moved);

    glfwMakeContextCurrent(window_);
    glfwSwapInterval(config_.enable_vsync ? 1 : 0);

    glGenTextures(1, &texture_id_);
    glBindTexture(GL_TEXTURE_2D, texture_id_);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

    initialized_ = true;
    update_title();
}

void ViewerWindow::run(const std::atomic<bool>& should_terminate) {
    if (!initialized_) {
        throw std::runtime_error("Viewer window used before initialize()");
    }
    while (!should_terminate.load() && glfwWindowShouldClose(window_) == 0) {
        glfwWaitEventsTimeout(k_event_wait_timeout_s);

        controller_.set_viewport(framebuffer_size());
        const std::vector<StreamEvent> events = controller_.poll();
        for (const StreamEvent& event : events) {
            if (event.type == StreamEventType::Error) {
                logger_->error("Stream Error: {}", event.message);
            }
        }

        draw_frame();
        update_title();
    }
}

void ViewerWindow::shutdown() {
    if (!initialized_) {
        return;
    }
    logger_->info("Closing viewer window");
    glfwMakeContextCurrent(window_);
    if (texture_id_ != 0) {
        glDeleteTextures(1, &texture_id_);
        texture_id_ = 0;
    }
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
    initialized_ = false;
}

void ViewerWindow::on_key(GLFWwindow* window, int key, int /*scancode*/, int action, int /*mods*/) {
    if (action != GLFW_PRESS) {
        return;
    }
    window_owner(window).handle_key(key);
}

void ViewerWindow::on_scroll(GLFWwindow* window, double /*x_offset*/, double y_offset) {
    if (y_offset == 0.0) {
        return;
    }
    window_owner(window).controller_.zoom(y_offset > 0.0 ? 1 : -1);
}

void ViewerWindow::on_mouse_button(GLFWwindow* window, int button, int action, int /*mods*/) {
    window_owner(window).handle_mouse_button(button, action);
}

void ViewerWindow::on_cursor_moved(GLFWwindow* window, double x_position, double y_position) {
    ViewerWindow& owner = window_owner(window);
    const double ratio = owner.pixel_ratio();
    owner.controller_.pan_to(static_cast<int>(x_position * ratio), static_cast<int>(y_position * ratio));
}

void ViewerWindow::handle_key(int key) {
    switch (key) {
        case GLFW_KEY_S:
            if (!controller_.controls().start_enabled) {
                logger_->warn("Start is unavailable: configure a camera host first or stop the current stream");
                break;
            }
            controller_.start_streaming();
            break;
        case GLFW_KEY_X:
            controller_.stop_streaming();
            break;
        case GLFW_KEY_SPACE:
            controller_.toggle_pause();
            break;
        case GLFW_KEY_P:
            take_snapshot();
            break;
        case GLFW_KEY_F11:
            toggle_full_screen();
            break;
        case GLFW_KEY_ESCAPE:
            glfwSetWindowShouldClose(window_, GLFW_TRUE);
            break;
        default:
            break;
    }
}

void ViewerWindow::handle_mouse_button(int button, int action) {
    if (button != GLFW_MOUSE_BUTTON_LEFT) {
        return;
    }
    if (action == GLFW_RELEASE) {
        controller_.end_pan();
        return;
    }

    const double now = glfwGetTime();
    if (last_click_time_ >= 0.0 && now - last_click_time_ <= k_double_click_interval_s) {
        last_click_time_ = -1.0;
        toggle_full_screen();
        return;
    }
    last_click_time_ = now;

    double cursor_x = 0.0;
    double cursor_y = 0.0;
    glfwGetCursorPos(window_, &cursor_x, &cursor_y);
    const double ratio = pixel_ratio();
    controller_.begin_pan(static_cast<int>(cursor_x * ratio), static_cast<int>(cursor_y * ratio));
}

void ViewerWindow::toggle_full_screen() {
    if (full_screen_) {
        glfwSetWindowMonitor(window_, nullptr, windowed_x_, windowed_y_, windowed_width_, windowed_height_, GLFW_DONT_CARE);
    } else {
        GLFWmonitor* monitor = glfwGetPrimaryMonitor();
        const GLFWvidmode* mode = monitor != nullptr ? glfwGetVideoMode(monitor) : nullptr;
        if (mode == nullptr) {
            logger_->warn("No monitor available for full screen");
            return;
        }
        glfwGetWindowPos(window_, &windowed_x_, &windowed_y_);
        glfwGetWindowSize(window_, &windowed_width_, &windowed_height_);
        glfwSetWindowMonitor(window_, monitor, 0, 0, mode->width, mode->height, mode->refreshRate);
    }
    full_screen_ = !full_screen_;
}

void ViewerWindow::take_snapshot() {
    if (!controller_.controls().snapshot_enabled) {
        logger_->info("No visible frame available for snapshot");
        return;
    }
    const SnapshotResult result = controller_.take_snapshot();
    if (!result.ok()) {
        logger_->error("Snapshot Error: {}", result.message);
    }
}

double ViewerWindow::pixel_ratio() const {
    int window_width = 0;
    int window_height = 0;
    glfwGetWindowSize(window_, &window_width, &window_height);
    if (window_width == 0 || window_height == 0) {
        return 1.0;
    }
    return static_cast<double>(framebuffer_size().width_px) / static_cast<double>(window_width);
}

Resolution ViewerWindow::framebuffer_size() const {
    int fb_width = 0;
    int fb_height = 0;
    glfwGetFramebufferSize(window_, &fb_width, &fb_height);
    return Resolution{std::max(fb_width, 1), std::max(fb_height, 1)};
}

void ViewerWindow::draw_frame() {
    const Resolution surface = framebuffer_size();
    glViewport(0, 0, surface.width_px, surface.height_px);

    const GLfloat background = controller_.is_loading() ? k_loading_gray : 0.0f;
    glClearColor(background, background, background, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    const cv::Mat image = controller_.rendered_image();
    if (!image.empty() && image.depth() == CV_8U) {
        glBindTexture(GL_TEXTURE_2D, texture_id_);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        glPixelStorei(GL_UNPACK_ROW_LENGTH, static_cast<GLint>(image.step / image.elemSize()));
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGB, image.cols, image.rows, 0,
                     pixel_format_for(image.channels()), GL_UNSIGNED_BYTE, image.data);
        glPixelStorei(GL_UNPACK_ROW_LENGTH, 0);

        glMatrixMode(GL_PROJECTION);
        glLoadIdentity();
        glOrtho(0.0, surface.width_px, surface.height_px, 0.0, -1.0, 1.0);
        glMatrixMode(GL_MODELVIEW);
        glLoadIdentity();

        // Centre the image when it is smaller than the surface.
        const GLfloat left = static_cast<GLfloat>(std::max(0, (surface.width_px - image.cols) / 2));
        const GLfloat top = static_cast<GLfloat>(std::max(0, (surface.height_px - image.rows) / 2));
        const GLfloat right = left + static_cast<GLfloat>(image.cols);
        const GLfloat bottom = top + static_cast<GLfloat>(image.rows);

        glEnable(GL_TEXTURE_2D);
        glBegin(GL_QUADS);
        glTexCoord2f(0.0f, 0.0f);
        glVertex2f(left, top);
        glTexCoord2f(1.0f, 0.0f);
        glVertex2f(right, top);
        glTexCoord2f(1.0f, 1.0f);
        glVertex2f(right, bottom);
        glTexCoord2f(0.0f, 1.0f);
        glVertex2f(left, bottom);
        glEnd();
        glDisable(GL_TEXTURE_2D);
    }

    glfwSwapBuffers(window_);
}

void ViewerWindow::update_title() {
    const std::string title = controller_.status_line().text();
    if (title == str_title_) {
        return;
    }
    str_title_ = title;
    glfwSetWindowTitle(window_, str_title_.c_str());
}

}  // namespace ipcam_player
