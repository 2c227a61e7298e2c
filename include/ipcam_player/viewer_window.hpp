// === Viewer Window ===========================================================
//
// GLFW window that presents the controller's rendered image and maps operator
// input onto PlayerController: mouse wheel zooms, left-drag pans, double click
// toggles full screen, and keys drive the stream (S start, X stop, Space
// pause, P snapshot, Escape quit). The title bar doubles as the status line.

#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "ipcam_player/configuration.hpp"
#include "ipcam_player/player_controller.hpp"
#include "ipcam_player/types.hpp"

struct GLFWwindow;

namespace ipcam_player {

/** @brief Owns the GLFW window and its OpenGL texture. Must live on the main thread. */
class ViewerWindow final {
  public:
    ViewerWindow(ViewerConfig config, PlayerController& controller);
    ~ViewerWindow();

    ViewerWindow(const ViewerWindow&) = delete;
    ViewerWindow& operator=(const ViewerWindow&) = delete;

    /** @brief Create the window and its GL resources. */
    void initialize();
    /** @brief Pump events and draw until the window closes or `should_terminate` is set. */
    void run(const std::atomic<bool>& should_terminate);
    /** @brief Destroy the window and release GLFW. */
    void shutdown();

  private:
    static void on_key(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void on_scroll(GLFWwindow* window, double x_offset, double y_offset);
    static void on_mouse_button(GLFWwindow* window, int button, int action, int mods);
    static void on_cursor_moved(GLFWwindow* window, double x_position, double y_position);

    void handle_key(int key);
    void handle_mouse_button(int button, int action);
    void toggle_full_screen();
    void take_snapshot();
    /** @brief Convert window coordinates into framebuffer pixels. */
    [[nodiscard]] double pixel_ratio() const;
    [[nodiscard]] Resolution framebuffer_size() const;
    void draw_frame();
    void update_title();

    ViewerConfig config_;
    PlayerController& controller_;
    GLFWwindow* window_{nullptr};
    unsigned int texture_id_{0};
    bool full_screen_{false};
    int windowed_x_{};
    int windowed_y_{};
    int windowed_width_{};
    int windowed_height_{};
    double last_click_time_{-1.0};
    std::string str_title_;
    bool initialized_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ipcam_player
