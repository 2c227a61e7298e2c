// === Viewport Transform ======================================================
//
// Pure zoom/pan arithmetic. Given a frame size, a ViewState and the size of
// the on-screen viewport, computes which sub-rectangle of the zoomed frame is
// visible. The same computation feeds the display and snapshots, so identical
// inputs always produce identical output.

#pragma once

#include <opencv2/core.hpp>

#include "ipcam_player/types.hpp"

namespace ipcam_player {

inline constexpr double k_min_zoom_factor{0.1};
inline constexpr double k_max_zoom_factor{10.0};
inline constexpr double k_zoom_step{1.1};

/** @brief Operator-controlled zoom and pan, reset on every Start. */
struct ViewState final {
    double zoom_factor{1.0}; /**< Uniform scale in [0.1, 10.0]. */
    int pan_x{};             /**< Horizontal offset into the scaled frame, >= 0. */
    int pan_y{};             /**< Vertical offset into the scaled frame, >= 0. */

    friend bool operator==(const ViewState&, const ViewState&) = default;
};

/** @brief Axis-aligned integer rectangle. */
struct PixelRect final {
    int x{};
    int y{};
    int width{};
    int height{};

    [[nodiscard]] int right() const noexcept { return x + width; }
    [[nodiscard]] int bottom() const noexcept { return y + height; }
    [[nodiscard]] bool empty() const noexcept { return width <= 0 || height <= 0; }

    friend bool operator==(const PixelRect&, const PixelRect&) = default;
};

/** @brief Result of projecting a frame into the viewport. */
struct ViewportGeometry final {
    Resolution scaled_size{}; /**< Frame size after zoom. */
    int pan_x{};              /**< Pan offset after clamping. */
    int pan_y{};
    PixelRect visible{};      /**< Visible region in scaled-frame coordinates. */
};

/** @brief round(zoom * size) per axis, never below one pixel for a non-empty frame. */
[[nodiscard]] Resolution scaled_frame_size(const Resolution& frame, double zoom_factor);

/** @brief Clamp to [0, max(0, scaled_extent - viewport_extent)]. */
[[nodiscard]] int clamp_pan_offset(int pan, int scaled_extent, int viewport_extent) noexcept;

/** @brief Clamp to [k_min_zoom_factor, k_max_zoom_factor]. */
[[nodiscard]] double clamp_zoom_factor(double zoom_factor) noexcept;

/** @brief Visible rectangle for `view`; the rectangle always lies inside the scaled frame. */
[[nodiscard]] ViewportGeometry compute_viewport(const Resolution& frame, const ViewState& view, const Resolution& viewport);

/**
 * @brief Apply discrete zoom events.
 *
 * Positive steps multiply by k_zoom_step, negative steps divide; the result is
 * clamped after every step. Pan offsets are left for the next clamp.
 */
[[nodiscard]] ViewState apply_zoom_steps(ViewState view, int steps);

/** @brief Subtract a pointer delta from the pan offsets and re-clamp them. */
[[nodiscard]] ViewState apply_pan_drag(ViewState view,
                                       int delta_x,
                                       int delta_y,
                                       const Resolution& frame,
                                       const Resolution& viewport);

/** @brief Return `view` with pan offsets clamped for the given frame and viewport. */
[[nodiscard]] ViewState clamp_view(ViewState view, const Resolution& frame, const Resolution& viewport);

/**
 * @brief Produce the visible part of `image` at the zoom of `view`.
 *
 * The output is the `visible` rectangle of the frame scaled to
 * scaled_frame_size(), so it is at most viewport-sized and smaller when the
 * zoomed frame does not fill the viewport. Returns an empty matrix for an
 * empty image.
 */
[[nodiscard]] cv::Mat render_view(const cv::Mat& image, const ViewState& view, const Resolution& viewport);

}  // namespace ipcam_player
