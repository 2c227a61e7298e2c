#include "ipcam_player/viewport_transform.hpp"

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace ipcam_player {

namespace {

int scale_extent(int extent, double zoom_factor) {
    if (extent <= 0) {
        return 0;
    }
    return std::max(1, static_cast<int>(std::lround(zoom_factor * extent)));
}

}  // namespace

Resolution scaled_frame_size(const Resolution& frame, double zoom_factor) {
    return Resolution{scale_extent(frame.width_px, zoom_factor), scale_extent(frame.height_px, zoom_factor)};
}

int clamp_pan_offset(int pan, int scaled_extent, int viewport_extent) noexcept {
    const int max_offset = std::max(0, scaled_extent - viewport_extent);
    return std::clamp(pan, 0, max_offset);
}

double clamp_zoom_factor(double zoom_factor) noexcept {
    return std::clamp(zoom_factor, k_min_zoom_factor, k_max_zoom_factor);
}

ViewportGeometry compute_viewport(const Resolution& frame, const ViewState& view, const Resolution& viewport) {
    ViewportGeometry geometry{};
    geometry.scaled_size = scaled_frame_size(frame, clamp_zoom_factor(view.zoom_factor));
    geometry.pan_x = clamp_pan_offset(view.pan_x, geometry.scaled_size.width_px, viewport.width_px);
    geometry.pan_y = clamp_pan_offset(view.pan_y, geometry.scaled_size.height_px, viewport.height_px);

    const int right = std::min(geometry.pan_x + std::max(0, viewport.width_px), geometry.scaled_size.width_px);
    const int bottom = std::min(geometry.pan_y + std::max(0, viewport.height_px), geometry.scaled_size.height_px);
    geometry.visible = PixelRect{geometry.pan_x, geometry.pan_y, right - geometry.pan_x, bottom - geometry.pan_y};
    return geometry;
}

ViewState apply_zoom_steps(ViewState view, int steps) {
    for (; steps > 0; --steps) {
        view.zoom_factor = clamp_zoom_factor(view.zoom_factor * k_zoom_step);
    }
    for (; steps < 0; ++steps) {
        view.zoom_factor = clamp_zoom_factor(view.zoom_factor / k_zoom_step);
    }
    return view;
}

ViewState apply_pan_drag(ViewState view,
                         int delta_x,
                         int delta_y,
                         const Resolution& frame,
                         const Resolution& viewport) {
    view.pan_x -= delta_x;
    view.pan_y -= delta_y;
    return clamp_view(view, frame, viewport);
}

ViewState clamp_view(ViewState view, const Resolution& frame, const Resolution& viewport) {
    const ViewportGeometry geometry = compute_viewport(frame, view, viewport);
    view.zoom_factor = clamp_zoom_factor(view.zoom_factor);
    view.pan_x = geometry.pan_x;
    view.pan_y = geometry.pan_y;
    return view;
}

cv::Mat render_view(const cv::Mat& image, const ViewState& view, const Resolution& viewport) {
    if (image.empty()) {
        return {};
    }
    const ViewportGeometry geometry = compute_viewport(Resolution{image.cols, image.rows}, view, viewport);
    const PixelRect& visible = geometry.visible;
    if (visible.empty()) {
        return {};
    }
    const cv::Size scaled_size(geometry.scaled_size.width_px, geometry.scaled_size.height_px);
    const cv::Rect visible_rect(visible.x, visible.y, visible.width, visible.height);

    // A zoomed-out frame is no larger than the source, so scaling it whole is cheap.
    if (scaled_size.width <= image.cols && scaled_size.height <= image.rows) {
        cv::Mat scaled;
        cv::resize(image, scaled, scaled_size, 0.0, 0.0, cv::INTER_AREA);
        return scaled(visible_rect).clone();
    }

    // Zoomed in: sample only the visible rectangle, using the same pixel-centre
    // mapping as cv::resize so the result equals a crop of the fully scaled frame.
    const double scale_x = static_cast<double>(scaled_size.width) / image.cols;
    const double scale_y = static_cast<double>(scaled_size.height) / image.rows;
    const cv::Mat transform = (cv::Mat_<double>(2, 3) << scale_x, 0.0, 0.5 * scale_x - 0.5 - visible.x,
                                                         0.0, scale_y, 0.5 * scale_y - 0.5 - visible.y);
    cv::Mat rendered;
    cv::warpAffine(image, rendered, transform, visible_rect.size(), cv::INTER_LINEAR, cv::BORDER_REPLICATE);
    return rendered;
}

}  // namespace ipcam_player
