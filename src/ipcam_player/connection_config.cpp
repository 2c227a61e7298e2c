#include "ipcam_player/connection_config.hpp"

#include <array>
#include <charconv>
#include <utility>

#include <fmt/format.h>

namespace ipcam_player {

namespace {

constexpr std::array<std::pair<std::string_view, Resolution>, 3> k_resolution_presets{{
    {"1080p", Resolution{1920, 1080}},
    {"720p", Resolution{1280, 720}},
    {"480p", Resolution{640, 480}},
}};

std::string format_uri(const ConnectionConfig& config, std::string_view secret) {
    return fmt::format(
        "{}://{}:{}@{}:{}/{}",
        config.scheme,
        config.username,
        secret,
        config.host,
        config.port,
        config.path
    );
}

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

std::optional<int> parse_positive_int(std::string_view text) {
    text = trim(text);
    int value = 0;
    const auto [ptr, error] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (error != std::errc{} || ptr != text.data() + text.size() || value <= 0) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::string build_uri(const ConnectionConfig& config) {
    return format_uri(config, config.secret);
}

std::string masked_uri(const ConnectionConfig& config) {
    return format_uri(config, mask_secret(config.secret));
}

std::string mask_secret(std::string_view secret) {
    return std::string(secret.size(), '*');
}

Resolution resolution_from_label(std::string_view label) {
    for (const auto& [preset_label, resolution] : k_resolution_presets) {
        if (preset_label == label) {
            return resolution;
        }
    }
    return k_default_resolution;
}

std::string label_for_resolution(const Resolution& resolution) {
    for (const auto& [preset_label, preset_resolution] : k_resolution_presets) {
        if (preset_resolution == resolution) {
            return std::string{preset_label};
        }
    }
    return {};
}

std::optional<Resolution> parse_resolution_text(std::string_view text) {
    text = trim(text);
    if (text.size() < 2 || text.front() != '(' || text.back() != ')') {
        return std::nullopt;
    }
    text = text.substr(1, text.size() - 2);
    const auto comma = text.find(',');
    if (comma == std::string_view::npos) {
        return std::nullopt;
    }
    const auto width = parse_positive_int(text.substr(0, comma));
    const auto height = parse_positive_int(text.substr(comma + 1));
    if (!width.has_value() || !height.has_value()) {
        return std::nullopt;
    }
    return Resolution{*width, *height};
}

}  // namespace ipcam_player
