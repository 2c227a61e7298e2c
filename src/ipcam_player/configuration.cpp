// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of the settings that feed the player.
// Camera settings persist between runs in a YAML file written through
// cv::FileStorage; process-level knobs (log directory, log level, connect
// timeout, snapshot base) come from environment variables.
//
// Responsibilities
// - Enforce defaults for every persisted key (protocol "rtsp", port 554,
//   resolution 1920x1080) so a missing or partial file still yields a usable
//   configuration.
// - Surface clear diagnostics via the logging subsystem whenever stored or
//   environment input cannot be parsed.
// - Never log the camera secret.

#include "ipcam_player/configuration.hpp"

#include <cstdlib>
#include <string_view>

#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>

#include "ipcam_player/logging.hpp"

namespace ipcam_player {

namespace {
constexpr double k_default_connect_timeout_s{20.0};
constexpr double k_default_stop_timeout_s{5.0};
constexpr int k_default_window_width_px{1280};
constexpr int k_default_window_height_px{720};
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_settings_file_name{"ipcam_player.yml"};
constexpr std::string_view k_default_snapshot_base{"snapshots/snapshot.png"};

constexpr char k_key_protocol[] = "protocol";
constexpr char k_key_user[] = "user";
constexpr char k_key_secret[] = "secret";
constexpr char k_key_ip[] = "ip";
constexpr char k_key_port[] = "port";
constexpr char k_key_stream_path[] = "stream_path";
constexpr char k_key_video_resolution[] = "video_resolution";

double parse_double(const char* raw_value, double fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        return parsed_value <= 0.0 ? fallback : parsed_value;
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse double from environment; using fallback {}", fallback);
        return fallback;
    }
}

std::string parse_string(const char* raw_value, std::string_view fallback) {
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

std::string read_string(const cv::FileNode& node, std::string_view fallback) {
    std::string value;
    cv::read(node, value, std::string{fallback});
    return value;
}

}  // namespace

Configuration ConfigurationLoader::load(const std::filesystem::path& config_root) {
    Configuration config{};
    config.log_directory = parse_string(std::getenv("IPCAM_PLAYER_LOG_DIR"), k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from {}", config_root.string());

    config.settings_path = config_root / k_settings_file_name;
    config.connection = read_connection_settings(config.settings_path);

    config.session.connect_timeout = load_connect_timeout();
    config.session.stop_timeout = Duration{k_default_stop_timeout_s};

    config.viewer.window_width_px = k_default_window_width_px;
    config.viewer.window_height_px = k_default_window_height_px;
    config.viewer.enable_vsync = true;
    config.viewer.snapshot_base = parse_string(std::getenv("IPCAM_PLAYER_SNAPSHOT_BASE"), k_default_snapshot_base);

    logger->info("Configuration loaded: url={} resolution={} connect_timeout_s={}",
                 config.connection.is_startable() ? masked_uri(config.connection) : std::string{"none"},
                 to_string(config.connection.requested_resolution),
                 config.session.connect_timeout.count());

    return config;
}

bool ConfigurationLoader::save(const Configuration& configuration) {
    return write_connection_settings(configuration.settings_path, configuration.connection);
}

ConnectionConfig ConfigurationLoader::read_connection_settings(const std::filesystem::path& settings_path) {
    auto logger = get_logger();
    ConnectionConfig connection{};

    std::error_code error_exists;
    if (!std::filesystem::exists(settings_path, error_exists)) {
        logger->info("No persisted camera settings at {}; using defaults", settings_path.string());
        return connection;
    }

    try {
        cv::FileStorage storage(settings_path.string(), cv::FileStorage::READ);
        if (!storage.isOpened()) {
            logger->warn("Unable to open camera settings {}; using defaults", settings_path.string());
            return connection;
        }

        connection.scheme = read_string(storage[k_key_protocol], k_default_scheme);
        connection.username = read_string(storage[k_key_user], "");
        connection.secret = read_string(storage[k_key_secret], "");
        connection.host = read_string(storage[k_key_ip], "");
        connection.path = read_string(storage[k_key_stream_path], "");
        cv::read(storage[k_key_port], connection.port, k_default_rtsp_port);

        const std::string resolution_text = read_string(storage[k_key_video_resolution], "");
        if (!resolution_text.empty()) {
            const auto parsed = parse_resolution_text(resolution_text);
            if (parsed.has_value()) {
                connection.requested_resolution = *parsed;
            } else {
                logger->warn("Ignoring malformed video_resolution '{}'", resolution_text);
            }
        }
    } catch (const cv::Exception& exc) {
        logger->warn("Failed to parse camera settings {}: {}", settings_path.string(), exc.what());
        return ConnectionConfig{};
    }

    if (connection.port <= 0) {
        logger->warn("Invalid port {} in camera settings; using {}", connection.port, k_default_rtsp_port);
        connection.port = k_default_rtsp_port;
    }
    return connection;
}

bool ConfigurationLoader::write_connection_settings(const std::filesystem::path& settings_path,
                                                    const ConnectionConfig& connection) {
    auto logger = get_logger();
    if (settings_path.has_parent_path()) {
        std::error_code error_directory;
        std::filesystem::create_directories(settings_path.parent_path(), error_directory);
        if (error_directory) {
            logger->error("Unable to create settings directory {}", settings_path.parent_path().string());
            return false;
        }
    }

    try {
        cv::FileStorage storage(settings_path.string(), cv::FileStorage::WRITE);
        if (!storage.isOpened()) {
            logger->error("Unable to write camera settings to {}", settings_path.string());
            return false;
        }
        storage << k_key_protocol << connection.scheme;
        storage << k_key_user << connection.username;
        storage << k_key_secret << connection.secret;
        storage << k_key_ip << connection.host;
        storage << k_key_port << connection.port;
        storage << k_key_stream_path << connection.path;
        storage << k_key_video_resolution << to_string(connection.requested_resolution);
        storage.release();
    } catch (const cv::Exception& exc) {
        logger->error("Failed to persist camera settings: {}", exc.what());
        return false;
    }

    logger->info("Camera settings saved to {}", settings_path.string());
    return true;
}

Duration ConfigurationLoader::load_connect_timeout() {
    const double parsed_value = parse_double(std::getenv("IPCAM_PLAYER_CONNECT_TIMEOUT_S"), k_default_connect_timeout_s);
    return Duration{parsed_value};
}

}  // namespace ipcam_player
