// === Configuration ===========================================================
//
// Exposes strongly-typed configuration objects describing the camera
// connection, session timing, viewer window and logging. `ConfigurationLoader`
// hydrates them from the persisted settings file plus environment overrides
// so downstream modules never touch `std::getenv` or the settings file
// directly.

#pragma once

#include <filesystem>
#include <string>

#include "ipcam_player/connection_config.hpp"
#include "ipcam_player/stream_session.hpp"
#include "ipcam_player/types.hpp"

namespace ipcam_player {

/** @brief Window and snapshot settings for the viewer. */
struct ViewerConfig final {
    int window_width_px{};        /**< Initial window width in pixels. */
    int window_height_px{};       /**< Initial window height in pixels. */
    bool enable_vsync{};          /**< Enable vertical sync when true. */
    std::string snapshot_base{};  /**< Base path snapshots are written next to. */
};

/**
 * @brief Runtime knobs for the player.
 *
 * Every field is populated by ConfigurationLoader. The connection part is the
 * persisted camera settings; the controller owns the struct and passes the
 * connection by reference into StreamSession::start.
 */
struct Configuration final {
    std::string log_directory{};            /**< Destination directory for structured logs. */
    std::filesystem::path settings_path{};  /**< Persisted camera settings file. */
    ConnectionConfig connection{};          /**< Camera connection settings. */
    StreamSessionOptions session{};         /**< Connect/stop timing. */
    ViewerConfig viewer{};                  /**< Window/render settings. */
};

/**
 * @brief Utility responsible for hydrating Configuration from the settings
 *        file and environment variables, and persisting it again on exit.
 */
class ConfigurationLoader final {
  public:
    static Configuration load(const std::filesystem::path& config_root);
    /** @brief Persist the camera settings of `configuration` to its settings file. */
    static bool save(const Configuration& configuration);

    /** @brief Read persisted camera settings; missing keys take their defaults. */
    static ConnectionConfig read_connection_settings(const std::filesystem::path& settings_path);
    /** @brief Write camera settings; returns false when the file cannot be written. */
    static bool write_connection_settings(const std::filesystem::path& settings_path, const ConnectionConfig& connection);

  private:
    static Duration load_connect_timeout();
};

}  // namespace ipcam_player
