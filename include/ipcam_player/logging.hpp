// === Logging =================================================================
//
// One process-wide spdlog logger shared by the UI thread, the producer loop
// and the detached connect threads. Console output stays terse; the rotating
// file carries one JSON object per line with the emitting thread, which is
// what separates producer and UI activity when a stream misbehaves.

#pragma once

#include <memory>
#include <string>

// Force spdlog to use its bundled fmt implementation. Some build modes define
// SPDLOG_FMT_EXTERNAL implicitly, which results in missing <fmt/core.h>
// headers when the external dependency is not present. Undefining the macro
// before including spdlog headers guarantees consistent behaviour across
// translation units.
#ifdef SPDLOG_FMT_EXTERNAL
#undef SPDLOG_FMT_EXTERNAL
#endif

#include <spdlog/logger.h>

namespace ipcam_player {

/**
 * @brief Create the shared logger writing to `<log_directory>/ipcam_player.log`.
 *
 * Only the first call has an effect; later calls return the existing logger.
 * Throws std::runtime_error when the directory cannot be created.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @brief The shared logger; throws when initialize_logger has not run. */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * @brief Apply a level name such as "debug" or "warn".
 * @return false when the name is unknown and info was applied instead.
 */
bool set_log_level(const std::string& str_level);

}  // namespace ipcam_player
