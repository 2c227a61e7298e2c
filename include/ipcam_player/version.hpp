// === Version Metadata ========================================================
//
// Product name and software revision. The revision is what the status line
// reports as "SW Rev"; both appear in the startup log and the window title.

#pragma once

#include <string_view>

namespace ipcam_player {

inline constexpr std::string_view k_application_name{"IP Camera Player"};
inline constexpr std::string_view k_version{"1.0.0"};

}  // namespace ipcam_player
