#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>

#include <spdlog/spdlog.h>

#include "ipcam_player/configuration.hpp"
#include "ipcam_player/logging.hpp"
#include "ipcam_player/player_controller.hpp"
#include "ipcam_player/version.hpp"
#include "ipcam_player/viewer_window.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}

std::filesystem::path resolve_config_root(int argc, char** argv) {
    if (argc > 1) {
        return std::filesystem::path{argv[1]};
    }
    if (const char* config_dir = std::getenv("IPCAM_PLAYER_CONFIG_DIR"); config_dir != nullptr) {
        return std::filesystem::path{config_dir};
    }
    return std::filesystem::path{"."};
}
}  // namespace

int main(int argc, char** argv) {
    using namespace ipcam_player;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load(resolve_config_root(argc, argv));

        if (const char* desired_level = std::getenv("IPCAM_PLAYER_LOG_LEVEL"); desired_level != nullptr) {
            set_log_level(desired_level);
        }

        auto logger = get_logger();
        logger->info("Starting {} v{}", k_application_name, k_version);

        const ViewerConfig viewer_config = configuration.viewer;
        PlayerController controller{std::move(configuration), make_opencv_source_opener()};
        ViewerWindow window{viewer_config, controller};
        window.initialize();
        window.run(should_terminate);

        controller.shutdown();
        window.shutdown();
        logger->info("{} exiting", k_application_name);
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
