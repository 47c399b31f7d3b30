#include "platform_factory.hpp"
#include "settings.hpp"
#include "logging.hpp"
#include "json_project_store.hpp"
#include "display_model.hpp"
#include "launcher.hpp"
#include "dashboard.hpp"
#include "tui/tui_app.hpp"
#include <spdlog/spdlog.h>
#include <iostream>
#include <clocale>
#include <csignal>
#include <memory>

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    // Launched processes are never waited on; let the kernel reap them
    signal(SIGCHLD, SIG_IGN);

    // ncursesw reads and draws UTF-8 only under the user's locale
    setlocale(LC_ALL, "");

    try {
        const auto settings = plx::Settings::from_environment();
        plx::init_logging(settings.log_file, settings.log_level);
        spdlog::info("Catalog: {}", settings.catalog_file.string());

        // Data and platform layers (owned here in main)
        plx::JsonProjectStore store(settings.catalog_file);
        auto spawner = plx::make_process_spawner();

        plx::LauncherConfig launcher_config;
        launcher_config.mount_root = settings.mount_root;
        plx::Launcher launcher(spawner.get(), launcher_config);

        plx::DisplayModel model(&store);
        plx::Dashboard dashboard(&model, &launcher, settings.status_duration);

        // TuiApp does not own these resources - they're managed here.
        // Its destructor restores the terminal if anything below throws.
        {
            plx::TuiApp app(&dashboard);
            app.run();
        }

        plx::shutdown_logging();
        return 0;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
