#include "logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <memory>
#include <system_error>

namespace plx {

void init_logging(const std::filesystem::path& log_file, const std::string& level) {
    std::shared_ptr<spdlog::logger> logger;
    bool to_file = true;

    try {
        // A missing directory surfaces as a sink error below
        std::error_code ec;
        std::filesystem::create_directories(log_file.parent_path(), ec);
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string());
        logger = std::make_shared<spdlog::logger>("plx", std::move(sink));
    } catch (const spdlog::spdlog_ex&) {
        to_file = false;
        logger = std::make_shared<spdlog::logger>("plx", std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;  // Unknown names map to off; keep logging instead
    }

    logger->set_level(parsed);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (to_file) {
        spdlog::info("plx starting, log level {}", spdlog::level::to_string_view(parsed));
    }
}

void shutdown_logging() {
    spdlog::info("plx exiting");
    spdlog::shutdown();
}

} // namespace plx
