#include "Log.h"
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstdio>
#include <system_error>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

void civ::logsys::init_file_logs(const fs::path& dir, spdlog::level::level_enum level) {
    std::error_code ec;
    fs::create_directories(dir, ec);

    try {
        auto file = (dir / "cividle.log").string();
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4); // 1MB * 4
        g_logger = std::make_shared<spdlog::logger>("cividle", sink);
    } catch (const spdlog::spdlog_ex& e) {
        std::fprintf(stderr, "cividle: logging disabled: %s\n", e.what());
        g_logger = std::make_shared<spdlog::logger>("cividle", std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    spdlog::set_default_logger(g_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::info("Logging started");
}

void civ::logsys::shutdown() {
    if (g_logger) g_logger->flush();
    spdlog::shutdown();
}
