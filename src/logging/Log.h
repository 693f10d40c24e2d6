#pragma once
#include <filesystem>
#include <spdlog/spdlog.h>

namespace civ::logsys {
    // Rotating "<dir>/cividle.log" (1 MB * 4) installed as the default logger.
    // The console belongs to the game, so nothing is logged there. Falls back
    // to a null sink when the directory cannot be created.
    void init_file_logs(const std::filesystem::path& dir,
                        spdlog::level::level_enum level = spdlog::level::info);
    void shutdown();
}
