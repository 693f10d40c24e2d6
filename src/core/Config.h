#pragma once
#include <filesystem>
#include <string>

namespace civ::core {

struct Config {
    double      tickSeconds     = 1.0;
    int         maxCatchUpTicks = 100;
    double      refreshSeconds  = 1.0;
    double      researchRate    = 0.1;
    std::string saveDir         = "data/saves";
    std::string logDir          = "logs";
};

// config.ini in dir. Returns false when the file is missing or unreadable;
// values that fail to parse or are out of range keep their current setting.
bool LoadConfig(Config& cfg, const std::filesystem::path& dir);
bool SaveConfig(const Config& cfg, const std::filesystem::path& dir);

} // namespace civ::core
