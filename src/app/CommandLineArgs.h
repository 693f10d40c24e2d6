#pragma once

#include <optional>
#include <string>
#include <vector>

namespace civ::app {

// Parsed command-line arguments for the cividle executable.
//
// Notes:
//   - Option names are case-insensitive; values are kept as typed.
//   - Both "--flag=value" and "--flag value" forms are supported.
struct CommandLineArgs
{
    bool showHelp = false;                    // --help / -h / -?

    std::optional<std::string> configDir;     // --config <dir>
    std::optional<double>      tickSeconds;   // --tick-seconds <s>
    std::optional<std::string> loadName;      // --load <save>

    // Any unknown/unsupported args are collected here (so we can show a useful error).
    std::vector<std::string> unknown;
};

[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace civ::app
