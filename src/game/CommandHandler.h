#pragma once

#include "sim/Simulation.h"

#include <atomic>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace civ::game {

// Line commands ("build hut", "assign villager wood 2", ...) executed against
// a running simulation. Every outcome is reported to the player through the
// simulation's display; nothing here throws on bad input.
class CommandHandler
{
public:
    struct CommandInfo
    {
        const char* name;
        const char* usage;
        const char* summary;
    };

    CommandHandler(sim::Simulation& simulation, std::filesystem::path saveDir);

    // Returns true when the command was recognised and succeeded.
    bool Execute(std::string_view line);

    [[nodiscard]] bool QuitRequested() const noexcept { return m_quit.load(); }

    [[nodiscard]] static const std::vector<CommandInfo>& Commands();

    // Positive integer or nothing.
    [[nodiscard]] static bool ParseCount(std::string_view text, int& out) noexcept;

private:
    using Args = std::vector<std::string>;

    bool Help(const Args& args);
    bool Gather(const Args& args);
    bool Assign(const Args& args);
    bool Unassign(const Args& args);
    bool Recruit(const Args& args);
    bool Build(const Args& args);
    bool ListBuildings(const Args& args);
    bool Research(const Args& args);
    bool ListTechs(const Args& args);
    bool Status(const Args& args);
    bool Stats(const Args& args);
    bool Save(const Args& args);
    bool Load(const Args& args);
    bool ListSaves(const Args& args);
    bool Quit(const Args& args);

    bool Usage(std::string_view command);
    bool Fail(const std::string& text);

    // Runs fn under the simulation lock; false when the session is not running
    // or fn reported failure.
    bool Mutate(const std::function<bool(sim::Settlement&, sim::SimEventQueue&)>& fn);

    sim::Simulation&      m_sim;
    std::filesystem::path m_saveDir;
    std::atomic<bool>     m_quit{false};
};

} // namespace civ::game
