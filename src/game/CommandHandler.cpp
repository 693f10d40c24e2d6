#include "game/CommandHandler.h"

#include "civ/save/SaveGame.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <sstream>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace civ::game {

using sim::Severity;

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] std::vector<std::string> Tokenize(std::string_view line)
{
    std::vector<std::string> out;
    std::istringstream iss{std::string(line)};
    std::string tok;
    while (iss >> tok)
        out.push_back(std::move(tok));
    return out;
}

[[nodiscard]] std::string FormatAmounts(const sim::AmountList& lines)
{
    std::string out;
    for (const auto& [res, amount] : lines)
    {
        if (!out.empty())
            out += ", ";
        out += fmt::format("{} {:g}", res, amount);
    }
    return out.empty() ? "free" : out;
}

[[nodiscard]] std::string Plural(std::string_view word, int count)
{
    return count == 1 ? std::string(word) : std::string(word) + "s";
}

} // namespace

CommandHandler::CommandHandler(sim::Simulation& simulation, std::filesystem::path saveDir)
    : m_sim(simulation),
      m_saveDir(std::move(saveDir))
{
}

const std::vector<CommandHandler::CommandInfo>& CommandHandler::Commands()
{
    static const std::vector<CommandInfo> kCommands = {
        {"help",      "help",                           "Show this list"},
        {"gather",    "gather <resource> <count>",      "Send idle villagers to gather a resource"},
        {"assign",    "assign <type> <task> <count>",   "Move idle workers to a task"},
        {"unassign",  "unassign <type> <task> <count>", "Move workers from a task back to idle"},
        {"recruit",   "recruit <type> <count>",         "Recruit workers (costs food, needs housing)"},
        {"build",     "build <building>",               "Construct a building"},
        {"buildings", "buildings",                      "List buildings available in this age"},
        {"research",  "research <technology>",          "Start researching a technology"},
        {"techs",     "techs",                          "List technologies"},
        {"status",    "status",                         "Summarise the settlement"},
        {"stats",     "stats",                          "Show game statistics"},
        {"save",      "save <name>",                    "Save the game"},
        {"load",      "load <name>",                    "Load a saved game"},
        {"saves",     "saves",                          "List saved games"},
        {"quit",      "quit",                           "Leave the game"},
    };
    return kCommands;
}

bool CommandHandler::ParseCount(std::string_view text, int& out) noexcept
{
    int v = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end || v <= 0)
        return false;
    out = v;
    return true;
}

bool CommandHandler::Execute(std::string_view line)
{
    Args tokens = Tokenize(line);
    if (tokens.empty())
        return false;

    const std::string verb = ToLower(tokens.front());
    Args args(tokens.begin() + 1, tokens.end());

    // Save names keep their case; everything else is matched lower-case.
    if (verb != "save" && verb != "load")
        for (auto& a : args)
            a = ToLower(a);

    using Handler = bool (CommandHandler::*)(const Args&);
    static const std::vector<std::pair<const char*, Handler>> kHandlers = {
        {"help",      &CommandHandler::Help},
        {"gather",    &CommandHandler::Gather},
        {"assign",    &CommandHandler::Assign},
        {"unassign",  &CommandHandler::Unassign},
        {"recruit",   &CommandHandler::Recruit},
        {"build",     &CommandHandler::Build},
        {"buildings", &CommandHandler::ListBuildings},
        {"research",  &CommandHandler::Research},
        {"techs",     &CommandHandler::ListTechs},
        {"status",    &CommandHandler::Status},
        {"stats",     &CommandHandler::Stats},
        {"save",      &CommandHandler::Save},
        {"load",      &CommandHandler::Load},
        {"saves",     &CommandHandler::ListSaves},
        {"quit",      &CommandHandler::Quit},
        {"exit",      &CommandHandler::Quit},
    };

    for (const auto& [name, handler] : kHandlers)
        if (verb == name)
            return (this->*handler)(args);

    return Fail("Unknown command: " + verb + ". Type 'help' for a list of commands.");
}

bool CommandHandler::Usage(std::string_view command)
{
    for (const auto& c : Commands())
        if (command == c.name)
            return Fail(std::string("Usage: ") + c.usage);
    return false;
}

bool CommandHandler::Fail(const std::string& text)
{
    m_sim.Notify(text, Severity::Error);
    return false;
}

bool CommandHandler::Mutate(const std::function<bool(sim::Settlement&, sim::SimEventQueue&)>& fn)
{
    bool ok = false;
    const bool ran = m_sim.Apply([&](sim::Settlement& w, sim::SimEventQueue& out) {
        ok = fn(w, out);
    });
    if (!ran)
        return Fail("No game in progress.");
    return ok;
}

bool CommandHandler::Help(const Args&)
{
    m_sim.Notify("Available commands:", Severity::Highlight);
    for (const auto& c : Commands())
        m_sim.Notify(fmt::format("  {:<32} {}", c.usage, c.summary));
    return true;
}

bool CommandHandler::Gather(const Args& args)
{
    if (args.size() != 2)
        return Usage("gather");

    return Assign({"villager", args[0], args[1]});
}

bool CommandHandler::Assign(const Args& args)
{
    if (args.size() != 3)
        return Usage("assign");

    int count = 0;
    if (!ParseCount(args[2], count))
        return Fail("Count must be a positive number");

    const std::string& type = args[0];
    const std::string& task = args[1];

    return Mutate([&](sim::Settlement& w, sim::SimEventQueue& out) {
        if (!w.workforce.IsKnownType(type))
        {
            out.PushMessage("Unknown worker type: " + type, Severity::Error);
            return false;
        }
        if (!w.workforce.CanPerform(type, task))
        {
            out.PushMessage(fmt::format("A {} cannot work on {}", type, task), Severity::Error);
            return false;
        }
        const int idle = w.workforce.Idle(type);
        if (!w.workforce.Assign(type, task, count))
        {
            out.PushMessage(fmt::format("Not enough idle {} (have {}, need {})",
                                        Plural(type, 2), idle, count), Severity::Warning);
            return false;
        }
        out.PushMessage(fmt::format("Assigned {} {} to {}", count, Plural(type, count), task),
                        Severity::Success);
        return true;
    });
}

bool CommandHandler::Unassign(const Args& args)
{
    if (args.size() != 3)
        return Usage("unassign");

    int count = 0;
    if (!ParseCount(args[2], count))
        return Fail("Count must be a positive number");

    const std::string& type = args[0];
    const std::string& task = args[1];

    return Mutate([&](sim::Settlement& w, sim::SimEventQueue& out) {
        if (!w.workforce.IsKnownType(type))
        {
            out.PushMessage("Unknown worker type: " + type, Severity::Error);
            return false;
        }
        if (!w.workforce.CanPerform(type, task))
        {
            out.PushMessage(fmt::format("A {} cannot work on {}", type, task), Severity::Error);
            return false;
        }
        const int assigned = w.workforce.Assigned(type, task);
        if (!w.workforce.Unassign(type, task, count))
        {
            out.PushMessage(fmt::format("Only {} {} working on {}",
                                        assigned, Plural(type, assigned), task), Severity::Warning);
            return false;
        }
        out.PushMessage(fmt::format("Unassigned {} {} from {}", count, Plural(type, count), task),
                        Severity::Success);
        return true;
    });
}

bool CommandHandler::Recruit(const Args& args)
{
    if (args.size() != 2)
        return Usage("recruit");

    int count = 0;
    if (!ParseCount(args[1], count))
        return Fail("Count must be a positive number");

    const std::string& type = args[0];
    const sim::ProgressionLadder& ladder = m_sim.Ladder();

    return Mutate([&](sim::Settlement& w, sim::SimEventQueue& out) {
        if (!w.workforce.IsKnownType(type))
        {
            out.PushMessage("Unknown worker type: " + type, Severity::Error);
            return false;
        }
        if (!ladder.IsWorkerUnlocked(type, w.age))
        {
            out.PushMessage(fmt::format("{} are not available in the {}", Plural(type, 2), w.age),
                            Severity::Warning);
            return false;
        }

        const int population = w.workforce.TotalPopulation();
        const int capacity = w.buildings.VillagerCapacity();
        if (count > capacity - population)
        {
            out.PushMessage(fmt::format("Not enough housing. Capacity: {}, current population: {}",
                                        capacity, population), Severity::Warning);
            return false;
        }

        const double cost = w.workforce.UpkeepOf(type) * count;
        if (!w.ledger.Remove(sim::kFood, cost))
        {
            out.PushMessage(fmt::format("Not enough food to recruit {} {}. Need {:.1f} food, have {:.1f}",
                                        count, Plural(type, count), cost, w.ledger.TotalFood()),
                            Severity::Warning);
            return false;
        }

        w.workforce.Add(type, count);
        w.stats.AddWorkersRecruited(type, count);
        const std::string msg = fmt::format("Recruited {} {}", count, Plural(type, count));
        w.stats.AddEvent(w.tick, "villager_recruited", msg);
        out.PushMessage(msg + fmt::format(" for {:.1f} food", cost), Severity::Success);
        return true;
    });
}

bool CommandHandler::Build(const Args& args)
{
    if (args.size() != 1)
        return Usage("build");

    const std::string& name = args[0];
    const sim::ProgressionLadder& ladder = m_sim.Ladder();

    return Mutate([&](sim::Settlement& w, sim::SimEventQueue& out) {
        const sim::BuildingDef* def = w.buildings.Find(name);
        if (!def)
        {
            out.PushMessage("Unknown building: " + name, Severity::Error);
            return false;
        }
        if (!ladder.IsBuildingUnlocked(name, w.age))
        {
            out.PushMessage(fmt::format("{} is not available in the {}", name, w.age), Severity::Warning);
            return false;
        }
        if (!w.buildings.Build(name, w.ledger))
        {
            out.PushMessage(fmt::format("Not enough resources to build {}. Cost: {}",
                                        name, FormatAmounts(def->cost)), Severity::Warning);
            return false;
        }

        w.stats.AddBuildingBuilt(name);
        w.stats.AddEvent(w.tick, "building_built", "Built a " + name);
        out.PushMessage(fmt::format("Built a {}! You now have {}.", name, w.buildings.Count(name)),
                        Severity::Success);
        return true;
    });
}

bool CommandHandler::ListBuildings(const Args&)
{
    const sim::ProgressionLadder& ladder = m_sim.Ladder();

    return Mutate([&](sim::Settlement& w, sim::SimEventQueue& out) {
        out.PushMessage("Buildings available in the " + w.age + ":", Severity::Highlight);
        for (const auto& name : ladder.UnlockedBuildings(w.age))
        {
            const sim::BuildingDef* def = w.buildings.Find(name);
            const char* mark = w.buildings.CanBuild(name, w.ledger) ? "+" : "-";
            out.PushMessage(fmt::format("  {} {:<12} owned {:>3}  cost: {}",
                                        mark, name, w.buildings.Count(name), FormatAmounts(def->cost)));
        }
        return true;
    });
}

bool CommandHandler::Research(const Args& args)
{
    if (args.size() != 1)
        return Usage("research");

    const std::string& key = args[0];
    const sim::ProgressionLadder& ladder = m_sim.Ladder();

    return Mutate([&](sim::Settlement& w, sim::SimEventQueue& out) {
        const sim::TechDef* tech = w.research.Find(key);
        if (!tech)
        {
            out.PushMessage("Unknown technology: " + key, Severity::Error);
            return false;
        }
        if (const auto& current = w.research.Current())
        {
            const sim::TechDef* cur = w.research.Find(*current);
            out.PushMessage(fmt::format("You are already researching {} ({:.1f} / {:g})",
                                        cur ? cur->name : *current,
                                        w.research.Progress(), w.research.CurrentCost()),
                            Severity::Warning);
            return false;
        }
        if (w.research.IsResearched(key))
        {
            out.PushMessage(tech->name + " has already been researched", Severity::Warning);
            return false;
        }
        if (w.ledger.Get("knowledge") <= 0.0)
        {
            out.PushMessage("You need knowledge to research. Assign workers to knowledge first.",
                            Severity::Warning);
            return false;
        }

        const auto available = w.research.AvailableTechnologies(ladder, w.age);
        const bool isAvailable = std::any_of(available.begin(), available.end(),
                                             [&](const sim::TechDef* t) { return t->key == key; });
        if (!isAvailable || !w.research.StartResearch(key, 0.0))
        {
            out.PushMessage(fmt::format("{} is not available yet (needs the {}{})",
                                        tech->name, tech->age,
                                        tech->prereqs.empty() ? "" : " and earlier research"),
                            Severity::Warning);
            return false;
        }

        w.stats.AddEvent(w.tick, "research_started", "Started researching " + tech->name);
        out.PushMessage(fmt::format("Started researching {} (cost {:g})", tech->name, tech->cost),
                        Severity::Success);
        return true;
    });
}

bool CommandHandler::ListTechs(const Args&)
{
    const sim::ProgressionLadder& ladder = m_sim.Ladder();

    return Mutate([&](sim::Settlement& w, sim::SimEventQueue& out) {
        if (const auto& current = w.research.Current())
        {
            const sim::TechDef* cur = w.research.Find(*current);
            out.PushMessage(fmt::format("Researching: {} ({:.1f} / {:g})",
                                        cur ? cur->name : *current,
                                        w.research.Progress(), w.research.CurrentCost()),
                            Severity::Highlight);
        }

        const auto available = w.research.AvailableTechnologies(ladder, w.age);
        out.PushMessage("Available technologies:", Severity::Highlight);
        if (available.empty())
            out.PushMessage("  (none)");
        for (const sim::TechDef* t : available)
        {
            std::string effects;
            for (const auto& [effect, value] : t->effects)
            {
                if (!effects.empty())
                    effects += ", ";
                effects += fmt::format("{} {:g}", effect, value);
            }
            out.PushMessage(fmt::format("  {:<12} cost {:>3g}  {} [{}]",
                                        t->key, t->cost, t->description, effects));
        }

        if (!w.research.Researched().empty())
        {
            std::string done;
            for (const auto& key : w.research.Researched())
            {
                if (!done.empty())
                    done += ", ";
                done += key;
            }
            out.PushMessage("Researched: " + done);
        }
        return true;
    });
}

bool CommandHandler::Status(const Args&)
{
    const sim::ProgressionLadder& ladder = m_sim.Ladder();

    return Mutate([&](sim::Settlement& w, sim::SimEventQueue& out) {
        out.PushMessage(fmt::format("{} - tick {}", w.age, w.tick), Severity::Highlight);
        out.PushMessage(fmt::format("Food: {:.1f} (upkeep {:.2f}/tick)",
                                    w.ledger.TotalFood(), w.workforce.FoodUpkeep()));
        out.PushMessage(fmt::format("Population: {} / {}",
                                    w.workforce.TotalPopulation(), w.buildings.VillagerCapacity()));

        for (const auto& g : w.workforce.Groups())
        {
            if (g.count == 0)
                continue;
            std::string jobs;
            for (const auto& [task, n] : g.assignment)
            {
                if (n == 0)
                    continue;
                if (!jobs.empty())
                    jobs += ", ";
                jobs += fmt::format("{} {}", task, n);
            }
            out.PushMessage(fmt::format("  {}: {} ({})", Plural(g.type, 2), g.count, jobs));
        }

        if (const sim::AgeDef* next = ladder.NextAge(w.age))
        {
            const auto missing = ladder.MissingRequirements(w.ledger, w.buildings, w.age);
            out.PushMessage("Next age: " + next->name);
            for (const auto& line : missing)
                out.PushMessage("  needs " + line);
        }
        else
        {
            out.PushMessage("You have reached the final age.");
        }
        return true;
    });
}

bool CommandHandler::Stats(const Args&)
{
    return Mutate([&](sim::Settlement& w, sim::SimEventQueue& out) {
        const auto& st = w.stats;
        out.PushMessage("Game statistics", Severity::Highlight);
        out.PushMessage("  Play time: " + st.PlayTime(sim::GameStats::NowUnix()));
        out.PushMessage(fmt::format("  Current age: {}  Ticks: {}", w.age, w.tick));
        out.PushMessage(fmt::format("  Resources gathered: {:.1f}", st.TotalResourcesGathered()));
        for (const auto& [res, amount] : st.ResourcesGathered())
            out.PushMessage(fmt::format("    {:<10} {:.1f}", res, amount));
        out.PushMessage(fmt::format("  Buildings built: {}", st.TotalBuildingsBuilt()));
        out.PushMessage(fmt::format("  Workers recruited: {}", st.TotalWorkersRecruited()));

        std::string ages;
        for (const auto& a : st.AgesReached())
        {
            if (!ages.empty())
                ages += " -> ";
            ages += a;
        }
        out.PushMessage("  Ages reached: " + ages);

        const auto recent = st.RecentEvents(10);
        if (!recent.empty())
        {
            out.PushMessage("  Recent events:");
            for (const auto& e : recent)
                out.PushMessage(fmt::format("    [tick {}] {}", e.tick, e.message));
        }
        return true;
    });
}

bool CommandHandler::Save(const Args& args)
{
    if (args.size() != 1)
        return Usage("save");

    const std::string& name = args[0];
    if (!save::IsValidSaveName(name))
        return Fail("Save names may only use letters, digits, '_', '-' and '.'");

    save::SaveError err;
    if (!m_sim.SaveTo(save::SavePathFor(m_saveDir, name), &err))
        return Fail("Failed to save game: " + err.message);

    m_sim.Notify("Game saved as '" + name + "'", Severity::Success);
    return true;
}

bool CommandHandler::Load(const Args& args)
{
    if (args.size() != 1)
        return Usage("load");

    const std::string& name = args[0];
    if (!save::IsValidSaveName(name))
        return Fail("Save names may only use letters, digits, '_', '-' and '.'");

    save::SaveError err;
    if (!m_sim.LoadFrom(save::SavePathFor(m_saveDir, name), std::chrono::system_clock::now(), &err))
        return Fail("Failed to load game: " + err.message);

    m_sim.Notify("Game '" + name + "' loaded", Severity::Success);
    m_sim.RefreshDisplay();
    return true;
}

bool CommandHandler::ListSaves(const Args&)
{
    const auto names = save::ListSaves(m_saveDir);
    if (names.empty())
    {
        m_sim.Notify("No saved games found.");
        return true;
    }

    m_sim.Notify("Saved games:", Severity::Highlight);
    for (const auto& n : names)
        m_sim.Notify("  " + n);
    return true;
}

bool CommandHandler::Quit(const Args&)
{
    m_quit.store(true);
    m_sim.Quit();
    return true;
}

} // namespace civ::game
