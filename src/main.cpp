#include "app/CommandLineArgs.h"
#include "app/ConsoleDisplay.h"
#include "app/InputPump.h"
#include "app/RefreshLoop.h"
#include "civ/save/SaveGame.hpp"
#include "core/Config.h"
#include "game/CommandHandler.h"
#include "logging/Log.h"
#include "sim/Catalog.h"
#include "sim/Simulation.h"

#include <taskflow/taskflow.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>

#include <unistd.h>

#include <spdlog/spdlog.h>

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

void OnStopSignal(int)
{
    g_stopRequested = 1;
}

void PrintIntro(std::ostream& out)
{
    out << "==============================================\n"
        << "                   CivIdle\n"
        << "  Grow a settlement from the Stone Age onward.\n"
        << "  Type 'help' for commands, 'quit' to leave.\n"
        << "==============================================\n";
}

} // namespace

int main(int argc, char** argv)
{
    using namespace civ;
    using Clock = sim::Simulation::TimePoint::clock;

    const app::CommandLineArgs args = app::ParseCommandLineArgs(argc, argv);
    if (args.showHelp)
    {
        std::cout << app::BuildCommandLineHelpText();
        return 0;
    }
    if (!args.unknown.empty())
    {
        for (const auto& a : args.unknown)
            std::cerr << "cividle: unrecognised argument '" << a << "'\n";
        std::cerr << app::BuildCommandLineHelpText();
        return 2;
    }

    const std::filesystem::path configDir = args.configDir.value_or(".");
    core::Config cfg;
    const bool haveConfig = core::LoadConfig(cfg, configDir);
    if (args.tickSeconds)
        cfg.tickSeconds = *args.tickSeconds;

    logsys::init_file_logs(cfg.logDir);
    if (!haveConfig)
    {
        spdlog::info("No config.ini in {}; writing defaults", configDir.string());
        if (!core::SaveConfig(core::Config{}, configDir))
            spdlog::warn("Could not write default config to {}", configDir.string());
    }

    const sim::Catalog& catalog = sim::DefaultCatalog();
    std::string catalogError;
    if (!sim::ValidateCatalog(catalog, &catalogError))
    {
        spdlog::critical("Catalog validation failed: {}", catalogError);
        std::cerr << "cividle: internal data error: " << catalogError << "\n";
        logsys::shutdown();
        return 1;
    }

    std::signal(SIGINT, OnStopSignal);
    std::signal(SIGTERM, OnStopSignal);

    sim::SimConfig simCfg;
    simCfg.tickSeconds     = cfg.tickSeconds;
    simCfg.maxCatchUpTicks = cfg.maxCatchUpTicks;
    simCfg.researchRate    = cfg.researchRate;

    app::ConsoleDisplay display(std::cout, cfg.refreshSeconds);
    sim::Simulation simulation(catalog, simCfg, &display);
    game::CommandHandler commands(simulation, cfg.saveDir);

    PrintIntro(std::cout);

    bool started = false;
    if (args.loadName)
    {
        if (!save::IsValidSaveName(*args.loadName))
        {
            simulation.Notify("Invalid save name: " + *args.loadName, sim::Severity::Error);
        }
        else
        {
            save::SaveError err;
            const auto file = save::SavePathFor(cfg.saveDir, *args.loadName);
            started = simulation.LoadFrom(file, Clock::now(), &err);
            if (started)
                simulation.Notify("Loaded game '" + *args.loadName + "'", sim::Severity::Success);
            else
                simulation.Notify("Could not load '" + *args.loadName + "': " + err.message, sim::Severity::Error);
        }
    }
    if (!started && !simulation.StartSession(Clock::now()))
    {
        spdlog::critical("Session failed to start");
        logsys::shutdown();
        return 1;
    }
    simulation.RefreshDisplay();

    tf::Executor executor(2);
    app::InputPump input(STDIN_FILENO);
    app::RefreshLoop refresh(simulation,
                             std::chrono::milliseconds(static_cast<long long>(cfg.refreshSeconds * 1000.0)));
    input.Start(executor);
    refresh.Start(executor);

    while (!g_stopRequested && !commands.QuitRequested())
    {
        bool ran = false;
        if (auto line = input.Poll(std::chrono::milliseconds(50)))
        {
            commands.Execute(*line);
            ran = true;
        }
        else if (input.Closed())
        {
            spdlog::info("Input closed");
            break;
        }

        if (commands.QuitRequested())
            break;

        const auto now = Clock::now();
        if (ran || simulation.TickDue(now))
            simulation.Update(now);
    }

    if (g_stopRequested)
        spdlog::info("Stop signal received");

    refresh.Stop();
    simulation.Quit();
    input.Stop();
    executor.wait_for_all();

    logsys::shutdown();
    return 0;
}
