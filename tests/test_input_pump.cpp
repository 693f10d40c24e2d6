// tests/test_input_pump.cpp

#include <doctest/doctest.h>

#include "app/InputPump.h"

#include <taskflow/taskflow.hpp>

#include <chrono>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

using namespace std::chrono_literals;

TEST_CASE("InputPump: delivers lines in order and reports the end of input")
{
    std::istringstream in("build hut\r\ngather wood 2\n\nstatus");

    tf::Executor executor(1);
    civ::app::InputPump pump(in);
    pump.Start(executor);

    std::vector<std::string> lines;
    for (int i = 0; i < 200 && !pump.Closed(); ++i)
        if (auto line = pump.Poll(50ms))
            lines.push_back(*line);

    pump.Stop();

    REQUIRE(lines.size() == 4);
    CHECK(lines[0] == "build hut");
    CHECK(lines[1] == "gather wood 2");
    CHECK(lines[2].empty());
    CHECK(lines[3] == "status");
    CHECK(pump.Closed());
    CHECK_FALSE(pump.Poll(1ms).has_value());
}

TEST_CASE("InputPump: lines from a pipe arrive while the writer stays open")
{
    int fds[2] = {-1, -1};
    REQUIRE(::pipe(fds) == 0);

    const std::string first = "build hut\nstatus\n";
    REQUIRE(::write(fds[1], first.data(), first.size()) == static_cast<ssize_t>(first.size()));

    tf::Executor executor(1);
    civ::app::InputPump pump(fds[0]);
    pump.Start(executor);

    std::vector<std::string> lines;
    for (int i = 0; i < 100 && lines.size() < 2; ++i)
        if (auto line = pump.Poll(20ms))
            lines.push_back(*line);

    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "build hut");
    CHECK(lines[1] == "status");
    CHECK_FALSE(pump.Closed());

    // A trailing line without a newline is still delivered at end of input.
    const std::string last = "save camp";
    REQUIRE(::write(fds[1], last.data(), last.size()) == static_cast<ssize_t>(last.size()));
    ::close(fds[1]);

    for (int i = 0; i < 100 && !pump.Closed(); ++i)
        if (auto line = pump.Poll(20ms))
            lines.push_back(*line);

    pump.Stop();
    ::close(fds[0]);

    REQUIRE(lines.size() == 3);
    CHECK(lines[2] == "save camp");
    CHECK(pump.Closed());
}

TEST_CASE("InputPump: stop returns while a descriptor stays silent")
{
    int fds[2] = {-1, -1};
    REQUIRE(::pipe(fds) == 0);

    tf::Executor executor(1);
    civ::app::InputPump pump(fds[0]);
    pump.Start(executor);

    CHECK_FALSE(pump.Poll(30ms).has_value());
    pump.Stop();
    CHECK_FALSE(pump.Closed());

    ::close(fds[1]);
    ::close(fds[0]);
}
