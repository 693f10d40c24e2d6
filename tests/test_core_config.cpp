// tests/test_core_config.cpp
//
// Regression/robustness tests for src/core/Config.{h,cpp}.
//
// Goals:
//   - Saving creates the directory + writes config.ini
//   - Loading round-trips values
//   - Corrupt or out-of-range values do not throw and keep the current setting

#include <doctest/doctest.h>

#include "core/Config.h"
#include "test_support/TempDir.h"

#include <filesystem>
#include <fstream>
#include <string>

using namespace civ;
namespace fs = std::filesystem;

namespace {

void write_text(const fs::path& p, const std::string& text)
{
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    REQUIRE(f.good());
    f << text;
}

} // namespace

TEST_CASE("core::SaveConfig creates config.ini and core::LoadConfig round-trips values")
{
    test::TempDir tmp("config_roundtrip");
    const fs::path dir = tmp.path() / "nested";

    core::Config cfg;
    cfg.tickSeconds = 0.5;
    cfg.maxCatchUpTicks = 42;
    cfg.refreshSeconds = 2.0;
    cfg.researchRate = 0.25;
    cfg.saveDir = "my_saves";
    cfg.logDir = "my_logs";

    CHECK(core::SaveConfig(cfg, dir));
    CHECK(fs::exists(dir / "config.ini"));

    core::Config loaded;
    CHECK(core::LoadConfig(loaded, dir));
    CHECK(loaded.tickSeconds == doctest::Approx(0.5));
    CHECK(loaded.maxCatchUpTicks == 42);
    CHECK(loaded.refreshSeconds == doctest::Approx(2.0));
    CHECK(loaded.researchRate == doctest::Approx(0.25));
    CHECK(loaded.saveDir == "my_saves");
    CHECK(loaded.logDir == "my_logs");
}

TEST_CASE("core::LoadConfig returns false for missing file (first run)")
{
    test::TempDir tmp("config_missing");

    core::Config cfg; // defaults
    CHECK_FALSE(core::LoadConfig(cfg, tmp.path()));
    CHECK(cfg.tickSeconds == doctest::Approx(1.0));
    CHECK(cfg.maxCatchUpTicks == 100);
}

TEST_CASE("core::LoadConfig tolerates corrupt values (does not throw)")
{
    test::TempDir tmp("config_corrupt");
    write_text(tmp.path() / "config.ini",
               "tickSeconds=not_a_number\n"
               "maxCatchUpTicks=12\n"
               "refreshSeconds=\n");

    core::Config cfg;
    cfg.tickSeconds = 3.0;     // should remain unchanged (invalid)
    cfg.maxCatchUpTicks = 1;   // should update
    cfg.refreshSeconds = 4.0;  // should remain unchanged (empty)

    CHECK(core::LoadConfig(cfg, tmp.path()));
    CHECK(cfg.tickSeconds == doctest::Approx(3.0));
    CHECK(cfg.maxCatchUpTicks == 12);
    CHECK(cfg.refreshSeconds == doctest::Approx(4.0));
}

TEST_CASE("core::LoadConfig rejects out-of-range values")
{
    test::TempDir tmp("config_range");
    write_text(tmp.path() / "config.ini",
               "tickSeconds=0\n"
               "maxCatchUpTicks=0\n"
               "refreshSeconds=-1\n"
               "researchRate=-0.5\n"
               "maxCatchUpTicks=99999999999999\n");

    core::Config cfg;
    CHECK(core::LoadConfig(cfg, tmp.path()));
    CHECK(cfg.tickSeconds == doctest::Approx(1.0));
    CHECK(cfg.maxCatchUpTicks == 100);
    CHECK(cfg.refreshSeconds == doctest::Approx(1.0));
    CHECK(cfg.researchRate == doctest::Approx(0.1));
}

TEST_CASE("core::LoadConfig skips a UTF-8 BOM")
{
    test::TempDir tmp("config_bom");
    write_text(tmp.path() / "config.ini", "\xEF\xBB\xBFtickSeconds=2.5\n");

    core::Config cfg;
    CHECK(core::LoadConfig(cfg, tmp.path()));
    CHECK(cfg.tickSeconds == doctest::Approx(2.5));
}

TEST_CASE("core::LoadConfig supports inline comments after values")
{
    test::TempDir tmp("config_comments");
    write_text(tmp.path() / "config.ini",
               "tickSeconds=0.25 # seconds\n"
               "saveDir=saves ; relative to cwd\n"
               "; whole line comment\n"
               "# whole line comment\n"
               "no_equals_sign_here\n"
               "unknownKey=5\n");

    core::Config cfg;
    CHECK(core::LoadConfig(cfg, tmp.path()));
    CHECK(cfg.tickSeconds == doctest::Approx(0.25));
    CHECK(cfg.saveDir == "saves");
}
