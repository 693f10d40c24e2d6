// tests/test_io_atomic_file.cpp
//
// Regression coverage for civ::io::write_atomic/read_all.

#include <doctest/doctest.h>

#include "io/AtomicFile.h"
#include "test_support/TempDir.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

TEST_CASE("civ::io::write_atomic round-trips bytes and keeps a backup on request")
{
    civ::test::TempDir tmp("atomic_io");
    const fs::path p = tmp.path() / "sub" / "atomic_io_roundtrip.txt";

    INFO("path: ", p.string());

    std::string err;
    CHECK(civ::io::write_atomic(p, "hello\n", &err, /*make_backup=*/true));
    CHECK(err.empty());

    std::string read;
    CHECK(civ::io::read_all(p, read, &err));
    CHECK(read == "hello\n");

    // Overwrite should succeed and (with make_backup=true) preserve the prior version as .bak
    CHECK(civ::io::write_atomic(p, "world\n", &err, /*make_backup=*/true));

    read.clear();
    CHECK(civ::io::read_all(p, read, &err));
    CHECK(read == "world\n");

    std::string bak_read;
    CHECK(civ::io::read_all(civ::io::default_backup_path(p), bak_read, &err));
    CHECK(bak_read == "hello\n");

    CHECK_FALSE(fs::exists(civ::io::temp_path_for(p)));
}

TEST_CASE("civ::io::write_atomic make_backup=false does not create .bak")
{
    civ::test::TempDir tmp("atomic_io_nobak");
    const fs::path p = tmp.path() / "atomic_io_no_bak.txt";
    const fs::path bak = civ::io::default_backup_path(p);

    std::string err;
    CHECK(civ::io::write_atomic(p, "first", &err, /*make_backup=*/false));
    CHECK(civ::io::write_atomic(p, "second", &err, /*make_backup=*/false));
    CHECK_FALSE(fs::exists(bak));
}

TEST_CASE("civ::io::read_all reports a missing file")
{
    civ::test::TempDir tmp("atomic_io_missing");

    std::string out = "untouched";
    std::string err;
    CHECK_FALSE(civ::io::read_all(tmp.path() / "nope.txt", out, &err));
    CHECK_FALSE(err.empty());
    CHECK(out == "untouched");
}
