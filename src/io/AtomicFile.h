// src/io/AtomicFile.h
//
// Portable atomic file writes and whole-file reads.
//
// Guarantees:
//  - Data is written to a sibling "<final>.tmp", flushed, then renamed over the
//    destination. A crash mid-write leaves either the old file or the new one.
//  - With make_backup the previous destination is first copied to "<final>.bak".

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace civ::io {

namespace fs = std::filesystem;

/// Atomically replace `final_path` with `bytes`, creating parent directories.
///
/// @param err          Optional: receives a human-readable error on failure.
/// @param make_backup  If true and destination exists, keep a "<final>.bak" copy.
[[nodiscard]] bool write_atomic(const fs::path& final_path,
                                std::string_view bytes,
                                std::string* err = nullptr,
                                bool make_backup = false);

/// Read the entire file at `path` into `out` (replaced on success).
[[nodiscard]] bool read_all(const fs::path& path,
                            std::string& out,
                            std::string* err = nullptr);

[[nodiscard]] inline fs::path temp_path_for(const fs::path& final_path)
{
    fs::path p = final_path;
    p += ".tmp";
    return p;
}

[[nodiscard]] inline fs::path default_backup_path(const fs::path& final_path)
{
    fs::path p = final_path;
    p += ".bak";
    return p;
}

} // namespace civ::io
