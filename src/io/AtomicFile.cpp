#include "io/AtomicFile.h"

#include <fstream>
#include <system_error>
#include <utility>

namespace {

bool write_temp_and_flush(const std::filesystem::path& temp, std::string_view bytes, std::string* err)
{
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
        if (err) *err = "cannot open " + temp.string() + " for writing";
        return false;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        if (err) *err = "write failed for " + temp.string();
        return false;
    }
    return true;
}

} // namespace

namespace civ::io {

bool write_atomic(const fs::path& final_path,
                  std::string_view bytes,
                  std::string* err,
                  bool make_backup)
{
    std::error_code ec;
    if (!final_path.parent_path().empty()) {
        fs::create_directories(final_path.parent_path(), ec);
        if (ec) {
            if (err) *err = "create_directories failed: " + ec.message();
            return false;
        }
    }

    const fs::path tmp = temp_path_for(final_path);
    if (!write_temp_and_flush(tmp, bytes, err)) {
        fs::remove(tmp, ec);
        return false;
    }

    if (make_backup && fs::exists(final_path, ec)) {
        // Backup is best-effort.
        fs::copy_file(final_path, default_backup_path(final_path),
                      fs::copy_options::overwrite_existing, ec);
    }

    // rename() replaces an existing destination atomically on POSIX and uses
    // MoveFileEx with MOVEFILE_REPLACE_EXISTING on Windows.
    fs::rename(tmp, final_path, ec);
    if (ec) {
        if (err) *err = "rename failed: " + ec.message();
        std::error_code rec;
        fs::remove(tmp, rec);
        return false;
    }
    return true;
}

bool read_all(const fs::path& p, std::string& out, std::string* err)
{
    std::ifstream in(p, std::ios::binary);
    if (!in) { if (err) *err = "cannot open " + p.string(); return false; }
    in.seekg(0, std::ios::end);
    const auto sz = in.tellg();
    if (sz < 0) { if (err) *err = "cannot size " + p.string(); return false; }
    in.seekg(0, std::ios::beg);
    std::string buf(static_cast<size_t>(sz), '\0');
    if (sz > 0) in.read(buf.data(), sz);
    if (!in) { if (err) *err = "read failed for " + p.string(); return false; }
    out = std::move(buf);
    return true;
}

} // namespace civ::io
