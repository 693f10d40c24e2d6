#include "Config.h"

#include "io/AtomicFile.h"

#include <charconv>
#include <cctype>
#include <cmath>
#include <sstream>
#include <string_view>
#include <system_error>

#include <spdlog/spdlog.h>

namespace civ::core {

static std::filesystem::path Path(const std::filesystem::path& dir) {
    return dir / "config.ini";
}

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

static bool ParseInt(std::string_view sv, int& out) noexcept
{
    int v = 0;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end)
        return false;

    out = v;
    return true;
}

static bool ParseDouble(std::string_view sv, double& out) noexcept
{
    double v = 0.0;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end || !std::isfinite(v))
        return false;

    out = v;
    return true;
}

// Tiny INI-style parser: key=value lines
bool LoadConfig(Config& cfg, const std::filesystem::path& dir)
{
    const auto path = Path(dir);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false; // first run

    std::string text;
    std::string err;
    if (!io::read_all(path, text, &err))
    {
        spdlog::warn("LoadConfig: failed to read {} ({})", path.string(), err);
        return false;
    }

    // Tolerate a UTF-8 BOM from Windows editors.
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0)
        text.erase(0, 3);

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line))
    {
        // Comments / empty
        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';') continue;

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);

        // Strip trailing inline comments, e.g.:
        //   tickSeconds=1.0   # seconds
        //   saveDir=saves     ; relative to cwd
        {
            const std::size_t hashPos = v.find('#');
            const std::size_t semiPos = v.find(';');
            std::size_t cut = std::string::npos;
            if (hashPos != std::string::npos) cut = hashPos;
            if (semiPos != std::string::npos && (cut == std::string::npos || semiPos < cut)) cut = semiPos;

            if (cut != std::string::npos)
            {
                v.erase(cut);
                TrimInPlace(v);
            }
        }

        if (k.empty()) continue;

        if (k == "tickSeconds")
        {
            double parsed = 0.0;
            if (ParseDouble(v, parsed) && parsed > 0.0)
                cfg.tickSeconds = parsed;
            else
                spdlog::warn("LoadConfig: ignoring tickSeconds={}", v);
        }
        else if (k == "maxCatchUpTicks")
        {
            int parsed = 0;
            if (ParseInt(v, parsed) && parsed >= 1)
                cfg.maxCatchUpTicks = parsed;
            else
                spdlog::warn("LoadConfig: ignoring maxCatchUpTicks={}", v);
        }
        else if (k == "refreshSeconds")
        {
            double parsed = 0.0;
            if (ParseDouble(v, parsed) && parsed > 0.0)
                cfg.refreshSeconds = parsed;
            else
                spdlog::warn("LoadConfig: ignoring refreshSeconds={}", v);
        }
        else if (k == "researchRate")
        {
            double parsed = 0.0;
            if (ParseDouble(v, parsed) && parsed >= 0.0)
                cfg.researchRate = parsed;
            else
                spdlog::warn("LoadConfig: ignoring researchRate={}", v);
        }
        else if (k == "saveDir")
        {
            if (!v.empty())
                cfg.saveDir = v;
        }
        else if (k == "logDir")
        {
            if (!v.empty())
                cfg.logDir = v;
        }
        else
        {
            spdlog::debug("LoadConfig: unknown key '{}'", k);
        }
    }

    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& dir)
{
    std::ostringstream oss;
    oss << "# CivIdle settings\n";
    oss << "tickSeconds="     << cfg.tickSeconds     << "\n";
    oss << "maxCatchUpTicks=" << cfg.maxCatchUpTicks << "\n";
    oss << "refreshSeconds="  << cfg.refreshSeconds  << "\n";
    oss << "researchRate="    << cfg.researchRate    << "\n";
    oss << "saveDir="         << cfg.saveDir         << "\n";
    oss << "logDir="          << cfg.logDir          << "\n";

    const auto path = Path(dir);
    std::string err;
    if (!io::write_atomic(path, oss.str(), &err))
    {
        spdlog::error("SaveConfig: write failed for {} ({})", path.string(), err);
        return false;
    }
    return true;
}

} // namespace civ::core
