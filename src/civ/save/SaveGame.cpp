// src/civ/save/SaveGame.cpp
#include "civ/save/SaveGame.hpp"

#include "io/AtomicFile.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <unordered_set>

namespace civ::save {
using json = nlohmann::json;

// ---------- helpers ----------

static json collect_extras(const json& obj,
                           std::initializer_list<const char*> known)
{
    json extras = json::object();
    if (!obj.is_object()) return extras;

    std::unordered_set<std::string> known_set;
    known_set.reserve(known.size());
    for (auto* k : known) known_set.emplace(k);

    for (const auto& [k, v] : obj.items()) {
        if (!known_set.count(k)) extras[k] = v;
    }
    return extras;
}

static void merge_extras(json& dst, const json& extras)
{
    if (!dst.is_object() || !extras.is_object()) return;
    for (const auto& [k, v] : extras.items()) {
        // Do not overwrite known fields; only add missing ones.
        if (!dst.contains(k)) { dst[k] = v; }
    }
}

const char* SaveErrorCodeName(SaveError::Code code) noexcept
{
    switch (code) {
    case SaveError::Code::IoOpenFail:      return "IoOpenFail";
    case SaveError::Code::IoWriteFail:     return "IoWriteFail";
    case SaveError::Code::JsonParseError:  return "JsonParseError";
    case SaveError::Code::JsonTypeError:   return "JsonTypeError";
    case SaveError::Code::MissingField:    return "MissingField";
    case SaveError::Code::InvalidValue:    return "InvalidValue";
    case SaveError::Code::MigrationFailed: return "MigrationFailed";
    }
    return "?";
}

// ---------- WorkerRecord ----------
void to_json(json& j, const WorkerRecord& v) {
    j = json::object({
        {"count",      v.count},
        {"assignment", v.assignment}
    });
    merge_extras(j, v.extras);
}
void from_json(const json& j, WorkerRecord& v) {
    v.count      = j.value("count", 0);
    v.assignment = j.value("assignment", std::map<std::string, int>{});
    v.extras     = collect_extras(j, {"count", "assignment"});
}

// ---------- EventRecord ----------
void to_json(json& j, const EventRecord& v) {
    j = json::object({
        {"tick",      v.tick},
        {"timestamp", v.timestamp},
        {"type",      v.type},
        {"message",   v.message}
    });
}
void from_json(const json& j, EventRecord& v) {
    v.tick      = j.value("tick", std::uint64_t{0});
    v.timestamp = j.value("timestamp", std::int64_t{0});
    v.type      = j.value("type", std::string{});
    v.message   = j.value("message", std::string{});
}

// ---------- StatsRecord ----------
void to_json(json& j, const StatsRecord& v) {
    j = json::object({
        {"events",             v.events},
        {"resources_gathered", v.resources_gathered},
        {"buildings_built",    v.buildings_built},
        {"workers_recruited",  v.workers_recruited},
        {"ages_reached",       v.ages_reached},
        {"start_time",         v.start_time}
    });
    merge_extras(j, v.extras);
}
void from_json(const json& j, StatsRecord& v) {
    v.events             = j.value("events", std::vector<EventRecord>{});
    v.resources_gathered = j.value("resources_gathered", std::map<std::string, double>{});
    v.buildings_built    = j.value("buildings_built", std::map<std::string, int>{});
    v.workers_recruited  = j.value("workers_recruited", std::map<std::string, int>{});
    v.ages_reached       = j.value("ages_reached", std::vector<std::string>{});
    v.start_time         = j.value("start_time", std::int64_t{0});
    v.extras = collect_extras(j, {"events", "resources_gathered", "buildings_built",
                                  "workers_recruited", "ages_reached", "start_time"});
}

// ---------- ResearchRecord ----------
void to_json(json& j, const ResearchRecord& v) {
    j = json::object({
        {"current",    v.current},
        {"progress",   v.progress},
        {"researched", v.researched}
    });
    merge_extras(j, v.extras);
}
void from_json(const json& j, ResearchRecord& v) {
    v.current    = j.value("current", std::string{});
    v.progress   = j.value("progress", 0.0);
    v.researched = j.value("researched", std::vector<std::string>{});
    v.extras     = collect_extras(j, {"current", "progress", "researched"});
}

// ---------- SaveGame ----------
void to_json(json& j, const SaveGame& v) {
    j = json::object({
        {"schema_version", v.schema_version},
        {"timestamp",      v.timestamp},
        {"tick",           v.tick},
        {"age",            v.age},
        {"resources",      v.resources},
        {"buildings",      v.buildings},
        {"villagers",      v.villagers}
    });
    if (v.stats)               j["stats"] = *v.stats;
    if (v.research)            j["research"] = *v.research;
    if (v.last_update_unix_ms) j["last_update_unix_ms"] = *v.last_update_unix_ms;
    merge_extras(j, v.extras);
}
void from_json(const json& j, SaveGame& v) {
    v.schema_version = j.value("schema_version", kSchemaVersion);
    v.timestamp      = j.value("timestamp", std::string{});
    v.tick           = j.value("tick", std::uint64_t{0});

    // Mandatory: at() throws out_of_range when missing.
    v.age       = j.at("age").get<std::string>();
    v.resources = j.at("resources").get<std::map<std::string, double>>();

    v.buildings = j.value("buildings", std::map<std::string, int>{});
    v.villagers = j.value("villagers", std::map<std::string, WorkerRecord>{});

    v.stats.reset();
    if (j.contains("stats") && j["stats"].is_object())
        v.stats = j["stats"].get<StatsRecord>();

    v.research.reset();
    if (j.contains("research") && j["research"].is_object())
        v.research = j["research"].get<ResearchRecord>();

    v.last_update_unix_ms.reset();
    if (j.contains("last_update_unix_ms") && j["last_update_unix_ms"].is_number_integer())
        v.last_update_unix_ms = j["last_update_unix_ms"].get<std::int64_t>();

    v.extras = collect_extras(j, {
        "schema_version", "timestamp", "tick", "age", "resources", "buildings",
        "villagers", "stats", "research", "last_update_unix_ms"
    });
}

// ---------- Migration (JSON-level) ----------

static void rename_key(json& obj, const char* from, const char* to)
{
    if (!obj.contains(from)) return;
    if (!obj.contains(to) && !obj[from].is_null()) obj[to] = obj[from];
    obj.erase(from);
}

static bool read_digits(std::string_view s, std::size_t pos, std::size_t len, int& out)
{
    if (pos + len > s.size()) return false;
    for (std::size_t i = pos; i < pos + len; ++i)
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    std::from_chars(s.data() + pos, s.data() + pos + len, out);
    return true;
}

// "YYYY-MM-DDTHH:MM:SS[.frac](Z|+hh:mm|-hh:mm)" to unix seconds.
bool ParseRfc3339(std::string_view s, std::int64_t& outUnix)
{
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    if (!read_digits(s, 0, 4, y) || !read_digits(s, 5, 2, mo) || !read_digits(s, 8, 2, d) ||
        !read_digits(s, 11, 2, h) || !read_digits(s, 14, 2, mi) || !read_digits(s, 17, 2, sec))
        return false;
    if (s[4] != '-' || s[7] != '-' || (s[10] != 'T' && s[10] != 't') || s[13] != ':' || s[16] != ':')
        return false;
    if (h > 23 || mi > 59 || sec > 60)
        return false;

    std::size_t pos = 19;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        const std::size_t digits = pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
        if (pos == digits) return false;
    }
    if (pos >= s.size()) return false;

    int offset = 0;
    if (s[pos] == 'Z' || s[pos] == 'z') {
        ++pos;
    } else if (s[pos] == '+' || s[pos] == '-') {
        int oh = 0, om = 0;
        if (!read_digits(s, pos + 1, 2, oh) || pos + 3 >= s.size() || s[pos + 3] != ':' ||
            !read_digits(s, pos + 4, 2, om) || oh > 23 || om > 59)
            return false;
        offset = (oh * 60 + om) * 60;
        if (s[pos] == '-') offset = -offset;
        pos += 6;
    } else {
        return false;
    }
    if (pos != s.size()) return false;

    const std::chrono::year_month_day date{std::chrono::year{y}, std::chrono::month(static_cast<unsigned>(mo)),
                                           std::chrono::day(static_cast<unsigned>(d))};
    if (!date.ok()) return false;

    const auto days = std::chrono::sys_days{date}.time_since_epoch();
    outUnix = std::chrono::duration_cast<std::chrono::seconds>(days).count()
            + h * 3600 + mi * 60 + sec - offset;
    return true;
}

static bool convert_time(json& obj, const char* key, std::string& outError)
{
    if (!obj.contains(key) || !obj[key].is_string()) return true;
    const std::string text = obj[key].get<std::string>();
    std::int64_t unixSeconds = 0;
    if (!ParseRfc3339(text, unixSeconds)) {
        outError = std::string("Unreadable \"") + key + "\" time: " + text;
        return false;
    }
    obj[key] = unixSeconds;
    return true;
}

// v0 is the original layout: no schema_version, capitalised worker fields,
// camelCase stats keys and RFC 3339 time strings.
static bool MigrateV0Stats(json& stats, std::string& outError)
{
    rename_key(stats, "resourcesGathered",  "resources_gathered");
    rename_key(stats, "buildingsBuilt",     "buildings_built");
    rename_key(stats, "villagersRecruited", "workers_recruited");
    rename_key(stats, "agesReached",        "ages_reached");
    rename_key(stats, "startTime",          "start_time");
    if (!convert_time(stats, "start_time", outError))
        return false;

    if (stats.contains("events") && stats["events"].is_null())
        stats.erase("events");
    if (stats.contains("events") && stats["events"].is_array()) {
        for (auto& e : stats["events"]) {
            if (!e.is_object()) continue;
            rename_key(e, "eventType", "type");
            if (!convert_time(e, "timestamp", outError))
                return false;
        }
    }
    return true;
}

bool MigrateJsonInPlace(json& j, int target_schema_version, std::string& outError)
{
    try {
        int file_ver = j.value("schema_version", 0);
        while (file_ver < target_schema_version) {
            if (file_ver == 0) {
                if (j.contains("villagers") && j["villagers"].is_object()) {
                    for (auto& [type, w] : j["villagers"].items()) {
                        if (!w.is_object()) continue;
                        rename_key(w, "Count", "count");
                        rename_key(w, "Assignment", "assignment");
                    }
                }
                if (j.contains("stats") && j["stats"].is_object()) {
                    if (!MigrateV0Stats(j["stats"], outError))
                        return false;
                }
                // Wall-clock catch-up restarts from load time.
                j.erase("lastUpdateTime");
                file_ver = 1;
                j["schema_version"] = file_ver;
            } else {
                outError = "No migration path for schema_version=" + std::to_string(file_ver);
                return false;
            }
        }
        if (file_ver > target_schema_version) {
            outError = "Save is newer than this build (schema_version=" + std::to_string(file_ver) + ")";
            return false;
        }
        return true;
    } catch (const json::exception& e) {
        outError = e.what();
        return false;
    }
}

// ---------- I/O ----------

std::string NowUtcIso8601()
{
    using clock = std::chrono::system_clock;
    auto t = clock::now();
    std::time_t tt = clock::to_time_t(t);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

static bool Fail(SaveError* outError, SaveError::Code code, std::string message)
{
    if (outError) *outError = SaveError{ code, std::move(message) };
    return false;
}

// Shape checks that from_json cannot express.
static bool ValidateDocument(const json& doc, SaveError* outError)
{
    if (!doc.is_object())
        return Fail(outError, SaveError::Code::JsonTypeError, "Root JSON must be an object");

    if (!doc.contains("age"))
        return Fail(outError, SaveError::Code::MissingField, "Save is missing \"age\"");
    if (!doc["age"].is_string() || doc["age"].get<std::string>().empty())
        return Fail(outError, SaveError::Code::InvalidValue, "\"age\" must be a non-empty string");

    if (!doc.contains("resources"))
        return Fail(outError, SaveError::Code::MissingField, "Save is missing \"resources\"");
    if (!doc["resources"].is_object())
        return Fail(outError, SaveError::Code::JsonTypeError, "\"resources\" must be an object");

    if (doc.contains("tick") && !doc["tick"].is_number_unsigned())
        return Fail(outError, SaveError::Code::InvalidValue, "\"tick\" must be a non-negative integer");

    return true;
}

bool ParseSaveGame(std::string_view text, SaveGame& out, SaveError* outError)
{
    try {
        json doc = json::parse(text.begin(), text.end()); // throws on malformed JSON

        if (!ValidateDocument(doc, outError))
            return false;

        std::string migErr;
        if (!MigrateJsonInPlace(doc, kSchemaVersion, migErr))
            return Fail(outError, SaveError::Code::MigrationFailed, migErr);

        out = doc.get<SaveGame>(); // uses from_json() for each type
        return true;
    }
    catch (const json::parse_error& e) {
        return Fail(outError, SaveError::Code::JsonParseError, e.what());
    }
    catch (const json::type_error& e) {
        return Fail(outError, SaveError::Code::JsonTypeError, e.what());
    }
    catch (const json::out_of_range& e) {
        return Fail(outError, SaveError::Code::MissingField, e.what());
    }
}

bool LoadSaveGame(const std::filesystem::path& file, SaveGame& out, SaveError* outError)
{
    std::string text;
    std::string ioErr;
    if (!io::read_all(file, text, &ioErr))
        return Fail(outError, SaveError::Code::IoOpenFail, "Cannot open file: " + file.string() + " (" + ioErr + ")");

    return ParseSaveGame(text, out, outError);
}

bool SaveSaveGame(const SaveGame& save, const std::filesystem::path& file, SaveError* outError)
{
    std::string text;
    try {
        text = json(save).dump(2);
    }
    catch (const json::type_error& e) {
        // dump() throws on invalid UTF-8 in any string.
        return Fail(outError, SaveError::Code::JsonTypeError, e.what());
    }

    std::string ioErr;
    if (!io::write_atomic(file, text, &ioErr, /*make_backup=*/true))
        return Fail(outError, SaveError::Code::IoWriteFail, ioErr);
    return true;
}

// ---------- save slots ----------

bool IsValidSaveName(std::string_view name) noexcept
{
    if (name.empty() || name.size() > 64 || name.front() == '.')
        return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        const auto u = static_cast<unsigned char>(c);
        return std::isalnum(u) != 0 || c == '_' || c == '-' || c == '.';
    });
}

std::filesystem::path SavePathFor(const std::filesystem::path& dir, std::string_view name)
{
    return dir / (std::string(name) + ".json");
}

std::vector<std::string> ListSaves(const std::filesystem::path& dir)
{
    std::vector<std::string> names;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec))
        return names;

    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        const auto& p = entry.path();
        if (p.extension() != ".json") continue;
        names.push_back(p.stem().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace civ::save
