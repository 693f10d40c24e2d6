#pragma once
// include/civ/save/SaveGame.hpp
//
// Versioned, forward-compatible settlement snapshot + I/O.
// Uses nlohmann::json for (de)serialization.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace civ::save {

using json = nlohmann::json;

inline constexpr std::int32_t kSchemaVersion = 1;

struct SaveError {
    enum class Code {
        IoOpenFail,
        IoWriteFail,
        JsonParseError,
        JsonTypeError,
        MissingField,
        InvalidValue,
        MigrationFailed
    } code{};
    std::string message;
};

[[nodiscard]] const char* SaveErrorCodeName(SaveError::Code code) noexcept;

struct WorkerRecord {
    int count{0};
    std::map<std::string, int> assignment; // includes "idle"

    json extras = json::object();
};

struct EventRecord {
    std::uint64_t tick{0};
    std::int64_t  timestamp{0}; // unix seconds
    std::string   type;
    std::string   message;
};

struct StatsRecord {
    std::vector<EventRecord>      events;
    std::map<std::string, double> resources_gathered;
    std::map<std::string, int>    buildings_built;
    std::map<std::string, int>    workers_recruited;
    std::vector<std::string>      ages_reached;
    std::int64_t                  start_time{0}; // unix seconds

    json extras = json::object();
};

struct ResearchRecord {
    std::string              current;  // empty when idle
    double                   progress{0.0};
    std::vector<std::string> researched;

    json extras = json::object();
};

struct SaveGame {
    // Bump this when the layout changes (and add a migration step).
    std::int32_t schema_version{kSchemaVersion};

    std::string   timestamp; // ISO-8601 UTC
    std::uint64_t tick{0};
    std::string   age;

    std::map<std::string, double>       resources;
    std::map<std::string, int>          buildings;
    std::map<std::string, WorkerRecord> villagers;

    // Optional sections: absent in minimal or older files.
    std::optional<StatsRecord>    stats;
    std::optional<ResearchRecord> research;
    std::optional<std::int64_t>   last_update_unix_ms;

    // Unknown top-level fields preserved and round-tripped.
    json extras = json::object();
};

// ---------- JSON (de)serialization ----------
void to_json(json& j, const WorkerRecord& v);
void from_json(const json& j, WorkerRecord& v);

void to_json(json& j, const EventRecord& v);
void from_json(const json& j, EventRecord& v);

void to_json(json& j, const StatsRecord& v);
void from_json(const json& j, StatsRecord& v);

void to_json(json& j, const ResearchRecord& v);
void from_json(const json& j, ResearchRecord& v);

void to_json(json& j, const SaveGame& v);
void from_json(const json& j, SaveGame& v);

// ---------- I/O API ----------

// Parses and validates a save document. Rejects a missing/empty "age" or a
// missing/non-object "resources" as corrupt.
[[nodiscard]] bool ParseSaveGame(std::string_view text, SaveGame& out, SaveError* outError = nullptr);

[[nodiscard]] bool LoadSaveGame(const std::filesystem::path& file, SaveGame& out,
                                SaveError* outError = nullptr);

// Writes to a temp file then renames it over `file`; an existing save is
// first copied to "<file>.bak".
[[nodiscard]] bool SaveSaveGame(const SaveGame& save, const std::filesystem::path& file,
                                SaveError* outError = nullptr);

// Migration hook: updates raw JSON in-place from older versions to current.
bool MigrateJsonInPlace(json& j, int target_schema_version, std::string& outError);

// RFC 3339 time ("2024-01-01T00:00:00Z", fraction and numeric offset allowed)
// to unix seconds.
[[nodiscard]] bool ParseRfc3339(std::string_view text, std::int64_t& outUnix);

// ---------- save slots ----------

// Letters, digits, '_', '-' and '.', not starting with '.', at most 64 chars.
[[nodiscard]] bool IsValidSaveName(std::string_view name) noexcept;

[[nodiscard]] std::filesystem::path SavePathFor(const std::filesystem::path& dir, std::string_view name);

// Names (without ".json") of every save in dir, sorted.
[[nodiscard]] std::vector<std::string> ListSaves(const std::filesystem::path& dir);

[[nodiscard]] std::string NowUtcIso8601();

} // namespace civ::save
