#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace valgkronikk {

inline std::string formatUtc(std::chrono::system_clock::time_point timestamp,
                             const char *format)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, format);
    return out.str();
}

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    return formatUtc(timestamp, "%Y-%m-%dT%H:%M:%SZ");
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

// Snapshot file label, "YYYY-MM-DD__HHMM". Seconds are appended when the
// timestamp is not on a whole minute so labels stay unique per entity.
inline std::string snapshotLabel(std::chrono::system_clock::time_point timestamp)
{
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                             timestamp.time_since_epoch())
                             .count();
    if (seconds % 60 == 0) {
        return formatUtc(timestamp, "%Y-%m-%d__%H%M");
    }
    return formatUtc(timestamp, "%Y-%m-%d__%H%M%S");
}

// Calendar month (1-12) of a timestamp, in UTC.
inline int utcMonth(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    return tm.tm_mon + 1;
}

inline std::string toLevelString(EntityLevel level)
{
    switch (level) {
    case EntityLevel::Nation:
        return "nation";
    case EntityLevel::County:
        return "county";
    case EntityLevel::Municipality:
        return "municipality";
    case EntityLevel::District:
        return "district";
    }
    return "nation";
}

inline std::optional<EntityLevel> parseLevelString(const std::string &value)
{
    if (value == "nation") {
        return EntityLevel::Nation;
    }
    if (value == "county") {
        return EntityLevel::County;
    }
    if (value == "municipality") {
        return EntityLevel::Municipality;
    }
    if (value == "district") {
        return EntityLevel::District;
    }
    return std::nullopt;
}

inline std::string toPeriodString(RetentionPeriod period)
{
    return period == RetentionPeriod::Active ? "active" : "quiet";
}

inline std::string entityKey(EntityLevel level, const std::string &id)
{
    if (level == EntityLevel::Nation) {
        return "nation";
    }
    return toLevelString(level) + "-" + id;
}

inline std::string entityKey(const Entity &entity)
{
    return entityKey(entity.level, entity.id);
}

// Level encoded in a storage key, or nullopt for a key no level produces.
inline std::optional<EntityLevel> levelFromKey(const std::string &key)
{
    if (key == "nation") {
        return EntityLevel::Nation;
    }
    const auto dash = key.find('-');
    if (dash == std::string::npos || dash == 0 || dash + 1 == key.size()) {
        return std::nullopt;
    }
    const auto level = parseLevelString(key.substr(0, dash));
    if (!level || *level == EntityLevel::Nation) {
        return std::nullopt;
    }
    return level;
}

inline void to_json(nlohmann::json &j, const EntityLevel &level)
{
    j = toLevelString(level);
}

inline void to_json(nlohmann::json &j, const Entity &entity)
{
    j = nlohmann::json{
        {"key", entityKey(entity)},
        {"level", entity.level},
        {"id", entity.id},
        {"code", entity.code},
        {"name", entity.name},
        {"parent", entity.parentKey}
    };
}

inline void to_json(nlohmann::json &j, const Snapshot &snapshot)
{
    j = nlohmann::json{
        {"entity", snapshot.entityKey},
        {"timestamp", toIso8601Utc(snapshot.timestamp)},
        {"label", snapshotLabel(snapshot.timestamp)},
        {"content", snapshot.content}
    };
}

inline void to_json(nlohmann::json &j, const SnapshotDiff::ChangedField &field)
{
    j = nlohmann::json{{"path", field.path}, {"before", field.before}, {"after", field.after}};
}

inline void to_json(nlohmann::json &j, const SnapshotDiff &diff)
{
    j = nlohmann::json{
        {"entity", diff.entityKey},
        {"changedFields", diff.changedFields}
    };
}

inline void to_json(nlohmann::json &j, const SweepFailure &failure)
{
    j = nlohmann::json{{"entity", failure.entityKey}, {"message", failure.message}};
}

inline void to_json(nlohmann::json &j, const SweepResult &result)
{
    nlohmann::json deleted = nlohmann::json::object();
    for (const auto &entry : result.deleted) {
        deleted[toLevelString(entry.first)] = entry.second;
    }
    j = nlohmann::json{
        {"now", toIso8601Utc(result.now)},
        {"period", toPeriodString(result.period)},
        {"deleted", deleted},
        {"totalDeleted", result.totalDeleted()},
        {"entitiesSwept", result.entitiesSwept},
        {"failures", result.failures}
    };
}

} // namespace valgkronikk
