#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace valgkronikk {

struct Entity {
    EntityLevel level = EntityLevel::Nation;
    // Hyphen-joined code chain from the county down ("03-0301-0001").
    // The nation uses its own identifier ("norge").
    std::string id;
    std::string code;
    std::string name;
    // Key of the parent entity; empty for the nation.
    std::string parentKey;

    bool operator==(const Entity &other) const
    {
        return level == other.level && id == other.id;
    }
};

struct Snapshot {
    std::string entityKey;
    std::chrono::system_clock::time_point timestamp;
    nlohmann::json content;
};

struct WriteResult {
    bool written = false;
    Snapshot snapshot;
};

struct TrackedEntity {
    std::string entityKey;
    EntityLevel level = EntityLevel::Nation;
    std::chrono::system_clock::time_point latest;
};

struct SnapshotDiff {
    struct ChangedField {
        std::string path;
        nlohmann::json before;
        nlohmann::json after;
    };

    std::string entityKey;
    std::vector<ChangedField> changedFields;
};

struct RetentionRule {
    RetentionKind kind = RetentionKind::KeepAll;
    std::chrono::hours window{0};
};

struct SweepFailure {
    std::string entityKey;
    std::string message;
};

struct SweepResult {
    std::chrono::system_clock::time_point now;
    RetentionPeriod period = RetentionPeriod::Quiet;
    std::map<EntityLevel, std::size_t> deleted;
    std::vector<SweepFailure> failures;
    std::size_t entitiesSwept = 0;

    std::size_t totalDeleted() const
    {
        std::size_t total = 0;
        for (const auto &entry : deleted) {
            total += entry.second;
        }
        return total;
    }
};

} // namespace valgkronikk
