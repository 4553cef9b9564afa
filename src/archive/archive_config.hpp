#pragma once

#include <string>

#include "archive/change_detector.hpp"
#include "archive/entity_registry.hpp"
#include "archive/retention_enforcer.hpp"

namespace valgkronikk {

// Locations and tuning of one archive, read from VALGKRONIKK_* environment
// variables. Command line flags may override fields afterwards.
struct ArchiveConfig {
    std::string dataDir;
    std::string entitiesPath;
    std::string electionYear;
    // Empty means the built-in defaults.
    std::string policyPath;
    std::string detectorPath;
    int busyTimeoutMs = 5000;

    static ArchiveConfig fromEnvironment();

    std::string databasePath() const;

    EntityRegistry loadRegistry() const;
    RetentionPolicy loadPolicy() const;
    ChangeDetectorConfig loadDetectorConfig() const;
};

} // namespace valgkronikk
