#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "archive/archive_config.hpp"
#include "archive/change_detector.hpp"
#include "archive/entity_registry.hpp"
#include "archive/retention_enforcer.hpp"
#include "archive/snapshot_store.hpp"

namespace valgkronikk {

/**
 * Archive is the entry point used by polling workers and the scheduler:
 * - ingest() records a fetched result document for a registered entity
 * - sweepRetention() applies the retention policy to every tracked entity
 *
 * It owns the registry, the store and the enforcer and holds no other state.
 * All members are safe to call from several threads at once.
 */
class Archive {
public:
    Archive(EntityRegistry registry,
            SnapshotStoreOptions storeOptions,
            ChangeDetectorConfig detectorConfig,
            RetentionPolicy policy);

    // Loads every configured file. Throws ConfigError.
    static std::unique_ptr<Archive> open(const ArchiveConfig &config);

    // Throws EntityNotFound for an entity the registry does not know, and
    // whatever SnapshotStore::writeIfChanged throws.
    WriteResult ingest(const Entity &entity,
                       const nlohmann::json &document,
                       std::chrono::system_clock::time_point timestamp);
    WriteResult ingest(const std::string &entityKey,
                       const nlohmann::json &document,
                       std::chrono::system_clock::time_point timestamp);

    SweepResult sweepRetention(std::chrono::system_clock::time_point now);

    const EntityRegistry &registry() const;
    SnapshotStore &store();
    const SnapshotStore &store() const;
    const RetentionPolicy &policy() const;

private:
    EntityRegistry m_registry;
    std::unique_ptr<SnapshotStore> m_store;
    std::unique_ptr<RetentionEnforcer> m_enforcer;
};

} // namespace valgkronikk
