#include "archive/archive.hpp"

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace valgkronikk {

Archive::Archive(EntityRegistry registry,
                 SnapshotStoreOptions storeOptions,
                 ChangeDetectorConfig detectorConfig,
                 RetentionPolicy policy)
    : m_registry(std::move(registry))
    , m_store(std::make_unique<SnapshotStore>(std::move(storeOptions),
                                              ChangeDetector(std::move(detectorConfig))))
    , m_enforcer(std::make_unique<RetentionEnforcer>(*m_store, std::move(policy)))
{
}

std::unique_ptr<Archive> Archive::open(const ArchiveConfig &config)
{
    logging::setArchiveContext(QString::fromStdString(config.dataDir),
                               QString::fromStdString(config.electionYear));
    EntityRegistry registry = config.loadRegistry();
    RetentionPolicy policy = config.loadPolicy();
    ChangeDetectorConfig detectorConfig = config.loadDetectorConfig();

    SnapshotStoreOptions options;
    options.databasePath = config.databasePath();
    options.busyTimeoutMs = config.busyTimeoutMs;

    auto archive = std::make_unique<Archive>(std::move(registry),
                                             std::move(options),
                                             std::move(detectorConfig),
                                             std::move(policy));
    VKLOG_INFO(QStringLiteral("Archive"),
               QStringLiteral("open"),
               QStringLiteral("archive_opened"),
               QStringLiteral("startup"),
               QStringLiteral("environment_config"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"database", config.databasePath()},
                               {"entities", archive->registry().size()}}));
    return archive;
}

WriteResult Archive::ingest(const Entity &entity,
                            const nlohmann::json &document,
                            std::chrono::system_clock::time_point timestamp)
{
    const std::string key = entityKey(entity);
    if (!m_registry.resolveKey(key).has_value()) {
        throw EntityNotFound("entity '" + key + "' is not registered");
    }

    logging::CorrelationScope scope(logging::newCorrelationId(QStringLiteral("ingest")));
    return m_store->writeIfChanged(entity, document, timestamp);
}

WriteResult Archive::ingest(const std::string &entityKey,
                            const nlohmann::json &document,
                            std::chrono::system_clock::time_point timestamp)
{
    const auto entity = m_registry.resolveKey(entityKey);
    if (!entity.has_value()) {
        throw EntityNotFound("entity '" + entityKey + "' is not registered");
    }
    return ingest(*entity, document, timestamp);
}

SweepResult Archive::sweepRetention(std::chrono::system_clock::time_point now)
{
    return m_enforcer->sweep(now);
}

const EntityRegistry &Archive::registry() const
{
    return m_registry;
}

SnapshotStore &Archive::store()
{
    return *m_store;
}

const SnapshotStore &Archive::store() const
{
    return *m_store;
}

const RetentionPolicy &Archive::policy() const
{
    return m_enforcer->policy();
}

} // namespace valgkronikk
