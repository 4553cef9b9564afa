#include "archive/archive_config.hpp"

#include <fstream>

#include <QDir>
#include <QString>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace valgkronikk {

namespace {

nlohmann::json readJsonFile(const std::string &path, const std::string &what)
{
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open " + what + " '" + path + "'");
    }

    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error &ex) {
        throw ConfigError(what + " '" + path + "' is not valid JSON: " + ex.what());
    }
    return document;
}

std::string defaultDataDir()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return ".local/share/valgkronikk";
    }
    return (home + QStringLiteral("/.local/share/valgkronikk")).toStdString();
}

} // namespace

ArchiveConfig ArchiveConfig::fromEnvironment()
{
    ArchiveConfig config;

    config.dataDir = qEnvironmentVariable("VALGKRONIKK_DATA_DIR").toStdString();
    if (config.dataDir.empty()) {
        config.dataDir = defaultDataDir();
    }

    config.entitiesPath = qEnvironmentVariable("VALGKRONIKK_ENTITIES").toStdString();
    if (config.entitiesPath.empty()) {
        config.entitiesPath = QDir(QString::fromStdString(config.dataDir))
                                  .filePath(QStringLiteral("config/entities.json"))
                                  .toStdString();
    }

    config.electionYear = qEnvironmentVariable("VALGKRONIKK_ELECTION_YEAR").toStdString();
    config.policyPath = qEnvironmentVariable("VALGKRONIKK_POLICY").toStdString();
    config.detectorPath = qEnvironmentVariable("VALGKRONIKK_DETECTOR").toStdString();

    if (qEnvironmentVariableIsSet("VALGKRONIKK_BUSY_TIMEOUT_MS")) {
        bool ok = false;
        const int value = qEnvironmentVariableIntValue("VALGKRONIKK_BUSY_TIMEOUT_MS", &ok);
        if (!ok || value < 0) {
            throw ConfigError("VALGKRONIKK_BUSY_TIMEOUT_MS must be a non-negative integer");
        }
        config.busyTimeoutMs = value;
    }

    return config;
}

std::string ArchiveConfig::databasePath() const
{
    return QDir(QString::fromStdString(dataDir))
        .filePath(QStringLiteral("archive.db"))
        .toStdString();
}

EntityRegistry ArchiveConfig::loadRegistry() const
{
    return EntityRegistry::loadFile(entitiesPath, electionYear);
}

RetentionPolicy ArchiveConfig::loadPolicy() const
{
    if (policyPath.empty()) {
        return RetentionPolicy::defaults();
    }
    RetentionPolicy policy = RetentionPolicy::fromJson(readJsonFile(policyPath, "retention policy"));
    VKLOG_INFO(QStringLiteral("ArchiveConfig"),
               QStringLiteral("loadPolicy"),
               QStringLiteral("policy_loaded"),
               QStringLiteral("startup"),
               QStringLiteral("json_file"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", policyPath},
                               {"activeMonths", policy.activeMonths},
                               {"sweepThreads", policy.sweepThreads}}));
    return policy;
}

ChangeDetectorConfig ArchiveConfig::loadDetectorConfig() const
{
    if (detectorPath.empty()) {
        return ChangeDetectorConfig::defaults();
    }
    return ChangeDetectorConfig::fromJson(readJsonFile(detectorPath, "change detector configuration"));
}

} // namespace valgkronikk
