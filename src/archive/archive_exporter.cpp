#include "archive/archive_exporter.hpp"

#include <QDir>
#include <QFile>
#include <QString>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace valgkronikk {

namespace {

void writeJsonFile(const QString &path, const nlohmann::json &payload)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw ArchiveError("cannot write '" + path.toStdString() + "': "
                           + file.errorString().toStdString());
    }
    const QByteArray data = QByteArray::fromStdString(payload.dump(2));
    if (file.write(data) != data.size()) {
        throw ArchiveError("short write to '" + path.toStdString() + "'");
    }
}

void makePath(const QString &path)
{
    if (!QDir().mkpath(path)) {
        throw ArchiveError("cannot create directory '" + path.toStdString() + "'");
    }
}

} // namespace

ArchiveExporter::ArchiveExporter(const SnapshotStore &store)
    : m_store(store)
{
}

std::string ArchiveExporter::levelDirectory(EntityLevel level)
{
    switch (level) {
    case EntityLevel::Nation:
        return "nasjonalt";
    case EntityLevel::County:
        return "fylke";
    case EntityLevel::Municipality:
        return "kommune";
    case EntityLevel::District:
        return "kommune/krets";
    }
    return "nasjonalt";
}

ExportSummary ArchiveExporter::exportTo(const std::string &root) const
{
    ExportSummary summary;
    const QDir rootDir(QString::fromStdString(root));

    for (const auto &entity : m_store.trackedEntities()) {
        const QString levelDir = rootDir.filePath(QString::fromStdString(levelDirectory(entity.level)));
        const QString key = QString::fromStdString(entity.entityKey);
        const QString entityDir = QDir(levelDir).filePath(key);
        makePath(entityDir);

        for (const auto &snapshot : m_store.history(entity.entityKey)) {
            const QString file = QDir(entityDir).filePath(
                QString::fromStdString(snapshotLabel(snapshot.timestamp)) + QStringLiteral(".json"));
            writeJsonFile(file, snapshot.content);
            ++summary.snapshots;
        }

        // A missing latest means the entity was emptied since it was listed.
        if (const auto latest = m_store.latest(entity.entityKey)) {
            writeJsonFile(QDir(levelDir).filePath(key + QStringLiteral(".json")), latest->content);
        }
        ++summary.entities;
    }

    VKLOG_INFO(QStringLiteral("ArchiveExporter"),
               QStringLiteral("exportTo"),
               QStringLiteral("archive_exported"),
               QStringLiteral("user_invocation"),
               QStringLiteral("directory_tree"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"root", root},
                               {"entities", summary.entities},
                               {"snapshots", summary.snapshots}}));
    return summary;
}

} // namespace valgkronikk
