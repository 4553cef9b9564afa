#include "cli/ArchiveCli.hpp"

#include <QFile>

#include <nlohmann/json.hpp>

#include "archive/archive.hpp"
#include "archive/archive_exporter.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace valgkronikk {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitArchiveError = 2;
constexpr int kDefaultSweepLimit = 10;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  valgkronikk-archive [--data-dir DIR] [--entities PATH] [--year YEAR] COMMAND\n"
        "\n"
        "Commands:\n"
        "  entities [--level nation|county|municipality|district]\n"
        "  ingest --entity KEY --document PATH [--at ISO]\n"
        "  latest --entity KEY\n"
        "  history --entity KEY\n"
        "  diff --entity KEY --from ISO --to ISO\n"
        "  sweep [--now ISO]\n"
        "  sweeps [--limit N]\n"
        "  export --out DIR\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

// First argument that is neither a flag nor a flag's value.
QString findCommand(const QStringList &args)
{
    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg.startsWith(QStringLiteral("--"))) {
            ++i;
            continue;
        }
        return arg;
    }
    return {};
}

std::optional<nlohmann::json> readJsonFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    const QByteArray data = file.readAll();
    try {
        return nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &) {
        return std::nullopt;
    }
}

nlohmann::json snapshotHeader(const Snapshot &snapshot)
{
    return nlohmann::json{
        {"entity", snapshot.entityKey},
        {"timestamp", toIso8601Utc(snapshot.timestamp)},
        {"label", snapshotLabel(snapshot.timestamp)}
    };
}

} // namespace

ArchiveCli::ArchiveCli(ArchiveConfig config, std::ostream &out, std::ostream &err)
    : m_config(std::move(config))
    , m_out(out)
    , m_err(err)
{
}

int ArchiveCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }
    return run(args);
}

int ArchiveCli::run(const QStringList &args)
{
    const QString dataDir = getArgValue(args, QStringLiteral("--data-dir"));
    if (!dataDir.isEmpty()) {
        m_config.dataDir = dataDir.toStdString();
    }
    const QString entities = getArgValue(args, QStringLiteral("--entities"));
    if (!entities.isEmpty()) {
        m_config.entitiesPath = entities.toStdString();
    }
    const QString year = getArgValue(args, QStringLiteral("--year"));
    if (!year.isEmpty()) {
        m_config.electionYear = year.toStdString();
    }

    const QString command = findCommand(args);
    if (command.isEmpty()) {
        return usageError();
    }

    VKLOG_INFO(QStringLiteral("ArchiveCli"),
               QStringLiteral("run"),
               QStringLiteral("archive_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()},
                               {"dataDir", m_config.dataDir}}));

    try {
        if (command == QStringLiteral("entities")) {
            return runEntities(args);
        }
        if (command == QStringLiteral("ingest")) {
            return runIngest(args);
        }
        if (command == QStringLiteral("latest")) {
            return runLatest(args);
        }
        if (command == QStringLiteral("history")) {
            return runHistory(args);
        }
        if (command == QStringLiteral("diff")) {
            return runDiff(args);
        }
        if (command == QStringLiteral("sweep")) {
            return runSweep(args);
        }
        if (command == QStringLiteral("sweeps")) {
            return runSweeps(args);
        }
        if (command == QStringLiteral("export")) {
            return runExport(args);
        }
    } catch (const ArchiveError &ex) {
        VKLOG_ERROR(QStringLiteral("ArchiveCli"),
                    QStringLiteral("run"),
                    QStringLiteral("archive_cli_failed"),
                    QStringLiteral("archive_error"),
                    QStringLiteral("exit_code_2"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"command", command.toStdString()},
                                    {"error", ex.what()}}));
        m_err << "error: " << ex.what() << std::endl;
        return kExitArchiveError;
    }

    return usageError();
}

int ArchiveCli::usageError()
{
    m_err << usageText().toStdString();
    return kExitUsage;
}

int ArchiveCli::runEntities(const QStringList &args)
{
    std::optional<EntityLevel> level;
    const QString levelValue = getArgValue(args, QStringLiteral("--level"));
    if (!levelValue.isEmpty()) {
        level = parseLevelString(levelValue.toLower().toStdString());
        if (!level.has_value()) {
            m_err << "Unknown level: " << levelValue.toStdString() << std::endl;
            return kExitUsage;
        }
    }

    const EntityRegistry registry = m_config.loadRegistry();
    const auto entities = level ? registry.entitiesAt(*level) : registry.allEntities();

    m_out << nlohmann::json(entities).dump(2) << std::endl;
    return kExitOk;
}

int ArchiveCli::runIngest(const QStringList &args)
{
    const QString key = getArgValue(args, QStringLiteral("--entity"));
    const QString documentPath = getArgValue(args, QStringLiteral("--document"));
    if (key.isEmpty() || documentPath.isEmpty()) {
        return usageError();
    }

    auto timestamp = std::chrono::system_clock::now();
    const QString atValue = getArgValue(args, QStringLiteral("--at"));
    if (!atValue.isEmpty()) {
        const auto parsed = parseIso8601(atValue);
        if (!parsed.has_value()) {
            m_err << "Invalid ISO8601 timestamp." << std::endl;
            return kExitUsage;
        }
        timestamp = *parsed;
    }

    const auto document = readJsonFile(documentPath);
    if (!document.has_value()) {
        m_err << "Cannot read JSON document: " << documentPath.toStdString() << std::endl;
        return kExitUsage;
    }

    auto archive = Archive::open(m_config);
    const WriteResult result = archive->ingest(key.toStdString(), *document, timestamp);

    m_out << nlohmann::json{{"written", result.written},
                            {"snapshot", snapshotHeader(result.snapshot)}}
                 .dump(2)
          << std::endl;
    return kExitOk;
}

int ArchiveCli::runLatest(const QStringList &args)
{
    const QString key = getArgValue(args, QStringLiteral("--entity"));
    if (key.isEmpty()) {
        return usageError();
    }

    auto archive = Archive::open(m_config);
    const auto latest = archive->store().latest(key.toStdString());
    if (!latest.has_value()) {
        m_err << "No snapshot stored for " << key.toStdString() << std::endl;
        return kExitArchiveError;
    }

    m_out << nlohmann::json(*latest).dump(2) << std::endl;
    return kExitOk;
}

int ArchiveCli::runHistory(const QStringList &args)
{
    const QString key = getArgValue(args, QStringLiteral("--entity"));
    if (key.isEmpty()) {
        return usageError();
    }

    auto archive = Archive::open(m_config);
    nlohmann::json payload = nlohmann::json::array();
    for (const auto &snapshot : archive->store().history(key.toStdString())) {
        payload.push_back(snapshotHeader(snapshot));
    }

    m_out << payload.dump(2) << std::endl;
    return kExitOk;
}

int ArchiveCli::runDiff(const QStringList &args)
{
    const QString key = getArgValue(args, QStringLiteral("--entity"));
    const QString fromValue = getArgValue(args, QStringLiteral("--from"));
    const QString toValue = getArgValue(args, QStringLiteral("--to"));
    if (key.isEmpty() || fromValue.isEmpty() || toValue.isEmpty()) {
        return usageError();
    }

    const auto from = parseIso8601(fromValue);
    const auto to = parseIso8601(toValue);
    if (!from.has_value() || !to.has_value()) {
        m_err << "Invalid ISO8601 timestamp." << std::endl;
        return kExitUsage;
    }

    auto archive = Archive::open(m_config);
    const SnapshotDiff diff = archive->store().diffSnapshots(key.toStdString(), *from, *to);

    m_out << nlohmann::json(diff).dump(2) << std::endl;
    return kExitOk;
}

int ArchiveCli::runSweep(const QStringList &args)
{
    auto now = std::chrono::system_clock::now();
    const QString nowValue = getArgValue(args, QStringLiteral("--now"));
    if (!nowValue.isEmpty()) {
        const auto parsed = parseIso8601(nowValue);
        if (!parsed.has_value()) {
            m_err << "Invalid ISO8601 timestamp." << std::endl;
            return kExitUsage;
        }
        now = *parsed;
    }

    auto archive = Archive::open(m_config);
    const SweepResult result = archive->sweepRetention(now);

    m_out << nlohmann::json(result).dump(2) << std::endl;
    return result.failures.empty() ? kExitOk : kExitArchiveError;
}

int ArchiveCli::runSweeps(const QStringList &args)
{
    int limit = kDefaultSweepLimit;
    const QString limitValue = getArgValue(args, QStringLiteral("--limit"));
    if (!limitValue.isEmpty()) {
        bool ok = false;
        limit = limitValue.toInt(&ok);
        if (!ok || limit < 1) {
            m_err << "Invalid limit: " << limitValue.toStdString() << std::endl;
            return kExitUsage;
        }
    }

    auto archive = Archive::open(m_config);
    const auto sweeps = archive->store().recentSweeps(static_cast<std::size_t>(limit));

    m_out << nlohmann::json(sweeps).dump(2) << std::endl;
    return kExitOk;
}

int ArchiveCli::runExport(const QStringList &args)
{
    const QString outPath = getArgValue(args, QStringLiteral("--out"));
    if (outPath.isEmpty()) {
        return usageError();
    }

    auto archive = Archive::open(m_config);
    const ExportSummary summary = ArchiveExporter(archive->store()).exportTo(outPath.toStdString());

    m_out << nlohmann::json{{"out", outPath.toStdString()},
                            {"entities", summary.entities},
                            {"snapshots", summary.snapshots}}
                 .dump(2)
          << std::endl;
    return kExitOk;
}

std::optional<std::chrono::system_clock::time_point> ArchiveCli::parseIso8601(
    const QString &value) const
{
    const auto parsed = fromIso8601Utc(value.toStdString());
    if (parsed == std::chrono::system_clock::time_point{}) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace valgkronikk
