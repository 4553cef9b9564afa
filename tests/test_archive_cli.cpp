#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <sstream>

#include <nlohmann/json.hpp>

#include "cli/ArchiveCli.hpp"

namespace {

nlohmann::json result(int votes, const std::string &generated)
{
    return nlohmann::json{
        {"tidspunkt", {{"rapportGenerert", generated}}},
        {"stemmer", {{"total", votes}}}
    };
}

} // namespace

class ArchiveCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testUsageErrors();
    void testEntities();
    void testIngestLatestHistory();
    void testOutOfOrderIsArchiveError();
    void testDiff();
    void testSweepAndSweepLog();
    void testExportTree();
    void testDataDirFlag();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QString m_entitiesPath;
    int m_dataCounter = 0;

    valgkronikk::ArchiveConfig freshConfig();
    QString writeDocument(const QString &name, const nlohmann::json &document);
    int runCli(const valgkronikk::ArchiveConfig &config,
               const QStringList &args,
               std::string &out,
               std::string &err);
    void ingestThree(const valgkronikk::ArchiveConfig &config);
};

void ArchiveCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());

    m_entitiesPath = m_tempDir.filePath(QStringLiteral("entities.json"));
    QFile file(m_entitiesPath);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(R"({
        "counties": [{"code": "01", "name": "Østfold"}, {"code": "03", "name": "Oslo"}],
        "municipalities": [{"code": "3001", "county": "01", "name": "Halden"}],
        "districts": [{"code": "0001", "municipality": "3001", "name": "Sentrum"}]
    })");
}

void ArchiveCliTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

valgkronikk::ArchiveConfig ArchiveCliTests::freshConfig()
{
    valgkronikk::ArchiveConfig config;
    config.dataDir = m_tempDir.filePath(QStringLiteral("data-%1").arg(++m_dataCounter)).toStdString();
    config.entitiesPath = m_entitiesPath.toStdString();
    return config;
}

QString ArchiveCliTests::writeDocument(const QString &name, const nlohmann::json &document)
{
    const QString path = m_tempDir.filePath(name);
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(QByteArray::fromStdString(document.dump()));
    }
    return path;
}

int ArchiveCliTests::runCli(const valgkronikk::ArchiveConfig &config,
                            const QStringList &args,
                            std::string &out,
                            std::string &err)
{
    std::ostringstream outStream;
    std::ostringstream errStream;
    valgkronikk::ArchiveCli cli(config, outStream, errStream);

    QStringList fullArgs;
    fullArgs << QStringLiteral("valgkronikk-archive") << args;
    const int code = cli.run(fullArgs);

    out = outStream.str();
    err = errStream.str();
    return code;
}

void ArchiveCliTests::ingestThree(const valgkronikk::ArchiveConfig &config)
{
    const QString a = writeDocument(QStringLiteral("a.json"), result(100, "20:00"));
    const QString a2 = writeDocument(QStringLiteral("a2.json"), result(100, "20:05"));
    const QString b = writeDocument(QStringLiteral("b.json"), result(140, "20:10"));

    std::string out;
    std::string err;
    const QString entity = QStringLiteral("district-01-3001-0001");
    QCOMPARE(runCli(config, {QStringLiteral("ingest"), QStringLiteral("--entity"), entity,
                             QStringLiteral("--document"), a,
                             QStringLiteral("--at"), QStringLiteral("2025-09-08T20:00:00Z")},
                    out, err),
             0);
    QCOMPARE(nlohmann::json::parse(out).at("written").get<bool>(), true);

    QCOMPARE(runCli(config, {QStringLiteral("ingest"), QStringLiteral("--entity"), entity,
                             QStringLiteral("--document"), a2,
                             QStringLiteral("--at"), QStringLiteral("2025-09-08T20:05:00Z")},
                    out, err),
             0);
    QCOMPARE(nlohmann::json::parse(out).at("written").get<bool>(), false);

    QCOMPARE(runCli(config, {QStringLiteral("ingest"), QStringLiteral("--entity"), entity,
                             QStringLiteral("--document"), b,
                             QStringLiteral("--at"), QStringLiteral("2025-09-08T20:10:00Z")},
                    out, err),
             0);
    QCOMPARE(nlohmann::json::parse(out).at("written").get<bool>(), true);
}

void ArchiveCliTests::testUsageErrors()
{
    const auto config = freshConfig();
    std::string out;
    std::string err;

    QCOMPARE(runCli(config, {}, out, err), 1);
    QVERIFY(err.find("Usage:") != std::string::npos);

    QCOMPARE(runCli(config, {QStringLiteral("bogus")}, out, err), 1);
    QCOMPARE(runCli(config, {QStringLiteral("ingest"), QStringLiteral("--entity"),
                             QStringLiteral("county-03")},
                    out, err),
             1);
    QCOMPARE(runCli(config, {QStringLiteral("sweep"), QStringLiteral("--now"),
                             QStringLiteral("yesterday")},
                    out, err),
             1);
    QCOMPARE(runCli(config, {QStringLiteral("entities"), QStringLiteral("--level"),
                             QStringLiteral("region")},
                    out, err),
             1);
}

void ArchiveCliTests::testEntities()
{
    const auto config = freshConfig();
    std::string out;
    std::string err;

    QCOMPARE(runCli(config, {QStringLiteral("entities")}, out, err), 0);
    QCOMPARE(nlohmann::json::parse(out).size(), static_cast<std::size_t>(5));

    QCOMPARE(runCli(config, {QStringLiteral("entities"), QStringLiteral("--level"),
                             QStringLiteral("county")},
                    out, err),
             0);
    const auto counties = nlohmann::json::parse(out);
    QCOMPARE(counties.size(), static_cast<std::size_t>(2));
    QCOMPARE(QString::fromStdString(counties[1].at("key").get<std::string>()),
             QStringLiteral("county-03"));
    QCOMPARE(QString::fromStdString(counties[1].at("name").get<std::string>()),
             QStringLiteral("Oslo"));

    auto missing = config;
    missing.entitiesPath = m_tempDir.filePath(QStringLiteral("missing.json")).toStdString();
    QCOMPARE(runCli(missing, {QStringLiteral("entities")}, out, err), 2);
}

void ArchiveCliTests::testIngestLatestHistory()
{
    const auto config = freshConfig();
    ingestThree(config);

    std::string out;
    std::string err;
    QCOMPARE(runCli(config, {QStringLiteral("history"), QStringLiteral("--entity"),
                             QStringLiteral("district-01-3001-0001")},
                    out, err),
             0);
    const auto history = nlohmann::json::parse(out);
    QCOMPARE(history.size(), static_cast<std::size_t>(2));
    QCOMPARE(QString::fromStdString(history[0].at("label").get<std::string>()),
             QStringLiteral("2025-09-08__2000"));
    QCOMPARE(QString::fromStdString(history[1].at("timestamp").get<std::string>()),
             QStringLiteral("2025-09-08T20:10:00Z"));

    QCOMPARE(runCli(config, {QStringLiteral("latest"), QStringLiteral("--entity"),
                             QStringLiteral("district-01-3001-0001")},
                    out, err),
             0);
    const auto latest = nlohmann::json::parse(out);
    QCOMPARE(latest.at("content").at("stemmer").at("total").get<int>(), 140);

    QCOMPARE(runCli(config, {QStringLiteral("latest"), QStringLiteral("--entity"),
                             QStringLiteral("county-03")},
                    out, err),
             2);

    QCOMPARE(runCli(config, {QStringLiteral("ingest"), QStringLiteral("--entity"),
                             QStringLiteral("district-01-3001-0001"),
                             QStringLiteral("--document"),
                             m_tempDir.filePath(QStringLiteral("nowhere.json"))},
                    out, err),
             1);
}

void ArchiveCliTests::testOutOfOrderIsArchiveError()
{
    const auto config = freshConfig();
    ingestThree(config);

    const QString c = writeDocument(QStringLiteral("c.json"), result(999, "19:00"));
    std::string out;
    std::string err;
    QCOMPARE(runCli(config, {QStringLiteral("ingest"), QStringLiteral("--entity"),
                             QStringLiteral("district-01-3001-0001"),
                             QStringLiteral("--document"), c,
                             QStringLiteral("--at"), QStringLiteral("2025-09-08T19:00:00Z")},
                    out, err),
             2);
    QVERIFY(err.find("error:") != std::string::npos);

    QCOMPARE(runCli(config, {QStringLiteral("ingest"), QStringLiteral("--entity"),
                             QStringLiteral("district-01-3001-0042"),
                             QStringLiteral("--document"), c},
                    out, err),
             2);
}

void ArchiveCliTests::testDiff()
{
    const auto config = freshConfig();
    ingestThree(config);

    std::string out;
    std::string err;
    QCOMPARE(runCli(config, {QStringLiteral("diff"), QStringLiteral("--entity"),
                             QStringLiteral("district-01-3001-0001"),
                             QStringLiteral("--from"), QStringLiteral("2025-09-08T20:00:00Z"),
                             QStringLiteral("--to"), QStringLiteral("2025-09-08T20:10:00Z")},
                    out, err),
             0);
    const auto diff = nlohmann::json::parse(out);
    QCOMPARE(diff.at("changedFields").size(), static_cast<std::size_t>(1));
    QCOMPARE(QString::fromStdString(diff.at("changedFields")[0].at("path").get<std::string>()),
             QStringLiteral("stemmer.total"));

    QCOMPARE(runCli(config, {QStringLiteral("diff"), QStringLiteral("--entity"),
                             QStringLiteral("district-01-3001-0001"),
                             QStringLiteral("--from"), QStringLiteral("2025-09-08T20:05:00Z"),
                             QStringLiteral("--to"), QStringLiteral("2025-09-08T20:10:00Z")},
                    out, err),
             2);
}

void ArchiveCliTests::testSweepAndSweepLog()
{
    const auto config = freshConfig();
    ingestThree(config);

    std::string out;
    std::string err;
    QCOMPARE(runCli(config, {QStringLiteral("sweep"), QStringLiteral("--now"),
                             QStringLiteral("2025-12-01T03:00:00Z")},
                    out, err),
             0);
    const auto sweep = nlohmann::json::parse(out);
    QCOMPARE(QString::fromStdString(sweep.at("period").get<std::string>()), QStringLiteral("quiet"));
    QCOMPARE(sweep.at("deleted").at("district").get<int>(), 1);
    QCOMPARE(sweep.at("totalDeleted").get<int>(), 1);

    QCOMPARE(runCli(config, {QStringLiteral("sweeps"), QStringLiteral("--limit"),
                             QStringLiteral("5")},
                    out, err),
             0);
    const auto sweeps = nlohmann::json::parse(out);
    QCOMPARE(sweeps.size(), static_cast<std::size_t>(1));
    QCOMPARE(QString::fromStdString(sweeps[0].at("now").get<std::string>()),
             QStringLiteral("2025-12-01T03:00:00Z"));

    QCOMPARE(runCli(config, {QStringLiteral("sweeps"), QStringLiteral("--limit"),
                             QStringLiteral("0")},
                    out, err),
             1);
}

void ArchiveCliTests::testExportTree()
{
    const auto config = freshConfig();
    ingestThree(config);

    const QString exportDir = m_tempDir.filePath(QStringLiteral("export"));
    std::string out;
    std::string err;
    QCOMPARE(runCli(config, {QStringLiteral("export"), QStringLiteral("--out"), exportDir},
                    out, err),
             0);
    const auto summary = nlohmann::json::parse(out);
    QCOMPARE(summary.at("entities").get<int>(), 1);
    QCOMPARE(summary.at("snapshots").get<int>(), 2);

    const QString entityDir = exportDir + QStringLiteral("/kommune/krets/district-01-3001-0001");
    QVERIFY(QFile::exists(entityDir + QStringLiteral("/2025-09-08__2000.json")));
    QVERIFY(QFile::exists(entityDir + QStringLiteral("/2025-09-08__2010.json")));

    QFile latest(exportDir + QStringLiteral("/kommune/krets/district-01-3001-0001.json"));
    QVERIFY(latest.open(QIODevice::ReadOnly));
    const auto content = nlohmann::json::parse(latest.readAll().toStdString());
    QCOMPARE(content.at("stemmer").at("total").get<int>(), 140);
}

void ArchiveCliTests::testDataDirFlag()
{
    auto config = freshConfig();
    const QString other = m_tempDir.filePath(QStringLiteral("flag-data"));

    std::string out;
    std::string err;
    QCOMPARE(runCli(config, {QStringLiteral("--data-dir"), other, QStringLiteral("sweeps")},
                    out, err),
             0);
    QVERIFY(QFile::exists(other + QStringLiteral("/archive.db")));
    QVERIFY(!QFile::exists(QString::fromStdString(config.dataDir) + QStringLiteral("/archive.db")));
}

QTEST_MAIN(ArchiveCliTests)
#include "test_archive_cli.moc"
