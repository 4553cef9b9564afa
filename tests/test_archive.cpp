#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QThreadPool>

#include <atomic>
#include <chrono>

#include <nlohmann/json.hpp>

#include "archive/archive.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"

namespace {

using Clock = std::chrono::system_clock;

template <typename Exception, typename Fn>
bool throwsException(Fn &&fn)
{
    try {
        fn();
    } catch (const Exception &) {
        return true;
    }
    return false;
}

Clock::time_point iso(const std::string &value)
{
    return valgkronikk::fromIso8601Utc(value);
}

nlohmann::json registryDefinition()
{
    return nlohmann::json::parse(R"({
        "counties": [{"code": "01"}, {"code": "03"}],
        "municipalities": [
            {"code": "3001", "county": "01"},
            {"code": "0301", "county": "03"}
        ],
        "districts": [
            {"code": "0001", "municipality": "3001"},
            {"code": "0002", "municipality": "3001"}
        ]
    })");
}

nlohmann::json partyResult(int a, int h, const std::string &generated)
{
    return nlohmann::json{
        {"tidspunkt", {{"rapportGenerert", generated}}},
        {"_links", {{"related", nlohmann::json::array({"/2025/st/01/3001"})}}},
        {"opptalt", {{"prosent", 100.0}}},
        {"partier", nlohmann::json::array({
            {{"id", {{"partikode", "A"}}}, {"stemmer", {{"total", a}}}},
            {{"id", {{"partikode", "H"}}}, {"stemmer", {{"total", h}}}}
        })}
    };
}

} // namespace

class ArchiveTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testDistrictIngestScenario();
    void testQuietMunicipalitySweepScenario();
    void testStrictlyIncreasingHistory();
    void testUnknownEntityRejected();
    void testConcurrentIngestAndSweep();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    int m_dbCounter = 0;

    std::unique_ptr<valgkronikk::Archive> makeArchive();
};

void ArchiveTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ArchiveTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::unique_ptr<valgkronikk::Archive> ArchiveTests::makeArchive()
{
    valgkronikk::SnapshotStoreOptions options;
    options.databasePath = m_tempDir.filePath(
        QStringLiteral("archive-%1.db").arg(++m_dbCounter)).toStdString();
    return std::make_unique<valgkronikk::Archive>(
        valgkronikk::EntityRegistry::fromDefinition(registryDefinition()),
        options,
        valgkronikk::ChangeDetectorConfig::defaults(),
        valgkronikk::RetentionPolicy::defaults());
}

void ArchiveTests::testDistrictIngestScenario()
{
    auto archive = makeArchive();
    const std::string key = "district-01-3001-0001";
    const auto t1 = iso("2025-09-08T20:00:00Z");
    const auto t2 = iso("2025-09-08T20:05:00Z");
    const auto t3 = iso("2025-09-08T20:10:00Z");

    // A, then A' (A with regenerated metadata and parties reordered), then B.
    const auto documentA = partyResult(400, 350, "2025-09-08T20:00:00Z");
    auto documentA2 = partyResult(400, 350, "2025-09-08T20:05:00Z");
    std::swap(documentA2["partier"][0], documentA2["partier"][1]);
    documentA2["_links"]["related"].push_back("/2025/st/01");
    const auto documentB = partyResult(420, 350, "2025-09-08T20:10:00Z");

    QVERIFY(archive->ingest(key, documentA, t1).written);
    const auto second = archive->ingest(key, documentA2, t2);
    QVERIFY(!second.written);
    QVERIFY(second.snapshot.timestamp == t1);
    QVERIFY(archive->ingest(key, documentB, t3).written);

    const auto history = archive->store().history(key).toVector();
    QCOMPARE(history.size(), static_cast<std::size_t>(2));
    QVERIFY(history[0].timestamp == t1);
    QVERIFY(history[1].timestamp == t3);
    QVERIFY(!archive->store().snapshotAt(key, t2).has_value());

    const auto latest = archive->store().latest(key);
    QVERIFY(latest.has_value());
    QVERIFY(latest->timestamp == t3);
    QVERIFY(latest->content == documentB);
}

void ArchiveTests::testQuietMunicipalitySweepScenario()
{
    auto archive = makeArchive();
    const auto municipality = archive->registry().resolve(valgkronikk::EntityLevel::Municipality,
                                                          "01-3001");
    QVERIFY(municipality.has_value());

    const auto t1 = iso("2025-09-08T20:00:00Z");
    const auto t2 = iso("2025-09-09T20:00:00Z");
    const auto t3 = iso("2025-09-10T20:00:00Z");
    QVERIFY(archive->ingest(*municipality, partyResult(1, 1, ""), t1).written);
    QVERIFY(archive->ingest(*municipality, partyResult(2, 1, ""), t2).written);
    QVERIFY(archive->ingest(*municipality, partyResult(3, 1, ""), t3).written);

    const auto now = iso("2025-11-15T03:00:00Z");
    const auto result = archive->sweepRetention(now);
    QVERIFY(result.period == valgkronikk::RetentionPeriod::Quiet);
    QCOMPARE(result.deleted.at(valgkronikk::EntityLevel::Municipality), static_cast<std::size_t>(2));

    const auto history = archive->store().history(*municipality).toVector();
    QCOMPARE(history.size(), static_cast<std::size_t>(1));
    QVERIFY(history.front().timestamp == t3);
    QVERIFY(archive->store().latest(*municipality)->timestamp == t3);

    QCOMPARE(archive->sweepRetention(now).totalDeleted(), static_cast<std::size_t>(0));
}

void ArchiveTests::testStrictlyIncreasingHistory()
{
    auto archive = makeArchive();
    const std::string key = "county-03";
    const auto base = iso("2025-09-08T20:00:00Z");

    for (int i = 0; i < 12; ++i) {
        // Every third ingest repeats the previous counts.
        const int votes = i - i / 3;
        archive->ingest(key, partyResult(votes, 0, ""), base + std::chrono::minutes(i));
    }
    QVERIFY(throwsException<valgkronikk::OutOfOrderTimestamp>([&archive, &key, base]() {
        archive->ingest(key, partyResult(999, 0, ""), base + std::chrono::minutes(3));
    }));

    const auto history = archive->store().history(key).toVector();
    QVERIFY(history.size() > 1);
    for (std::size_t i = 1; i < history.size(); ++i) {
        QVERIFY(history[i - 1].timestamp < history[i].timestamp);
    }
}

void ArchiveTests::testUnknownEntityRejected()
{
    auto archive = makeArchive();

    QVERIFY(throwsException<valgkronikk::EntityNotFound>([&archive]() {
        archive->ingest("district-01-3001-0099", nlohmann::json::object(),
                        iso("2025-09-08T20:00:00Z"));
    }));

    valgkronikk::Entity stranger;
    stranger.level = valgkronikk::EntityLevel::County;
    stranger.id = "50";
    QVERIFY(throwsException<valgkronikk::EntityNotFound>([&archive, &stranger]() {
        archive->ingest(stranger, nlohmann::json::object(), iso("2025-09-08T20:00:00Z"));
    }));

    QVERIFY(archive->store().trackedEntities().empty());
}

void ArchiveTests::testConcurrentIngestAndSweep()
{
    auto archive = makeArchive();
    const auto base = iso("2025-10-20T08:00:00Z");
    const auto entities = archive->registry().allEntities();
    constexpr int kRounds = 10;
    std::atomic<int> errors{0};

    QThreadPool pool;
    pool.setMaxThreadCount(4);
    for (const auto &entity : entities) {
        pool.start([&archive, &errors, entity, base]() {
            for (int i = 0; i < kRounds; ++i) {
                try {
                    archive->ingest(entity, partyResult(i, 0, ""), base + std::chrono::hours(i));
                } catch (const valgkronikk::ArchiveError &) {
                    ++errors;
                }
            }
        });
    }
    pool.start([&archive, &errors, base]() {
        for (int i = 0; i < 3; ++i) {
            const auto result = archive->sweepRetention(base + std::chrono::hours(i));
            errors += static_cast<int>(result.failures.size());
        }
    });
    pool.waitForDone();

    QCOMPARE(errors.load(), 0);
    for (const auto &entity : entities) {
        const auto latest = archive->store().latest(entity);
        QVERIFY(latest.has_value());
        QVERIFY(latest->timestamp == base + std::chrono::hours(kRounds - 1));
    }
}

QTEST_MAIN(ArchiveTests)
#include "test_archive.moc"
