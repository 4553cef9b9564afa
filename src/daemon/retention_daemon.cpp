#include "daemon/retention_daemon.hpp"

#include <chrono>

#include <QDebug>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace valgkronikk {

namespace {

constexpr int kSweepIntervalMs = 24 * 60 * 60 * 1000;
constexpr int kMaxConsecutiveFailures = 3;

} // namespace

RetentionDaemon::RetentionDaemon(Archive &archive, QObject *parent)
    : QObject(parent)
    , m_archive(archive)
    , m_intervalMs(kSweepIntervalMs)
{
    std::string integrityMessage;
    if (!m_archive.store().integrityCheck(&integrityMessage)) {
        qWarning() << "valgkronikk: SQLite integrity check failed, retention disabled:"
                   << QString::fromStdString(integrityMessage);
        VKLOG_ERROR(QStringLiteral("RetentionDaemon"),
                    QStringLiteral("RetentionDaemon"),
                    QStringLiteral("integrity_check_failed"),
                    QStringLiteral("database_corrupt"),
                    QStringLiteral("retention_disabled"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"message", integrityMessage}}));
        m_sweepEnabled = false;
    }
}

RetentionDaemon::~RetentionDaemon() = default;

void RetentionDaemon::setIntervalMs(int intervalMs)
{
    m_intervalMs = intervalMs;
}

int RetentionDaemon::intervalMs() const
{
    return m_intervalMs;
}

bool RetentionDaemon::sweepEnabled() const
{
    return m_sweepEnabled;
}

int RetentionDaemon::consecutiveFailures() const
{
    return m_consecutiveFailures;
}

void RetentionDaemon::start()
{
    const auto lastSweep = m_archive.store().getMeta("last_sweep");
    VKLOG_INFO(QStringLiteral("RetentionDaemon"),
               QStringLiteral("start"),
               QStringLiteral("daemon_timer_start"),
               QStringLiteral("startup"),
               QStringLiteral("qtimer"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"intervalMs", m_intervalMs},
                               {"lastSweep", lastSweep.value_or("")}}));

    auto *timer = new QTimer(this);
    timer->setInterval(m_intervalMs);
    connect(timer, &QTimer::timeout, this, &RetentionDaemon::runSweepCycle);
    timer->start();

    runSweepCycle();
}

void RetentionDaemon::runSweepCycle()
{
    if (!m_sweepEnabled) {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    try {
        const SweepResult result = m_archive.sweepRetention(now);
        m_archive.store().setMeta("last_sweep", toIso8601Utc(now));

        if (!result.failures.empty()) {
            qWarning() << "valgkronikk: retention sweep finished with"
                       << result.failures.size() << "failed entities";
        }
        m_consecutiveFailures = 0;
        emit sweepFinished(static_cast<int>(result.totalDeleted()),
                           static_cast<int>(result.failures.size()));
    } catch (const ArchiveError &ex) {
        ++m_consecutiveFailures;
        VKLOG_WARN(QStringLiteral("RetentionDaemon"),
                   QStringLiteral("runSweepCycle"),
                   QStringLiteral("sweep_cycle_failed"),
                   QStringLiteral("archive_error"),
                   QStringLiteral("retry_next_tick"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", ex.what()},
                                   {"consecutiveFailures", m_consecutiveFailures}}));
        if (m_consecutiveFailures >= kMaxConsecutiveFailures) {
            qWarning() << "valgkronikk: retention sweep failed" << m_consecutiveFailures
                       << "times in a row:" << ex.what();
        }
        emit sweepFailed(QString::fromStdString(ex.what()));
    }
}

} // namespace valgkronikk
