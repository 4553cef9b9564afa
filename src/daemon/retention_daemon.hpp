#pragma once

#include <memory>

#include <QObject>

#include "archive/archive.hpp"

namespace valgkronikk {

/**
 * RetentionDaemon is the scheduler for the archive's retention sweep:
 * - one sweep when started
 * - one sweep per interval afterwards (daily by default)
 * - the time of the last completed sweep is kept in the store's meta table
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 * A failed sweep is logged and retried on the next tick.
 */
class RetentionDaemon : public QObject
{
    Q_OBJECT
public:
    explicit RetentionDaemon(Archive &archive, QObject *parent = nullptr);
    ~RetentionDaemon() override;

    void setIntervalMs(int intervalMs);
    int intervalMs() const;

    // Call this after constructing the daemon to set up the timer and run
    // the first sweep.
    void start();

    bool sweepEnabled() const;
    int consecutiveFailures() const;

signals:
    void sweepFinished(int deleted, int failures);
    void sweepFailed(const QString &message);

public slots:
    void runSweepCycle();

private:
    Archive &m_archive;
    int m_intervalMs;
    bool m_sweepEnabled = true;
    int m_consecutiveFailures = 0;
};

} // namespace valgkronikk
