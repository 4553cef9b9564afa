#pragma once

#include <chrono>
#include <iostream>
#include <optional>

#include <QString>
#include <QStringList>

#include "archive/archive_config.hpp"

namespace valgkronikk {

class ArchiveCli
{
public:
    explicit ArchiveCli(ArchiveConfig config,
                        std::ostream &out = std::cout,
                        std::ostream &err = std::cerr);

    // CLI dispatcher for archive inspection and maintenance.
    // Returns the exit code: 0 success, 1 usage error, 2 archive error.
    int run(int argc, char *argv[]);
    int run(const QStringList &args);

private:
    // Each subcommand opens the archive from m_config and prints JSON.
    int runEntities(const QStringList &args);
    int runIngest(const QStringList &args);
    int runLatest(const QStringList &args);
    int runHistory(const QStringList &args);
    int runDiff(const QStringList &args);
    int runSweep(const QStringList &args);
    int runSweeps(const QStringList &args);
    int runExport(const QStringList &args);

    int usageError();

    std::optional<std::chrono::system_clock::time_point> parseIso8601(
        const QString &value) const;

    ArchiveConfig m_config;
    std::ostream &m_out;
    std::ostream &m_err;
};

} // namespace valgkronikk
