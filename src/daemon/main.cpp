#include <QCoreApplication>
#include <QDebug>

#include <nlohmann/json.hpp>

#include "archive/archive.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "daemon/retention_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("valgkronikk-daemon"));
    qInfo() << "valgkronikk retention daemon starting...";

    bool trace = qEnvironmentVariableIntValue("VALGKRONIKK_TRACE") == 1;
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            trace = true;
        }
    }
    valgkronikk::logging::initLogging(QStringLiteral("valgkronikk-daemon"), trace);
    VKLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("environment_config"),
               valgkronikk::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    std::unique_ptr<valgkronikk::Archive> archive;
    try {
        archive = valgkronikk::Archive::open(valgkronikk::ArchiveConfig::fromEnvironment());
    } catch (const valgkronikk::ArchiveError &ex) {
        VKLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("daemon_start_failed"),
                    QStringLiteral("config_error"),
                    QStringLiteral("exit"),
                    valgkronikk::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
        qCritical() << "valgkronikk: cannot open archive:" << ex.what();
        return 1;
    }

    // The daemon lives for the lifetime of the process.
    valgkronikk::RetentionDaemon daemon(*archive);
    daemon.start();

    return app.exec();
}
