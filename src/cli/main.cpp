#include <QCoreApplication>

#include "cli/ArchiveCli.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    bool trace = qEnvironmentVariableIntValue("VALGKRONIKK_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    valgkronikk::logging::initLogging(QStringLiteral("valgkronikk-archive"), trace);
    VKLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("archive_cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               valgkronikk::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()}}));

    valgkronikk::ArchiveConfig config;
    try {
        config = valgkronikk::ArchiveConfig::fromEnvironment();
    } catch (const valgkronikk::ConfigError &ex) {
        std::cerr << "error: " << ex.what() << std::endl;
        return 2;
    }

    // CLI entry point: delegate to ArchiveCli for argument parsing and output.
    valgkronikk::ArchiveCli cli(config);
    return cli.run(filteredArgs);
}
