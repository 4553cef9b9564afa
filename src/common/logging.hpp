#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace valgkronikk::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Archive the process works on. Once set, every line carries it under
// "archive"; an empty dataDir clears it.
void setArchiveContext(const QString &dataDir, const QString &electionYear);

// Thread-local correlation support for linking the log lines of one ingest
// or one retention sweep.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();
QString newCorrelationId(const QString &prefix);

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
// A string "entity" in the context is also written as a top-level field so the
// lines of one entity can be picked out across components.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString logsDirPath();
QString defaultProcessName();
QString defaultWho();

} // namespace valgkronikk::logging

#define VKLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::valgkronikk::logging::logEvent(::valgkronikk::logging::LogLevel::Debug, \
                                     ::valgkronikk::logging::defaultProcessName(), \
                                     (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define VKLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::valgkronikk::logging::logEvent(::valgkronikk::logging::LogLevel::Info, \
                                     ::valgkronikk::logging::defaultProcessName(), \
                                     (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define VKLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::valgkronikk::logging::logEvent(::valgkronikk::logging::LogLevel::Warn, \
                                     ::valgkronikk::logging::defaultProcessName(), \
                                     (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define VKLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::valgkronikk::logging::logEvent(::valgkronikk::logging::LogLevel::Error, \
                                     ::valgkronikk::logging::defaultProcessName(), \
                                     (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
