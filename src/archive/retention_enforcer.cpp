#include "archive/retention_enforcer.hpp"

#include <algorithm>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <QThreadPool>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace valgkronikk {

namespace {

constexpr EntityLevel kLevels[] = {
    EntityLevel::Nation,
    EntityLevel::County,
    EntityLevel::Municipality,
    EntityLevel::District
};

RetentionRule windowDays(int days)
{
    return RetentionRule{RetentionKind::Window, std::chrono::hours(24 * days)};
}

RetentionRule parseRule(const nlohmann::json &value, const std::string &where)
{
    if (value.is_number_integer()) {
        return windowDays(value.get<int>());
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        if (text == "all") {
            return RetentionRule{RetentionKind::KeepAll, std::chrono::hours(0)};
        }
        if (text == "latest") {
            return RetentionRule{RetentionKind::LatestOnly, std::chrono::hours(0)};
        }
    }
    throw ConfigError("retention policy: " + where
                      + " must be a day count, \"all\" or \"latest\", got " + value.dump());
}

std::string ruleName(EntityLevel level, RetentionPeriod period)
{
    return toPeriodString(period) + "." + toLevelString(level);
}

} // namespace

RetentionPolicy RetentionPolicy::defaults()
{
    RetentionPolicy policy;
    policy.activeMonths = {9, 10};

    const RetentionRule keepAll{RetentionKind::KeepAll, std::chrono::hours(0)};
    const RetentionRule latestOnly{RetentionKind::LatestOnly, std::chrono::hours(0)};

    policy.rules[{EntityLevel::Nation, RetentionPeriod::Active}] = windowDays(365);
    policy.rules[{EntityLevel::County, RetentionPeriod::Active}] = windowDays(180);
    policy.rules[{EntityLevel::Municipality, RetentionPeriod::Active}] = windowDays(90);
    policy.rules[{EntityLevel::District, RetentionPeriod::Active}] = windowDays(30);

    policy.rules[{EntityLevel::Nation, RetentionPeriod::Quiet}] = keepAll;
    policy.rules[{EntityLevel::County, RetentionPeriod::Quiet}] = latestOnly;
    policy.rules[{EntityLevel::Municipality, RetentionPeriod::Quiet}] = latestOnly;
    policy.rules[{EntityLevel::District, RetentionPeriod::Quiet}] = latestOnly;
    return policy;
}

RetentionPolicy RetentionPolicy::fromJson(const nlohmann::json &document)
{
    if (!document.is_object()) {
        throw ConfigError("retention policy must be a JSON object");
    }

    RetentionPolicy policy = defaults();
    try {
        if (document.contains("activeMonths")) {
            const auto months = document.at("activeMonths").get<std::vector<int>>();
            policy.activeMonths = std::set<int>(months.begin(), months.end());
        }
        if (document.contains("sweepThreads")) {
            policy.sweepThreads = document.at("sweepThreads").get<int>();
        }
    } catch (const nlohmann::json::exception &ex) {
        throw ConfigError(std::string("retention policy: ") + ex.what());
    }

    if (!document.contains("retention") || !document.at("retention").is_object()) {
        throw ConfigError("retention policy: missing \"retention\" table");
    }

    policy.rules.clear();
    const auto &table = document.at("retention");
    for (const RetentionPeriod period : {RetentionPeriod::Active, RetentionPeriod::Quiet}) {
        const std::string periodName = toPeriodString(period);
        if (!table.contains(periodName)) {
            continue;
        }
        const auto &section = table.at(periodName);
        if (!section.is_object()) {
            throw ConfigError("retention policy: \"" + periodName + "\" must be an object");
        }
        for (const auto &item : section.items()) {
            const auto level = parseLevelString(item.key());
            if (!level) {
                throw ConfigError("retention policy: unknown level \"" + item.key() + "\"");
            }
            policy.rules[{*level, period}] = parseRule(item.value(), ruleName(*level, period));
        }
    }

    policy.validate();
    return policy;
}

void RetentionPolicy::validate() const
{
    for (const RetentionPeriod period : {RetentionPeriod::Active, RetentionPeriod::Quiet}) {
        for (const EntityLevel level : kLevels) {
            const auto it = rules.find({level, period});
            if (it == rules.end()) {
                throw ConfigError("retention policy: no rule for " + ruleName(level, period));
            }
            if (it->second.kind == RetentionKind::Window
                && it->second.window <= std::chrono::hours(0)) {
                throw ConfigError("retention policy: window for " + ruleName(level, period)
                                  + " must be positive");
            }
        }
    }

    for (const int month : activeMonths) {
        if (month < 1 || month > 12) {
            throw ConfigError("retention policy: active month " + std::to_string(month)
                              + " is outside 1-12");
        }
    }

    if (sweepThreads < 1) {
        throw ConfigError("retention policy: sweepThreads must be at least 1");
    }
}

RetentionPeriod RetentionPolicy::classify(std::chrono::system_clock::time_point now) const
{
    return activeMonths.contains(utcMonth(now)) ? RetentionPeriod::Active
                                                : RetentionPeriod::Quiet;
}

RetentionRule RetentionPolicy::ruleFor(EntityLevel level, RetentionPeriod period) const
{
    const auto it = rules.find({level, period});
    if (it == rules.end()) {
        throw ConfigError("retention policy: no rule for " + ruleName(level, period));
    }
    return it->second;
}

RetentionEnforcer::RetentionEnforcer(SnapshotStore &store, RetentionPolicy policy)
    : m_store(store)
    , m_policy(std::move(policy))
{
    m_policy.validate();
}

const RetentionPolicy &RetentionEnforcer::policy() const
{
    return m_policy;
}

SweepResult RetentionEnforcer::sweep(std::chrono::system_clock::time_point now)
{
    const QString corrId = logging::newCorrelationId(QStringLiteral("sweep"));
    logging::CorrelationScope scope(corrId);

    SweepResult result;
    result.now = now;
    result.period = m_policy.classify(now);
    for (const EntityLevel level : kLevels) {
        result.deleted[level] = 0;
    }

    std::vector<TrackedEntity> entities;
    try {
        entities = m_store.trackedEntities();
    } catch (const ArchiveError &ex) {
        VKLOG_ERROR(QStringLiteral("RetentionEnforcer"),
                    QStringLiteral("sweep"),
                    QStringLiteral("sweep_enumeration_failed"),
                    QStringLiteral("storage_error"),
                    QStringLiteral("sweep_aborted"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
        throw StorageDeleteFailure(std::string("cannot enumerate entities to sweep: ") + ex.what());
    }

    VKLOG_INFO(QStringLiteral("RetentionEnforcer"),
               QStringLiteral("sweep"),
               QStringLiteral("sweep_start"),
               QStringLiteral("scheduled_retention"),
               QString::fromStdString(toPeriodString(result.period)),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"now", toIso8601Utc(now)},
                               {"entities", entities.size()},
                               {"threads", m_policy.sweepThreads}}));

    std::mutex resultMutex;
    QThreadPool pool;
    pool.setMaxThreadCount(m_policy.sweepThreads);

    for (const auto &entity : entities) {
        const RetentionRule rule = m_policy.ruleFor(entity.level, result.period);
        if (rule.kind == RetentionKind::KeepAll) {
            // Pool tasks already queued update the same result.
            std::lock_guard<std::mutex> lock(resultMutex);
            ++result.entitiesSwept;
            continue;
        }

        std::optional<std::chrono::system_clock::time_point> cutoff;
        if (rule.kind == RetentionKind::Window) {
            cutoff = now - rule.window;
        }

        pool.start([this, entity, cutoff, corrId, &result, &resultMutex]() {
            // Thread-local correlation ids do not follow work onto pool threads.
            logging::CorrelationScope workerScope(corrId);
            try {
                const std::size_t deleted = m_store.prune(entity.entityKey, cutoff);
                std::lock_guard<std::mutex> lock(resultMutex);
                result.deleted[entity.level] += deleted;
                ++result.entitiesSwept;
            } catch (const std::exception &ex) {
                VKLOG_WARN(QStringLiteral("RetentionEnforcer"),
                           QStringLiteral("sweep"),
                           QStringLiteral("entity_prune_failed"),
                           QStringLiteral("storage_error"),
                           QStringLiteral("recorded_in_result"),
                           logging::defaultWho(),
                           QString(),
                           (nlohmann::json{{"entity", entity.entityKey}, {"error", ex.what()}}));
                std::lock_guard<std::mutex> lock(resultMutex);
                result.failures.push_back(SweepFailure{entity.entityKey, ex.what()});
            }
        });
    }
    pool.waitForDone();

    std::sort(result.failures.begin(), result.failures.end(),
              [](const SweepFailure &a, const SweepFailure &b) {
                  return a.entityKey < b.entityKey;
              });

    try {
        m_store.recordSweep(result);
    } catch (const ArchiveError &ex) {
        VKLOG_WARN(QStringLiteral("RetentionEnforcer"),
                   QStringLiteral("sweep"),
                   QStringLiteral("sweep_log_failed"),
                   QStringLiteral("storage_error"),
                   QStringLiteral("result_returned_unrecorded"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", ex.what()}}));
    }

    VKLOG_INFO(QStringLiteral("RetentionEnforcer"),
               QStringLiteral("sweep"),
               QStringLiteral("sweep_complete"),
               QStringLiteral("scheduled_retention"),
               QString::fromStdString(toPeriodString(result.period)),
               logging::defaultWho(),
               QString(),
               nlohmann::json(result));

    return result;
}

} // namespace valgkronikk
