#pragma once

#include <chrono>
#include <map>
#include <set>
#include <utility>

#include <nlohmann/json.hpp>

#include "archive/snapshot_store.hpp"
#include "common/models.hpp"

namespace valgkronikk {

struct RetentionPolicy {
    // Months (1-12, UTC) during which the active windows apply.
    std::set<int> activeMonths;
    std::map<std::pair<EntityLevel, RetentionPeriod>, RetentionRule> rules;
    int sweepThreads = 4;

    // September and October active; nation 365/all, county 180/latest,
    // municipality 90/latest, district 30/latest.
    static RetentionPolicy defaults();

    // {"activeMonths": [9, 10], "retention": {"active": {...}, "quiet": {...}},
    //  "sweepThreads": 4}. Rule values are a day count, "all" or "latest".
    // The retention table must be complete. Throws ConfigError.
    static RetentionPolicy fromJson(const nlohmann::json &document);

    // Throws ConfigError on a missing (level, period) rule, a non-positive
    // window, a month outside 1-12 or a thread count below one.
    void validate() const;

    RetentionPeriod classify(std::chrono::system_clock::time_point now) const;
    RetentionRule ruleFor(EntityLevel level, RetentionPeriod period) const;
};

// RetentionEnforcer applies the retention policy to every tracked entity.
// It keeps no state between sweeps; running the same sweep twice deletes
// nothing the second time.
class RetentionEnforcer {
public:
    RetentionEnforcer(SnapshotStore &store, RetentionPolicy policy);

    SweepResult sweep(std::chrono::system_clock::time_point now);

    const RetentionPolicy &policy() const;

private:
    SnapshotStore &m_store;
    RetentionPolicy m_policy;
};

} // namespace valgkronikk
