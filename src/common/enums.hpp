#pragma once

namespace valgkronikk {

enum class EntityLevel {
    Nation,
    County,
    Municipality,
    District
};

enum class RetentionPeriod {
    Active,
    Quiet
};

enum class RetentionKind {
    Window,
    KeepAll,
    LatestOnly
};

} // namespace valgkronikk
