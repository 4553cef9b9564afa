#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace valgkronikk {

// Which parts of an upstream result document carry information.
struct ChangeDetectorConfig {
    // Top-level fields that participate in the comparison.
    std::vector<std::string> fields;
    // Keys dropped at any depth before comparing (volatile metadata).
    std::set<std::string> ignoredKeys;
    // Repeated sub-structures, matched by key name at any depth and sorted by a
    // '/'-separated key path inside each element, e.g. "partier" -> "id/partikode".
    std::map<std::string, std::string> collectionKeys;

    // Field set of the valgresultat.no result documents.
    static ChangeDetectorConfig defaults();

    // {"fields": [...], "ignore": [...], "collections": {...}}.
    // Missing sections keep their defaults. Throws ConfigError.
    static ChangeDetectorConfig fromJson(const nlohmann::json &document);
};

class ChangeDetector {
public:
    explicit ChangeDetector(ChangeDetectorConfig config = ChangeDetectorConfig::defaults());

    // True when no previous snapshot exists or the participating fields of the
    // candidate differ from those of the previous content after normalization.
    bool hasChanged(const std::optional<Snapshot> &previous,
                    const nlohmann::json &candidate) const;

    // Participating fields only, with numbers coerced, ignored keys removed
    // and repeated sub-structures in a stable order.
    nlohmann::json normalize(const nlohmann::json &document) const;

    // Field-level differences between two documents, on normalized content.
    std::vector<SnapshotDiff::ChangedField> diff(const nlohmann::json &before,
                                                 const nlohmann::json &after) const;

    const ChangeDetectorConfig &config() const;

private:
    nlohmann::json normalizeValue(const nlohmann::json &value,
                                  const std::string &collectionKey) const;

    ChangeDetectorConfig m_config;
};

} // namespace valgkronikk
