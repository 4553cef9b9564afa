#include "archive/change_detector.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <string>

#include "common/errors.hpp"

namespace valgkronikk {

namespace {

bool looksNumeric(const std::string &value)
{
    if (value.empty()) {
        return false;
    }
    bool sawDigit = false;
    for (const char c : value) {
        if (c >= '0' && c <= '9') {
            sawDigit = true;
        } else if (c != '+' && c != '-' && c != '.' && c != 'e' && c != 'E') {
            return false;
        }
    }
    return sawDigit;
}

std::optional<double> parseNumber(const std::string &value)
{
    if (!looksNumeric(value)) {
        return std::nullopt;
    }
    errno = 0;
    char *end = nullptr;
    const double parsed = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size() || errno == ERANGE || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

nlohmann::json canonicalNumber(double value)
{
    if (value == 0.0) {
        // Folds -0.0 into 0.0.
        return nlohmann::json(0.0);
    }
    return nlohmann::json(value);
}

const nlohmann::json *findPath(const nlohmann::json &node, const std::string &path)
{
    const nlohmann::json *current = &node;
    std::size_t pos = 0;
    while (pos <= path.size()) {
        const auto slash = path.find('/', pos);
        const std::string part = path.substr(pos, slash == std::string::npos
                                                     ? std::string::npos
                                                     : slash - pos);
        if (!current->is_object() || !current->contains(part)) {
            return nullptr;
        }
        current = &current->at(part);
        if (slash == std::string::npos) {
            break;
        }
        pos = slash + 1;
    }
    return current;
}

std::string elementLabel(const nlohmann::json &element, const std::string &keyPath)
{
    const nlohmann::json *key = findPath(element, keyPath);
    if (!key) {
        return element.dump();
    }
    return key->is_string() ? key->get<std::string>() : key->dump();
}

std::string joinPath(const std::string &parent, const std::string &child)
{
    return parent.empty() ? child : parent + "." + child;
}

} // namespace

ChangeDetectorConfig ChangeDetectorConfig::defaults()
{
    ChangeDetectorConfig config;
    config.fields = {"stemmer", "partier", "opptalt", "frammote", "mandater"};
    config.ignoredKeys = {"tidspunkt", "rapportGenerert", "_links"};
    config.collectionKeys = {{"partier", "id/partikode"}};
    return config;
}

ChangeDetectorConfig ChangeDetectorConfig::fromJson(const nlohmann::json &document)
{
    if (!document.is_object()) {
        throw ConfigError("change detector configuration must be a JSON object");
    }

    ChangeDetectorConfig config = defaults();
    try {
        if (document.contains("fields")) {
            config.fields = document.at("fields").get<std::vector<std::string>>();
        }
        if (document.contains("ignore")) {
            const auto keys = document.at("ignore").get<std::vector<std::string>>();
            config.ignoredKeys = std::set<std::string>(keys.begin(), keys.end());
        }
        if (document.contains("collections")) {
            config.collectionKeys =
                document.at("collections").get<std::map<std::string, std::string>>();
        }
    } catch (const nlohmann::json::exception &ex) {
        throw ConfigError(std::string("change detector configuration: ") + ex.what());
    }

    for (const auto &entry : config.collectionKeys) {
        if (entry.first.empty() || entry.second.empty()) {
            throw ConfigError("change detector configuration: empty collection key");
        }
    }
    return config;
}

ChangeDetector::ChangeDetector(ChangeDetectorConfig config)
    : m_config(std::move(config))
{
}

const ChangeDetectorConfig &ChangeDetector::config() const
{
    return m_config;
}

nlohmann::json ChangeDetector::normalizeValue(const nlohmann::json &value,
                                              const std::string &collectionKey) const
{
    if (value.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (const auto &item : value.items()) {
            if (m_config.ignoredKeys.count(item.key()) > 0) {
                continue;
            }
            const auto it = m_config.collectionKeys.find(item.key());
            out[item.key()] = normalizeValue(
                item.value(), it == m_config.collectionKeys.end() ? std::string() : it->second);
        }
        return out;
    }

    if (value.is_array()) {
        std::vector<std::pair<std::string, nlohmann::json>> elements;
        elements.reserve(value.size());
        for (const auto &element : value) {
            nlohmann::json normalized = normalizeValue(element, std::string());
            std::string sortKey = collectionKey.empty()
                ? normalized.dump()
                : elementLabel(normalized, collectionKey);
            elements.emplace_back(std::move(sortKey), std::move(normalized));
        }
        std::stable_sort(elements.begin(), elements.end(),
                         [](const auto &a, const auto &b) {
                             if (a.first != b.first) {
                                 return a.first < b.first;
                             }
                             return a.second.dump() < b.second.dump();
                         });

        nlohmann::json out = nlohmann::json::array();
        for (auto &element : elements) {
            out.push_back(std::move(element.second));
        }
        return out;
    }

    if (value.is_number()) {
        return canonicalNumber(value.get<double>());
    }

    if (value.is_string()) {
        if (const auto number = parseNumber(value.get<std::string>())) {
            return canonicalNumber(*number);
        }
    }

    return value;
}

nlohmann::json ChangeDetector::normalize(const nlohmann::json &document) const
{
    if (!document.is_object() || m_config.fields.empty()) {
        return normalizeValue(document, std::string());
    }

    nlohmann::json out = nlohmann::json::object();
    for (const auto &field : m_config.fields) {
        if (m_config.ignoredKeys.count(field) > 0) {
            continue;
        }
        if (!document.contains(field)) {
            out[field] = nullptr;
            continue;
        }
        const auto it = m_config.collectionKeys.find(field);
        out[field] = normalizeValue(
            document.at(field), it == m_config.collectionKeys.end() ? std::string() : it->second);
    }
    return out;
}

bool ChangeDetector::hasChanged(const std::optional<Snapshot> &previous,
                                const nlohmann::json &candidate) const
{
    if (!previous.has_value()) {
        return true;
    }
    return normalize(previous->content) != normalize(candidate);
}

std::vector<SnapshotDiff::ChangedField> ChangeDetector::diff(const nlohmann::json &before,
                                                             const nlohmann::json &after) const
{
    std::vector<SnapshotDiff::ChangedField> changes;

    // Walks both normalized trees together. Collections are matched by their
    // key so a reordered party list reports per-party changes.
    const std::function<void(const std::string &, const std::string &,
                             const nlohmann::json &, const nlohmann::json &)>
        walk = [&](const std::string &path, const std::string &collectionKey,
                   const nlohmann::json &a, const nlohmann::json &b) {
            if (a == b) {
                return;
            }
            if (a.is_object() && b.is_object()) {
                std::set<std::string> keys;
                for (const auto &item : a.items()) {
                    keys.insert(item.key());
                }
                for (const auto &item : b.items()) {
                    keys.insert(item.key());
                }
                for (const auto &key : keys) {
                    const auto it = m_config.collectionKeys.find(key);
                    walk(joinPath(path, key),
                         it == m_config.collectionKeys.end() ? std::string() : it->second,
                         a.contains(key) ? a.at(key) : nlohmann::json(),
                         b.contains(key) ? b.at(key) : nlohmann::json());
                }
                return;
            }
            if (a.is_array() && b.is_array() && !collectionKey.empty()) {
                // Repeated labels become "label#2", "label#3", ... in the
                // normalized order so no element shadows another.
                const auto byLabel = [&collectionKey](const nlohmann::json &elements) {
                    std::map<std::string, nlohmann::json> out;
                    std::map<std::string, int> seen;
                    for (const auto &element : elements) {
                        std::string label = elementLabel(element, collectionKey);
                        const int occurrence = ++seen[label];
                        if (occurrence > 1) {
                            label += "#" + std::to_string(occurrence);
                        }
                        out[label] = element;
                    }
                    return out;
                };
                const auto left = byLabel(a);
                const auto right = byLabel(b);
                std::set<std::string> labels;
                for (const auto &entry : left) {
                    labels.insert(entry.first);
                }
                for (const auto &entry : right) {
                    labels.insert(entry.first);
                }
                for (const auto &label : labels) {
                    const auto l = left.find(label);
                    const auto r = right.find(label);
                    walk(path + "[" + label + "]", std::string(),
                         l == left.end() ? nlohmann::json() : l->second,
                         r == right.end() ? nlohmann::json() : r->second);
                }
                return;
            }
            changes.push_back({path, a, b});
        };

    walk(std::string(), std::string(), normalize(before), normalize(after));
    return changes;
}

} // namespace valgkronikk
