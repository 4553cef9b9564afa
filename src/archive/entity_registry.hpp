#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace valgkronikk {

// EntityRegistry holds the nation -> county -> municipality -> district
// hierarchy. It is built once at startup and only read afterwards, so it can
// be shared between threads without locking.
class EntityRegistry {
public:
    // Structured definition with "nation", "counties", "municipalities" and
    // "districts" sections. Throws ConfigError when malformed.
    static EntityRegistry fromDefinition(const nlohmann::json &definition);

    // Year-keyed entity list as written by the upstream entity scraper
    // ({"2025": {"fylke": [...], "kommune": [...], "krets": [...]}}).
    static EntityRegistry fromScrapedList(const nlohmann::json &list,
                                          const std::string &electionYear);

    // Detects the format from the document shape. electionYear is only
    // consulted for scraped lists; empty selects the newest year present.
    static EntityRegistry load(const nlohmann::json &document,
                               const std::string &electionYear = {});
    static EntityRegistry loadFile(const std::string &path,
                                   const std::string &electionYear = {});

    std::optional<Entity> resolve(EntityLevel level, const std::string &id) const;
    std::optional<Entity> resolveKey(const std::string &key) const;

    std::vector<Entity> children(const Entity &entity) const;
    std::vector<Entity> allEntities() const;
    std::vector<Entity> entitiesAt(EntityLevel level) const;

    const Entity &nation() const;
    std::size_t size() const;

private:
    EntityRegistry() = default;

    void add(Entity entity);
    void validate() const;

    // Keyed by entity key; iteration order is registration order via m_order.
    std::map<std::string, Entity> m_entities;
    std::vector<std::string> m_order;
    std::map<std::string, std::vector<std::string>> m_children;
    std::string m_nationKey;
};

} // namespace valgkronikk
