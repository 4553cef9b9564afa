#include "archive/entity_registry.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace valgkronikk {

namespace {

constexpr const char *kDefaultNationId = "norge";
constexpr const char *kDefaultNationName = "Norge";

bool isCode(const std::string &value)
{
    if (value.empty()) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isalnum(c) != 0;
    });
}

std::string requireString(const nlohmann::json &node,
                          const char *field,
                          const std::string &context)
{
    if (!node.is_object() || !node.contains(field)) {
        throw ConfigError(context + ": missing field '" + field + "'");
    }
    const auto &value = node.at(field);
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    throw ConfigError(context + ": field '" + field + "' must be a string");
}

std::string requireCode(const nlohmann::json &node,
                        const char *field,
                        const std::string &context)
{
    const std::string code = requireString(node, field, context);
    if (!isCode(code)) {
        throw ConfigError(context + ": invalid code '" + code + "'");
    }
    return code;
}

const nlohmann::json &sectionOrEmpty(const nlohmann::json &definition, const char *name)
{
    static const nlohmann::json kEmpty = nlohmann::json::array();
    if (!definition.contains(name)) {
        return kEmpty;
    }
    const auto &section = definition.at(name);
    if (!section.is_array()) {
        throw ConfigError(std::string("entity definition: '") + name + "' must be an array");
    }
    return section;
}

// "kommune-03-0301-oslo" -> {"03", "0301"} plus name "oslo".
struct ScrapedId {
    std::vector<std::string> codes;
    std::string name;
};

ScrapedId splitScrapedId(const std::string &value,
                         const std::string &prefix,
                         std::size_t codeCount)
{
    ScrapedId result;
    if (value.rfind(prefix + "-", 0) != 0) {
        throw ConfigError("scraped entity '" + value + "' does not start with '" + prefix + "-'");
    }

    std::size_t pos = prefix.size() + 1;
    for (std::size_t i = 0; i < codeCount; ++i) {
        const auto dash = value.find('-', pos);
        const std::string code = value.substr(pos, dash == std::string::npos
                                                       ? std::string::npos
                                                       : dash - pos);
        if (!isCode(code)) {
            throw ConfigError("scraped entity '" + value + "' has an invalid code");
        }
        result.codes.push_back(code);
        if (dash == std::string::npos) {
            pos = value.size();
            break;
        }
        pos = dash + 1;
    }
    if (result.codes.size() != codeCount) {
        throw ConfigError("scraped entity '" + value + "' has too few codes");
    }
    result.name = pos < value.size() ? value.substr(pos) : std::string();
    return result;
}

std::string joinCodes(const std::vector<std::string> &codes, std::size_t count)
{
    std::string id;
    for (std::size_t i = 0; i < count && i < codes.size(); ++i) {
        if (i > 0) {
            id += "-";
        }
        id += codes[i];
    }
    return id;
}

} // namespace

void EntityRegistry::add(Entity entity)
{
    const std::string key = entityKey(entity);
    if (m_entities.count(key) > 0) {
        throw ConfigError("duplicate " + toLevelString(entity.level) + " id '" + entity.id + "'");
    }
    if (entity.level == EntityLevel::Nation) {
        if (!m_nationKey.empty()) {
            throw ConfigError("more than one nation defined");
        }
        m_nationKey = key;
    } else {
        if (m_entities.count(entity.parentKey) == 0) {
            throw ConfigError(toLevelString(entity.level) + " '" + entity.id
                              + "' references unknown parent '" + entity.parentKey + "'");
        }
        m_children[entity.parentKey].push_back(key);
    }
    m_order.push_back(key);
    m_entities.emplace(key, std::move(entity));
}

void EntityRegistry::validate() const
{
    if (m_nationKey.empty()) {
        throw ConfigError("entity definition has no nation");
    }
}

EntityRegistry EntityRegistry::fromDefinition(const nlohmann::json &definition)
{
    if (!definition.is_object()) {
        throw ConfigError("entity definition must be a JSON object");
    }

    EntityRegistry registry;

    Entity nation;
    nation.level = EntityLevel::Nation;
    nation.id = kDefaultNationId;
    nation.code = kDefaultNationId;
    nation.name = kDefaultNationName;
    if (definition.contains("nation")) {
        const auto &node = definition.at("nation");
        if (!node.is_object()) {
            throw ConfigError("entity definition: 'nation' must be an object");
        }
        nation.id = node.value("id", std::string(kDefaultNationId));
        nation.code = nation.id;
        nation.name = node.value("name", std::string(kDefaultNationName));
    }
    registry.add(nation);

    for (const auto &node : sectionOrEmpty(definition, "counties")) {
        Entity county;
        county.level = EntityLevel::County;
        county.code = requireCode(node, "code", "county");
        county.id = county.code;
        county.name = node.value("name", std::string());
        county.parentKey = "nation";
        registry.add(std::move(county));
    }

    // Municipality codes are unique nationally; remember them so districts
    // may reference a municipality by bare code.
    std::map<std::string, std::vector<std::string>> municipalityIdsByCode;
    for (const auto &node : sectionOrEmpty(definition, "municipalities")) {
        Entity municipality;
        municipality.level = EntityLevel::Municipality;
        municipality.code = requireCode(node, "code", "municipality");
        const std::string county = requireCode(node, "county", "municipality " + municipality.code);
        municipality.id = county + "-" + municipality.code;
        municipality.name = node.value("name", std::string());
        municipality.parentKey = entityKey(EntityLevel::County, county);
        municipalityIdsByCode[municipality.code].push_back(municipality.id);
        registry.add(std::move(municipality));
    }

    for (const auto &node : sectionOrEmpty(definition, "districts")) {
        Entity district;
        district.level = EntityLevel::District;
        district.code = requireCode(node, "code", "district");
        std::string parentId = requireString(node, "municipality", "district " + district.code);
        if (parentId.find('-') == std::string::npos) {
            const auto it = municipalityIdsByCode.find(parentId);
            if (it == municipalityIdsByCode.end()) {
                throw ConfigError("district '" + district.code
                                  + "' references unknown municipality '" + parentId + "'");
            }
            if (it->second.size() != 1) {
                throw ConfigError("district '" + district.code
                                  + "' references ambiguous municipality code '" + parentId + "'");
            }
            parentId = it->second.front();
        }
        district.id = parentId + "-" + district.code;
        district.name = node.value("name", std::string());
        district.parentKey = entityKey(EntityLevel::Municipality, parentId);
        registry.add(std::move(district));
    }

    registry.validate();
    return registry;
}

EntityRegistry EntityRegistry::fromScrapedList(const nlohmann::json &list,
                                               const std::string &electionYear)
{
    if (!list.is_object() || !list.contains(electionYear)) {
        throw ConfigError("scraped entity list has no year '" + electionYear + "'");
    }
    const auto &year = list.at(electionYear);
    if (!year.is_object()) {
        throw ConfigError("scraped entity list: year '" + electionYear + "' must be an object");
    }

    EntityRegistry registry;

    Entity nation;
    nation.level = EntityLevel::Nation;
    nation.id = kDefaultNationId;
    nation.code = kDefaultNationId;
    nation.name = kDefaultNationName;
    registry.add(nation);

    const auto readSection = [&year](const char *name) {
        std::vector<std::string> ids;
        if (!year.contains(name)) {
            return ids;
        }
        const auto &section = year.at(name);
        if (!section.is_array()) {
            throw ConfigError(std::string("scraped entity list: '") + name + "' must be an array");
        }
        for (const auto &item : section) {
            if (!item.is_string()) {
                throw ConfigError(std::string("scraped entity list: '") + name
                                  + "' entries must be strings");
            }
            ids.push_back(item.get<std::string>());
        }
        return ids;
    };

    for (const auto &value : readSection("fylke")) {
        const ScrapedId parsed = splitScrapedId(value, "fylke", 1);
        Entity county;
        county.level = EntityLevel::County;
        county.code = parsed.codes[0];
        county.id = county.code;
        county.name = parsed.name;
        county.parentKey = "nation";
        registry.add(std::move(county));
    }

    for (const auto &value : readSection("kommune")) {
        const ScrapedId parsed = splitScrapedId(value, "kommune", 2);
        Entity municipality;
        municipality.level = EntityLevel::Municipality;
        municipality.code = parsed.codes[1];
        municipality.id = joinCodes(parsed.codes, 2);
        municipality.name = parsed.name;
        municipality.parentKey = entityKey(EntityLevel::County, parsed.codes[0]);
        registry.add(std::move(municipality));
    }

    for (const auto &value : readSection("krets")) {
        const ScrapedId parsed = splitScrapedId(value, "krets", 3);
        Entity district;
        district.level = EntityLevel::District;
        district.code = parsed.codes[2];
        district.id = joinCodes(parsed.codes, 3);
        district.name = parsed.name;
        district.parentKey = entityKey(EntityLevel::Municipality, joinCodes(parsed.codes, 2));
        registry.add(std::move(district));
    }

    registry.validate();
    return registry;
}

EntityRegistry EntityRegistry::load(const nlohmann::json &document,
                                    const std::string &electionYear)
{
    if (!document.is_object()) {
        throw ConfigError("entity definition must be a JSON object");
    }
    if (document.contains("nation") || document.contains("counties")
        || document.contains("municipalities") || document.contains("districts")) {
        return fromDefinition(document);
    }

    std::string year = electionYear;
    if (year.empty()) {
        // std::map-backed objects iterate keys in order; the last is newest.
        for (const auto &item : document.items()) {
            year = item.key();
        }
    }
    if (year.empty()) {
        throw ConfigError("entity definition is empty");
    }
    return fromScrapedList(document, year);
}

EntityRegistry EntityRegistry::loadFile(const std::string &path,
                                        const std::string &electionYear)
{
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open entity definition '" + path + "'");
    }

    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error &ex) {
        throw ConfigError("entity definition '" + path + "' is not valid JSON: " + ex.what());
    }

    EntityRegistry registry = load(document, electionYear);
    VKLOG_INFO(QStringLiteral("EntityRegistry"),
               QStringLiteral("loadFile"),
               QStringLiteral("registry_loaded"),
               QStringLiteral("startup"),
               QStringLiteral("json_file"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", path},
                               {"entities", registry.size()},
                               {"year", electionYear}}));
    return registry;
}

std::optional<Entity> EntityRegistry::resolve(EntityLevel level, const std::string &id) const
{
    if (level == EntityLevel::Nation) {
        const auto it = m_entities.find(m_nationKey);
        if (it != m_entities.end() && (id.empty() || id == it->second.id)) {
            return it->second;
        }
        return std::nullopt;
    }
    return resolveKey(entityKey(level, id));
}

std::optional<Entity> EntityRegistry::resolveKey(const std::string &key) const
{
    const auto it = m_entities.find(key);
    if (it == m_entities.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Entity> EntityRegistry::children(const Entity &entity) const
{
    std::vector<Entity> result;
    const auto it = m_children.find(entityKey(entity));
    if (it == m_children.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (const auto &key : it->second) {
        result.push_back(m_entities.at(key));
    }
    return result;
}

std::vector<Entity> EntityRegistry::allEntities() const
{
    std::vector<Entity> result;
    result.reserve(m_order.size());
    for (const auto &key : m_order) {
        result.push_back(m_entities.at(key));
    }
    return result;
}

std::vector<Entity> EntityRegistry::entitiesAt(EntityLevel level) const
{
    std::vector<Entity> result;
    for (const auto &key : m_order) {
        const Entity &entity = m_entities.at(key);
        if (entity.level == level) {
            result.push_back(entity);
        }
    }
    return result;
}

const Entity &EntityRegistry::nation() const
{
    return m_entities.at(m_nationKey);
}

std::size_t EntityRegistry::size() const
{
    return m_entities.size();
}

} // namespace valgkronikk
