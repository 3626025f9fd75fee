/**
 * @file Entity.cpp
 * @brief Implementation of Entity merge primitives.
 */

#include "domain/Entity.hpp"
#include <algorithm>
#include <cctype>

namespace casegraph::domain {

namespace {

std::string Lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string Token(const std::string& value) {
    std::string out;
    for (char ch : value) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

} // namespace

std::string EntityTypeToString(EntityType type) {
    switch (type) {
        case EntityType::Person: return "person";
        case EntityType::Organization: return "organization";
        case EntityType::Location: return "location";
        case EntityType::TemporalMarker: return "temporal";
        case EntityType::Asset: return "asset";
    }
    return "person";
}

std::optional<EntityType> EntityTypeFromString(const std::string& value) {
    std::string t = Token(value);
    if (t == "person" || t == "people" || t == "individual") return EntityType::Person;
    if (t == "organization" || t == "organisation" || t == "org" || t == "court" || t == "company") {
        return EntityType::Organization;
    }
    if (t == "location" || t == "place" || t == "spatial") return EntityType::Location;
    if (t == "temporal" || t == "temporalmarker" || t == "date" || t == "time") return EntityType::TemporalMarker;
    if (t == "asset" || t == "object" || t == "property") return EntityType::Asset;
    return std::nullopt;
}

std::string StateTiePolicyToString(StateTiePolicy policy) {
    return policy == StateTiePolicy::HigherConfidence ? "higher_confidence" : "extraction_order";
}

std::optional<StateTiePolicy> StateTiePolicyFromString(const std::string& value) {
    std::string t = Token(value);
    if (t == "extractionorder") return StateTiePolicy::ExtractionOrder;
    if (t == "higherconfidence") return StateTiePolicy::HigherConfidence;
    return std::nullopt;
}

std::string NormalizeAlias(const std::string& alias) {
    std::string out;
    out.reserve(alias.size());
    bool pendingSpace = false;
    for (char ch : alias) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

int CompareEntityIds(const std::string& a, const std::string& b) {
    auto digitsStart = [](const std::string& s) {
        size_t pos = s.size();
        while (pos > 0 && std::isdigit(static_cast<unsigned char>(s[pos - 1]))) --pos;
        return pos;
    };
    size_t pa = digitsStart(a);
    size_t pb = digitsStart(b);

    int prefix = a.compare(0, pa, b, 0, pb);
    if (prefix != 0) return prefix;

    std::string na = a.substr(pa);
    std::string nb = b.substr(pb);
    na.erase(0, std::min(na.find_first_not_of('0'), na.size()));
    nb.erase(0, std::min(nb.find_first_not_of('0'), nb.size()));
    if (na.size() != nb.size()) return na.size() < nb.size() ? -1 : 1;
    int digits = na.compare(nb);
    if (digits != 0) return digits;
    return a.compare(b);
}

bool Entity::addAlias(const std::string& alias) {
    if (NormalizeAlias(alias).empty() || hasAlias(alias)) return false;
    aliases.push_back(alias);
    return true;
}

bool Entity::addRole(const std::string& role) {
    if (role.empty() || std::find(roles.begin(), roles.end(), role) != roles.end()) return false;
    roles.push_back(role);
    return true;
}

bool Entity::hasAlias(const std::string& alias) const {
    const std::string key = NormalizeAlias(alias);
    return std::any_of(aliases.begin(), aliases.end(),
                       [&key](const std::string& a) { return NormalizeAlias(a) == key; });
}

std::set<std::string> Entity::normalizedAliases() const {
    std::set<std::string> out;
    for (const auto& a : aliases) out.insert(NormalizeAlias(a));
    return out;
}

size_t Entity::overlappingRoles(const std::vector<std::string>& other) const {
    size_t count = 0;
    for (const auto& mine : roles) {
        const std::string lm = Lower(mine);
        if (std::any_of(other.begin(), other.end(), [&lm](const std::string& r) { return Lower(r) == lm; })) {
            ++count;
        }
    }
    return count;
}

bool Entity::overlayState(const std::string& key, const StateValue& incoming, StateTiePolicy policy) {
    auto it = states.find(key);
    if (it == states.end()) {
        states.emplace(key, incoming);
        return true;
    }

    StateValue& existing = it->second;
    bool incomingWins = true;
    if (existing.timestamp.hasParsed() && incoming.timestamp.hasParsed()) {
        incomingWins = *incoming.timestamp.parsedDay >= *existing.timestamp.parsedDay;
    } else if (policy == StateTiePolicy::HigherConfidence &&
               !existing.timestamp.hasParsed() && !incoming.timestamp.hasParsed()) {
        incomingWins = incoming.confidence.value_or(0.0) >= existing.confidence.value_or(0.0);
    }

    if (!incomingWins || existing == incoming) return false;
    existing = incoming;
    return true;
}

void Entity::absorb(const Entity& incoming, StateTiePolicy policy) {
    addAlias(incoming.name);
    for (const auto& alias : incoming.aliases) addAlias(alias);
    for (const auto& role : incoming.roles) addRole(role);
    for (const auto& [key, value] : incoming.states) overlayState(key, value, policy);
    involvedCases.insert(incoming.involvedCases.begin(), incoming.involvedCases.end());
}

} // namespace casegraph::domain
