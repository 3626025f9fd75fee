/**
 * @file Entity.hpp
 * @brief Actor entity of the workspace graph: aliases, roles, states and case membership.
 */

#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "domain/FuzzyDate.hpp"

namespace casegraph::domain {

/**
 * @enum EntityType
 * @brief Closed set of entity kinds the resolver compares within.
 */
enum class EntityType {
    Person,
    Organization,
    Location,
    TemporalMarker,
    Asset
};

std::string EntityTypeToString(EntityType type);

/** @brief Accepts canonical names plus common synonyms ("org", "place", "date", "object"). */
std::optional<EntityType> EntityTypeFromString(const std::string& value);

/**
 * @enum StateTiePolicy
 * @brief How a state overlay is decided when neither side has a parsed timestamp.
 */
enum class StateTiePolicy {
    ExtractionOrder,   ///< Incoming value wins.
    HigherConfidence   ///< Incoming wins only with confidence >= existing (missing counts as 0).
};

std::string StateTiePolicyToString(StateTiePolicy policy);
std::optional<StateTiePolicy> StateTiePolicyFromString(const std::string& value);

/**
 * @struct StateValue
 * @brief Value of one state key with its timestamp and provenance.
 */
struct StateValue {
    std::string value;
    FuzzyDate timestamp;               ///< May be empty, raw-only or parsed.
    std::string caseId;                ///< Provenance.
    std::optional<double> confidence;  ///< Extraction confidence, when supplied.

    bool operator==(const StateValue& o) const {
        return value == o.value && timestamp == o.timestamp && caseId == o.caseId && confidence == o.confidence;
    }
    bool operator!=(const StateValue& o) const { return !(*this == o); }
};

/**
 * @brief Lower-cases, trims and collapses internal whitespace.
 * Identity of aliases is decided on this form.
 */
std::string NormalizeAlias(const std::string& alias);

/**
 * @brief Orders entity ids numerically by their sequence suffix ("E9" < "E10").
 * @return Negative, zero or positive like strcmp.
 */
int CompareEntityIds(const std::string& a, const std::string& b);

/**
 * @class Entity
 * @brief A resolved actor. Aliases and roles only grow within a run.
 */
class Entity {
public:
    std::string id;
    EntityType type = EntityType::Person;
    std::string name;                           ///< Display name, always one of the aliases.
    std::vector<std::string> aliases;           ///< First-seen display forms, unique by NormalizeAlias.
    std::vector<std::string> roles;             ///< First-seen order, no duplicates.
    std::map<std::string, StateValue> states;   ///< state key -> current value.
    std::set<std::string> involvedCases;

    /** @brief Adds an alias unless its normalized form is already present. @return True if added. */
    bool addAlias(const std::string& alias);

    /** @brief Appends a role unless already present (exact match). @return True if added. */
    bool addRole(const std::string& role);

    /** @brief True if any normalized alias equals the normalized form of @p alias. */
    bool hasAlias(const std::string& alias) const;

    /** @brief Normalized alias set, for exact-match comparison. */
    std::set<std::string> normalizedAliases() const;

    /** @brief Number of roles shared with @p roles (case-insensitive). */
    size_t overlappingRoles(const std::vector<std::string>& roles) const;

    /**
     * @brief Overlays one state key. Last write wins by parsed timestamp when both sides have one,
     * otherwise the tie policy decides.
     * @return True if the stored value changed.
     */
    bool overlayState(const std::string& key, const StateValue& incoming, StateTiePolicy policy);

    /**
     * @brief Folds an incoming entity into this one: aliases, roles, states, cases.
     * The id, type and display name of this entity are kept.
     */
    void absorb(const Entity& incoming, StateTiePolicy policy);

    bool operator==(const Entity& o) const {
        return id == o.id && type == o.type && name == o.name && aliases == o.aliases && roles == o.roles &&
               states == o.states && involvedCases == o.involvedCases;
    }
    bool operator!=(const Entity& o) const { return !(*this == o); }
};

} // namespace casegraph::domain
