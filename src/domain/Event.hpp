/**
 * @file Event.hpp
 * @brief Verb-phrase event linking an agent to patients, with optional time and place.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace casegraph::domain {

/**
 * @struct Event
 * @brief Committed verb phrase. Every reference resolves to an existing entity id.
 */
struct Event {
    std::string id;
    std::string verb;
    std::string agentId;
    std::vector<std::string> patientIds;
    std::optional<std::string> temporalId;
    std::optional<std::string> spatialId;
    bool implicit = false;   ///< Inferred rather than textually explicit.
    std::string caseId;

    /** @brief All entity ids this event points at, agent first. */
    std::vector<std::string> references() const {
        std::vector<std::string> refs;
        refs.push_back(agentId);
        refs.insert(refs.end(), patientIds.begin(), patientIds.end());
        if (temporalId) refs.push_back(*temporalId);
        if (spatialId) refs.push_back(*spatialId);
        return refs;
    }

    /** @brief Everything except the id; two events with the same signature are the same fact. */
    bool sameFact(const Event& o) const {
        return verb == o.verb && agentId == o.agentId && patientIds == o.patientIds &&
               temporalId == o.temporalId && spatialId == o.spatialId && implicit == o.implicit &&
               caseId == o.caseId;
    }

    bool operator==(const Event& o) const { return id == o.id && sameFact(o); }
    bool operator!=(const Event& o) const { return !(*this == o); }
};

} // namespace casegraph::domain
