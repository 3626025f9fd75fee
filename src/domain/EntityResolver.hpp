/**
 * @file EntityResolver.hpp
 * @brief Dedup/merge decision engine for candidate entities.
 */

#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/Candidate.hpp"
#include "domain/Entity.hpp"
#include "domain/MergeReport.hpp"
#include "domain/SimilarityOracle.hpp"
#include "domain/Workspace.hpp"

namespace casegraph::domain {

/**
 * @struct ResolverSettings
 */
struct ResolverSettings {
    double similarityThreshold = 0.85;                  ///< Oracle score must exceed this to merge.
    std::chrono::milliseconds oracleTimeout{2000};      ///< Per call; zero or less calls the oracle inline.
    StateTiePolicy tiePolicy = StateTiePolicy::ExtractionOrder;
};

/**
 * @struct Resolution
 * @brief Read-only decision for one candidate; applied later by the store.
 */
struct Resolution {
    MergeDecision::Kind kind = MergeDecision::Kind::CreateNew;
    std::string targetId;
    double score = 0.0;
    bool exactMatch = false;
    bool degraded = false;
};

/**
 * @class EntityResolver
 * @brief Decides MergeInto(existingId) or CreateNew for a candidate against the workspace.
 *
 * Policy, in order:
 * 1. exact normalized-alias match against entities of the same type (no oracle call);
 * 2. best oracle score above the threshold, ties broken by role overlap then lowest id;
 * 3. create a new entity.
 * An oracle failure or timeout degrades the candidate to step 1 only.
 */
class EntityResolver {
public:
    explicit EntityResolver(std::shared_ptr<SimilarityOracle> oracle, ResolverSettings settings = {});

    /**
     * @brief Resolves one candidate. Never mutates the workspace; safe to call concurrently.
     */
    Resolution resolve(const Entity& candidate, const Workspace& workspace) const;

    /**
     * @brief Exact alias match within @p pool (already filtered by type).
     * @return Target id; among several hits the one with more overlapping roles, then lowest id.
     */
    static std::optional<std::string> ExactAliasMatch(const Entity& candidate, const std::vector<const Entity*>& pool);

    /**
     * @brief Validates a raw candidate and turns it into an id-less Entity.
     * @return nullopt when required fields are missing or the type is unknown.
     */
    static std::optional<Entity> Materialize(const CandidateEntity& candidate, const std::string& caseId);

    const ResolverSettings& settings() const { return m_settings; }

private:
    std::shared_ptr<SimilarityOracle> m_oracle;
    ResolverSettings m_settings;

    std::optional<double> scoreBounded(const Entity& candidate, const Entity& existing) const;
};

} // namespace casegraph::domain
