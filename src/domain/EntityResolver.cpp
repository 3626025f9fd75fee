/**
 * @file EntityResolver.cpp
 * @brief Implementation of EntityResolver.
 */

#include "domain/EntityResolver.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <thread>

namespace casegraph::domain {

namespace {

std::string Trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

// More overlapping roles first, then lowest id.
bool PreferCandidate(const Entity& candidate, const Entity* a, const Entity* b) {
    size_t ra = a->overlappingRoles(candidate.roles);
    size_t rb = b->overlappingRoles(candidate.roles);
    if (ra != rb) return ra > rb;
    return CompareEntityIds(a->id, b->id) < 0;
}

} // namespace

EntityResolver::EntityResolver(std::shared_ptr<SimilarityOracle> oracle, ResolverSettings settings)
    : m_oracle(std::move(oracle)), m_settings(settings) {}

std::optional<Entity> EntityResolver::Materialize(const CandidateEntity& candidate, const std::string& caseId) {
    std::string name = Trim(candidate.name);
    if (name.empty() || Trim(candidate.localId).empty()) return std::nullopt;

    auto type = EntityTypeFromString(candidate.type);
    if (!type) return std::nullopt;

    Entity entity;
    entity.type = *type;
    entity.name = name;
    entity.addAlias(name);
    for (const auto& alias : candidate.aliases) entity.addAlias(Trim(alias));
    for (const auto& role : candidate.roles) entity.addRole(Trim(role));
    for (const auto& state : candidate.states) {
        std::string key = Trim(state.key);
        if (key.empty()) continue;
        StateValue value;
        value.value = state.value;
        value.timestamp = FuzzyDate::FromText(state.rawTimestamp);
        value.caseId = caseId;
        value.confidence = state.confidence;
        entity.overlayState(key, value, StateTiePolicy::ExtractionOrder);
    }
    if (!caseId.empty()) entity.involvedCases.insert(caseId);
    return entity;
}

std::optional<std::string> EntityResolver::ExactAliasMatch(const Entity& candidate,
                                                           const std::vector<const Entity*>& pool) {
    const auto wanted = candidate.normalizedAliases();
    const Entity* best = nullptr;
    for (const Entity* existing : pool) {
        bool hit = false;
        for (const auto& alias : existing->aliases) {
            if (wanted.count(NormalizeAlias(alias))) {
                hit = true;
                break;
            }
        }
        if (hit && (!best || PreferCandidate(candidate, existing, best))) best = existing;
    }
    if (!best) return std::nullopt;
    return best->id;
}

std::optional<double> EntityResolver::scoreBounded(const Entity& candidate, const Entity& existing) const {
    if (m_settings.oracleTimeout.count() <= 0) {
        try {
            return m_oracle->score(candidate, existing);
        } catch (const std::exception& e) {
            std::cerr << "[EntityResolver] Oracle error: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    // The worker owns copies of its inputs so a late answer cannot touch freed memory.
    auto promise = std::make_shared<std::promise<std::optional<double>>>();
    auto future = promise->get_future();
    std::thread([oracle = m_oracle, promise, candidate, existing]() {
        try {
            promise->set_value(oracle->score(candidate, existing));
        } catch (const std::exception& e) {
            std::cerr << "[EntityResolver] Oracle error: " << e.what() << std::endl;
            promise->set_value(std::nullopt);
        }
    }).detach();

    if (future.wait_for(m_settings.oracleTimeout) != std::future_status::ready) {
        std::cerr << "[EntityResolver] Oracle timed out after " << m_settings.oracleTimeout.count()
                  << " ms scoring '" << candidate.name << "' against " << existing.id << std::endl;
        return std::nullopt;
    }
    return future.get();
}

Resolution EntityResolver::resolve(const Entity& candidate, const Workspace& workspace) const {
    Resolution result;
    const auto pool = workspace.entitiesOfType(candidate.type);

    if (auto exact = ExactAliasMatch(candidate, pool)) {
        result.kind = MergeDecision::Kind::MergeInto;
        result.targetId = *exact;
        result.score = 1.0;
        result.exactMatch = true;
        return result;
    }

    if (!m_oracle || pool.empty()) {
        return result;
    }

    const Entity* best = nullptr;
    double bestScore = -1.0;
    for (const Entity* existing : pool) {
        auto score = scoreBounded(candidate, *existing);
        if (!score || std::isnan(*score)) {
            std::cerr << "[EntityResolver] Oracle unavailable for '" << candidate.name
                      << "', falling back to exact alias matching" << std::endl;
            result.degraded = true;
            result.score = 0.0;
            return result;
        }
        double s = std::clamp(*score, 0.0, 1.0);
        if (!best || s > bestScore || (s == bestScore && PreferCandidate(candidate, existing, best))) {
            best = existing;
            bestScore = s;
        }
    }

    result.score = bestScore;
    if (best && bestScore > m_settings.similarityThreshold) {
        result.kind = MergeDecision::Kind::MergeInto;
        result.targetId = best->id;
    }
    return result;
}

} // namespace casegraph::domain
