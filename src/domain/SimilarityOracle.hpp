/**
 * @file SimilarityOracle.hpp
 * @brief Interface for the external entity-similarity scorer.
 */

#pragma once
#include <optional>
#include "domain/Entity.hpp"

namespace casegraph::domain {

/**
 * @class SimilarityOracle
 * @brief Scores how likely two entities denote the same actor.
 *
 * Treated as a pure function of its inputs. Implementations may block on I/O;
 * the resolver bounds each call with a timeout.
 */
class SimilarityOracle {
public:
    virtual ~SimilarityOracle() = default;

    /**
     * @brief Similarity in [0,1].
     * @return nullopt when the oracle is unavailable (the caller degrades to exact matching).
     */
    virtual std::optional<double> score(const Entity& candidate, const Entity& existing) = 0;
};

} // namespace casegraph::domain
