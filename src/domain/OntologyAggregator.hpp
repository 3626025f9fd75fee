/**
 * @file OntologyAggregator.hpp
 * @brief Per-domain frequency table over role names, verb labels, state keys and entity types.
 */

#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "domain/Entity.hpp"
#include "domain/Event.hpp"

namespace casegraph::domain {

/**
 * @enum TermKind
 */
enum class TermKind {
    Role,
    Verb,
    StateKey,
    EntityType
};

std::string TermKindToString(TermKind kind);
std::optional<TermKind> TermKindFromString(const std::string& value);

/** @brief One observed term. */
struct OntologyTerm {
    TermKind kind;
    std::string term;
};

/** @brief A term with its frequency. */
struct TermCount {
    TermKind kind;
    std::string term;
    uint64_t count = 0;

    bool operator==(const TermCount& o) const { return kind == o.kind && term == o.term && count == o.count; }
};

/**
 * @class OntologyAggregator
 * @brief Counts only grow within a production run; rebuild() is the explicit reset.
 *
 * Terms are keyed by their normalized form (see NormalizeAlias). The summary is
 * computed on read, nothing is kept sorted.
 */
class OntologyAggregator {
public:
    explicit OntologyAggregator(std::string domain = "");

    const std::string& domain() const { return m_domain; }
    void setDomain(const std::string& domain) { m_domain = domain; }

    /** @brief Adds one occurrence per term. O(batch size). */
    void update(const std::vector<OntologyTerm>& batchTerms);

    /** @brief Adds @p n occurrences of a single term. Empty terms are ignored. */
    void add(TermKind kind, const std::string& term, uint64_t n = 1);

    /** @brief Top-K terms across kinds by count, then kind, then term. */
    std::vector<TermCount> summary(size_t topK) const;

    /** @brief Top-K terms of a single kind. */
    std::vector<TermCount> summary(TermKind kind, size_t topK) const;

    uint64_t count(TermKind kind, const std::string& term) const;

    /** @brief Number of distinct terms. */
    size_t size() const;

    /** @brief Every entry ordered by kind then term, for serialization. */
    std::vector<TermCount> entries() const;

    /** @brief Recomputes all counts from committed entities and events. */
    void rebuild(const std::map<std::string, Entity>& entities, const std::vector<Event>& events);

    bool operator==(const OntologyAggregator& o) const { return m_domain == o.m_domain && m_counts == o.m_counts; }
    bool operator!=(const OntologyAggregator& o) const { return !(*this == o); }

private:
    static constexpr size_t kKindCount = 4;
    std::string m_domain;
    std::array<std::unordered_map<std::string, uint64_t>, kKindCount> m_counts;

    static std::vector<TermCount> rank(std::vector<TermCount> terms, size_t topK);
};

/**
 * @class OpenVocabulary
 * @brief Open set of values for a free-form field, with an optional canonical mapping.
 *
 * Unrecognized values are always accepted; the mapping is filled by a later normalization pass.
 */
class OpenVocabulary {
public:
    /** @brief Records a value. Never rejects. */
    void observe(const std::string& value);

    /** @brief Maps @p value to @p canonical (both are also recorded as seen). */
    void setCanonical(const std::string& value, const std::string& canonical);

    /** @brief Mapped form of @p value, or @p value itself when unmapped. */
    std::string canonical(const std::string& value) const;

    bool seen(const std::string& value) const { return m_values.count(value) > 0; }
    const std::map<std::string, uint64_t>& values() const { return m_values; }
    const std::map<std::string, std::string>& mappings() const { return m_canonical; }

    /** @brief Restores a value with its observation count (snapshot load). */
    void restoreValue(const std::string& value, uint64_t observations) { m_values[value] = observations; }

    bool operator==(const OpenVocabulary& o) const { return m_values == o.m_values && m_canonical == o.m_canonical; }
    bool operator!=(const OpenVocabulary& o) const { return !(*this == o); }

private:
    std::map<std::string, uint64_t> m_values;
    std::map<std::string, std::string> m_canonical;
};

} // namespace casegraph::domain
