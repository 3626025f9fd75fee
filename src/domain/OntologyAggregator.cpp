/**
 * @file OntologyAggregator.cpp
 * @brief Implementation of OntologyAggregator and OpenVocabulary.
 */

#include "domain/OntologyAggregator.hpp"
#include <algorithm>

namespace casegraph::domain {

std::string TermKindToString(TermKind kind) {
    switch (kind) {
        case TermKind::Role: return "role";
        case TermKind::Verb: return "verb";
        case TermKind::StateKey: return "state_key";
        case TermKind::EntityType: return "entity_type";
    }
    return "role";
}

std::optional<TermKind> TermKindFromString(const std::string& value) {
    if (value == "role") return TermKind::Role;
    if (value == "verb") return TermKind::Verb;
    if (value == "state_key") return TermKind::StateKey;
    if (value == "entity_type") return TermKind::EntityType;
    return std::nullopt;
}

OntologyAggregator::OntologyAggregator(std::string domain) : m_domain(std::move(domain)) {}

void OntologyAggregator::update(const std::vector<OntologyTerm>& batchTerms) {
    for (const auto& t : batchTerms) {
        add(t.kind, t.term);
    }
}

void OntologyAggregator::add(TermKind kind, const std::string& term, uint64_t n) {
    std::string key = NormalizeAlias(term);
    if (key.empty() || n == 0) return;
    m_counts[static_cast<size_t>(kind)][key] += n;
}

std::vector<TermCount> OntologyAggregator::rank(std::vector<TermCount> terms, size_t topK) {
    auto better = [](const TermCount& a, const TermCount& b) {
        if (a.count != b.count) return a.count > b.count;
        if (a.kind != b.kind) return static_cast<int>(a.kind) < static_cast<int>(b.kind);
        return a.term < b.term;
    };
    if (topK < terms.size()) {
        std::partial_sort(terms.begin(), terms.begin() + static_cast<std::ptrdiff_t>(topK), terms.end(), better);
        terms.resize(topK);
    } else {
        std::sort(terms.begin(), terms.end(), better);
    }
    return terms;
}

std::vector<TermCount> OntologyAggregator::summary(size_t topK) const {
    std::vector<TermCount> all;
    all.reserve(size());
    for (size_t k = 0; k < kKindCount; ++k) {
        for (const auto& [term, count] : m_counts[k]) {
            all.push_back({static_cast<TermKind>(k), term, count});
        }
    }
    return rank(std::move(all), topK);
}

std::vector<TermCount> OntologyAggregator::summary(TermKind kind, size_t topK) const {
    std::vector<TermCount> terms;
    const auto& table = m_counts[static_cast<size_t>(kind)];
    terms.reserve(table.size());
    for (const auto& [term, count] : table) {
        terms.push_back({kind, term, count});
    }
    return rank(std::move(terms), topK);
}

uint64_t OntologyAggregator::count(TermKind kind, const std::string& term) const {
    const auto& table = m_counts[static_cast<size_t>(kind)];
    auto it = table.find(NormalizeAlias(term));
    return it == table.end() ? 0 : it->second;
}

size_t OntologyAggregator::size() const {
    size_t total = 0;
    for (const auto& table : m_counts) total += table.size();
    return total;
}

std::vector<TermCount> OntologyAggregator::entries() const {
    std::vector<TermCount> out;
    out.reserve(size());
    for (size_t k = 0; k < kKindCount; ++k) {
        std::map<std::string, uint64_t> sorted(m_counts[k].begin(), m_counts[k].end());
        for (const auto& [term, count] : sorted) {
            out.push_back({static_cast<TermKind>(k), term, count});
        }
    }
    return out;
}

void OntologyAggregator::rebuild(const std::map<std::string, Entity>& entities, const std::vector<Event>& events) {
    for (auto& table : m_counts) table.clear();

    for (const auto& [id, entity] : entities) {
        add(TermKind::EntityType, EntityTypeToString(entity.type));
        for (const auto& role : entity.roles) add(TermKind::Role, role);
        for (const auto& [key, value] : entity.states) add(TermKind::StateKey, key);
    }
    for (const auto& event : events) {
        add(TermKind::Verb, event.verb);
    }
}

void OpenVocabulary::observe(const std::string& value) {
    if (value.empty()) return;
    ++m_values[value];
}

void OpenVocabulary::setCanonical(const std::string& value, const std::string& canonical) {
    if (value.empty() || canonical.empty()) return;
    m_values.emplace(value, 0);
    m_values.emplace(canonical, 0);
    m_canonical[value] = canonical;
}

std::string OpenVocabulary::canonical(const std::string& value) const {
    auto it = m_canonical.find(value);
    return it == m_canonical.end() ? value : it->second;
}

} // namespace casegraph::domain
