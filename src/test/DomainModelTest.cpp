#include <cassert>
#include <iostream>

#include "domain/Entity.hpp"
#include "domain/FuzzyDate.hpp"
#include "domain/OntologyAggregator.hpp"
#include "domain/Workspace.hpp"

using namespace casegraph::domain;

static StateValue State(const std::string& value, const std::string& when, std::optional<double> confidence = {}) {
    StateValue s;
    s.value = value;
    s.timestamp = FuzzyDate::FromText(when);
    s.caseId = "C1";
    s.confidence = confidence;
    return s;
}

int main() {
    std::cout << "[Test] Starting Domain Model Test..." << std::endl;

    // Fuzzy dates
    {
        assert(FuzzyDate::Parse("1970-01-01") == 0);
        assert(FuzzyDate::Parse("2020-03-15") == DaysFromCivil(2020, 3, 15));
        assert(FuzzyDate::Parse("2020-03") == DaysFromCivil(2020, 3, 1));
        assert(FuzzyDate::Parse("2020") == DaysFromCivil(2020, 1, 1));
        assert(FuzzyDate::Parse("15 March 2020") == DaysFromCivil(2020, 3, 15));
        assert(FuzzyDate::Parse("March 15, 2020") == DaysFromCivil(2020, 3, 15));
        assert(FuzzyDate::Parse("Mar 15, 2020") == DaysFromCivil(2020, 3, 15));
        assert(!FuzzyDate::Parse("2021-02-29").has_value() && "Not a leap year.");
        assert(!FuzzyDate::Parse("early last year").has_value());

        FuzzyDate vague = FuzzyDate::FromText("sometime in winter");
        assert(vague.rawText == "sometime in winter" && !vague.hasParsed() && "Raw text is kept.");
        std::cout << "[PASS] Fuzzy dates parse or stay raw." << std::endl;
    }

    // Alias normalization and id ordering
    {
        assert(NormalizeAlias("  John   SMITH \t") == "john smith");
        assert(CompareEntityIds("E9", "E10") < 0);
        assert(CompareEntityIds("E10", "E9") > 0);
        assert(CompareEntityIds("E3", "E3") == 0);
        assert(EntityTypeFromString("Organisation") == EntityType::Organization);
        assert(EntityTypeFromString("temporal") == EntityType::TemporalMarker);
        assert(!EntityTypeFromString("spaceship").has_value());
        std::cout << "[PASS] Normalization and numeric id order." << std::endl;
    }

    // Aliases and roles only grow, first-seen order
    {
        Entity e;
        e.name = "John Smith";
        assert(e.addAlias("John Smith"));
        assert(!e.addAlias("john  smith") && "Same normalized alias.");
        assert(e.addAlias("J. Smith"));
        assert(e.addRole("husband"));
        assert(!e.addRole("husband"));

        Entity incoming;
        incoming.name = "Mr Smith";
        incoming.aliases = {"Mr Smith", "J. SMITH"};
        incoming.roles = {"applicant", "husband"};
        incoming.involvedCases = {"C2"};
        e.involvedCases = {"C1"};
        e.absorb(incoming, StateTiePolicy::ExtractionOrder);

        assert((e.aliases == std::vector<std::string>{"John Smith", "J. Smith", "Mr Smith"}));
        assert((e.roles == std::vector<std::string>{"husband", "applicant"}));
        assert((e.involvedCases == std::set<std::string>{"C1", "C2"}));
        assert(e.name == "John Smith" && "Display name is kept.");
        assert(e.overlappingRoles({"HUSBAND", "father"}) == 1);
        std::cout << "[PASS] Absorb unions aliases, roles and cases." << std::endl;
    }

    // State overlay
    {
        Entity e;
        e.overlayState("status", State("married", "2015-06-01"), StateTiePolicy::ExtractionOrder);
        assert(!e.overlayState("status", State("engaged", "2014-01-01"), StateTiePolicy::ExtractionOrder) &&
               "Older timestamp loses.");
        assert(e.overlayState("status", State("separated", "1 March 2020"), StateTiePolicy::ExtractionOrder));
        assert(e.states["status"].value == "separated");

        // No parsed timestamps: extraction order wins
        assert(e.overlayState("job", State("engineer", ""), StateTiePolicy::ExtractionOrder));
        assert(e.overlayState("job", State("accountant", "recently"), StateTiePolicy::ExtractionOrder));
        assert(e.states["job"].value == "accountant");

        // One side parsed only: extraction order as well
        assert(e.overlayState("status", State("divorced", ""), StateTiePolicy::ExtractionOrder));
        assert(e.states["status"].value == "divorced");

        // Higher-confidence tie policy
        Entity c;
        c.overlayState("job", State("engineer", "", 0.9), StateTiePolicy::HigherConfidence);
        assert(!c.overlayState("job", State("nurse", "", 0.4), StateTiePolicy::HigherConfidence));
        assert(!c.overlayState("job", State("nurse", ""), StateTiePolicy::HigherConfidence) &&
               "Missing confidence counts as zero.");
        assert(c.states["job"].value == "engineer");
        assert(c.overlayState("job", State("principal", "", 0.9), StateTiePolicy::HigherConfidence) &&
               "Equal confidence goes to the incoming value.");
        assert(c.states["job"].value == "principal");
        std::cout << "[PASS] State overlay follows timestamps, then the tie policy." << std::endl;
    }

    // Ontology aggregator
    {
        OntologyAggregator agg("family");
        agg.update({{TermKind::Role, "Husband"}, {TermKind::Role, "husband"}, {TermKind::Role, "applicant"},
                    {TermKind::Verb, "filed"}, {TermKind::StateKey, "status"}, {TermKind::Role, ""}});
        assert(agg.count(TermKind::Role, "HUSBAND") == 2);
        assert(agg.size() == 4 && "Empty terms are ignored.");

        auto top = agg.summary(2);
        assert(top.size() == 2);
        assert(top[0].term == "husband" && top[0].count == 2);
        assert(top[1].kind == TermKind::Role && top[1].term == "applicant" && "Ties: kind, then term.");

        auto verbs = agg.summary(TermKind::Verb, 10);
        assert(verbs.size() == 1 && verbs[0].term == "filed");
        assert(agg.summary(100).size() == 4);

        std::map<std::string, Entity> entities;
        Entity e;
        e.id = "E1";
        e.roles = {"wife"};
        entities["E1"] = e;
        Event ev;
        ev.verb = "Appealed";
        agg.rebuild(entities, {ev});
        assert(agg.count(TermKind::Role, "husband") == 0 && "Rebuild is a reset.");
        assert(agg.count(TermKind::Role, "wife") == 1);
        assert(agg.count(TermKind::Verb, "appealed") == 1);
        assert(agg.count(TermKind::EntityType, "person") == 1);
        std::cout << "[PASS] Ontology counts, ranking and rebuild." << std::endl;
    }

    // Open vocabulary
    {
        OpenVocabulary vocab;
        vocab.observe("filed");
        vocab.observe("filed");
        vocab.observe("lodged");
        assert(vocab.seen("lodged") && vocab.values().at("filed") == 2);
        assert(vocab.canonical("lodged") == "lodged" && "Unmapped values map to themselves.");
        vocab.setCanonical("lodged", "filed");
        assert(vocab.canonical("lodged") == "filed");
        vocab.observe("a brand new verb");
        assert(vocab.seen("a brand new verb") && "Unknown values are accepted.");
        std::cout << "[PASS] Open vocabulary never rejects values." << std::endl;
    }

    // Workspace primitives
    {
        Workspace ws("family");
        Entity a;
        a.id = ws.allocateEntityId();
        a.name = "Ann";
        a.aliases = {"Ann"};
        ws.insertEntity(a);
        assert(a.id == "E1" && ws.allocateEntityId() == "E2" && "Ids are never reused.");

        Event ev;
        ev.verb = "filed";
        ev.agentId = "E1";
        ev.caseId = "C1";
        assert(ws.appendEvent(ev));
        assert(!ws.appendEvent(ev) && "Same fact is stored once.");
        assert(ws.events()[0].id == "V1");

        Question q;
        q.subjectId = "E1";
        q.text = "When did Ann file?";
        q.sourceCaseId = "C1";
        assert(ws.appendQuestion(q));
        q.text = "when did  ann file?";
        assert(!ws.appendQuestion(q) && "Same subject and normalized text.");
        assert(!ws.answerQuestion("Q1", "   ", "C2") && "Empty answers are refused.");
        assert(ws.answerQuestion("Q1", "In 2020", "C2"));
        assert(!ws.dropQuestion("Q1") && "Answered questions are not dropped.");
        assert(ws.unansweredQuestions().empty());
        std::cout << "[PASS] Workspace ids and dedup primitives." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
