#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "application/WorkspaceStore.hpp"
#include "domain/Errors.hpp"
#include "test/TestDoubles.hpp"

using namespace casegraph::domain;
using casegraph::application::WorkspaceStore;
using casegraph::test::Batch;
using casegraph::test::Chunk;
using casegraph::test::Person;
using casegraph::test::ScriptedOracle;
using casegraph::test::Typed;

// Blocks inside score() until released, so a batch can be held in flight.
class GateOracle : public SimilarityOracle {
public:
    std::optional<double> score(const Entity&, const Entity&) override {
        entered = true;
        while (!released) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return 0.0;
    }
    std::atomic<bool> entered{false};
    std::atomic<bool> released{false};
};

static CandidateEvent MakeEvent(const std::string& verb, const std::string& agent,
                                std::vector<std::string> patients = {},
                                std::optional<std::string> temporal = std::nullopt,
                                std::optional<std::string> spatial = std::nullopt) {
    CandidateEvent e;
    e.verb = verb;
    e.agentRef = agent;
    e.patientRefs = std::move(patients);
    e.temporalRef = std::move(temporal);
    e.spatialRef = std::move(spatial);
    return e;
}

static WorkspaceStore MakeStore(std::shared_ptr<SimilarityOracle> oracle = nullptr, double threshold = 0.85) {
    ResolverSettings settings;
    settings.similarityThreshold = threshold;
    return WorkspaceStore(Workspace("family"), EntityResolver(std::move(oracle), settings), 2);
}

int main() {
    std::cout << "[Test] Starting Workspace Store Test..." << std::endl;

    // John Smith / J. Smith across two cases
    {
        auto oracle = std::make_shared<ScriptedOracle>();
        oracle->set("J. Smith", "John Smith", 0.92);
        WorkspaceStore store = MakeStore(oracle, 0.8);

        MergeReport first = store.appendBatch(Batch({Chunk("C1", {Person("p1", "John Smith", {"husband"})})}));
        assert(first.newEntities == 1 && first.mergedEntities == 0);

        MergeReport second = store.appendBatch(Batch({Chunk("C2", {Person("p1", "J. Smith", {"applicant"})})}, 1));
        assert(second.newEntities == 0 && second.mergedEntities == 1);
        assert(second.decisions.size() == 1 && second.decisions[0].entityId == "E1");
        assert(second.decisions[0].score == 0.92 && !second.decisions[0].exactMatch);

        auto view = store.queryByEntity("E1");
        assert(view.has_value());
        assert((view->entity.aliases == std::vector<std::string>{"John Smith", "J. Smith"}));
        assert((view->entity.roles == std::vector<std::string>{"husband", "applicant"}));
        assert((view->entity.involvedCases == std::set<std::string>{"C1", "C2"}));
        assert(store.statistics().entities == 1);
        assert(store.statistics().version == 2 && store.statistics().documentCount == 2);
        std::cout << "[PASS] Similar actor merged across cases." << std::endl;
    }

    // Role order stability
    {
        WorkspaceStore store = MakeStore();
        store.appendBatch(Batch({Chunk("C1", {Person("a", "Alex Doe", {"husband"})})}));
        store.appendBatch(Batch({Chunk("C1", {Person("a", "Alex Doe", {"applicant", "husband"})})}, 1));
        auto roles = store.queryByEntity("E1")->entity.roles;
        assert((roles == std::vector<std::string>{"husband", "applicant"}));
        std::cout << "[PASS] First-seen role order is kept." << std::endl;
    }

    // Idempotence
    {
        WorkspaceStore store = MakeStore(std::make_shared<ScriptedOracle>(0.1));
        auto chunk = Chunk("C1", {Person("p1", "Ann Lee", {"wife"}), Person("p2", "Bob Lee", {"husband"})});
        chunk.events.push_back(MakeEvent("married", "p1", {"p2"}));
        CandidateQuestion q;
        q.subjectRef = "p2";
        q.text = "Where does Bob live?";
        chunk.questions.push_back(q);

        store.appendBatch(Batch({chunk}));
        Workspace once = store.workspace();
        MergeReport again = store.appendBatch(Batch({chunk}));
        Workspace twice = store.workspace();

        assert(again.newEntities == 0 && again.mergedEntities == 2);
        assert(again.newEvents == 0 && again.newQuestions == 0);
        assert(twice.entities() == once.entities());
        assert(twice.events() == once.events());
        assert(twice.questions() == once.questions());
        std::cout << "[PASS] Replaying a batch changes no tables." << std::endl;
    }

    // Same new actor in two chunks of one batch
    {
        WorkspaceStore store = MakeStore();
        MergeReport report = store.appendBatch(Batch({Chunk("C1", {Person("p1", "Carol King", {"mother"})}),
                                                      Chunk("C2", {Person("x", "carol  king", {"respondent"})})}));
        assert(report.newEntities == 1 && report.mergedEntities == 1);
        assert(report.decisions[1].entityId == "E1" && report.decisions[1].exactMatch);
        auto carol = store.queryByEntity("E1")->entity;
        assert((carol.involvedCases == std::set<std::string>{"C1", "C2"}));
        assert((carol.roles == std::vector<std::string>{"mother", "respondent"}));
        std::cout << "[PASS] Intra-batch duplicates collapse." << std::endl;
    }

    // An alias merged into an existing entity earlier in the batch is matched later in it
    {
        auto oracle = std::make_shared<ScriptedOracle>(0.1);
        oracle->set("Johnny Smith", "John Smith", 0.95);
        auto seed = Batch({Chunk("C0", {Person("p", "John Smith")})});
        auto nick = Chunk("C1", {Person("a", "Johnny Smith", {}, {"J. Smith"})});
        auto initials = Chunk("C2", {Person("b", "J. Smith", {"applicant"})});

        WorkspaceStore together = MakeStore(oracle, 0.8);
        together.appendBatch(seed);
        MergeReport report = together.appendBatch(Batch({nick, initials}, 1));
        assert(report.newEntities == 0 && report.mergedEntities == 2);
        assert(report.decisions[1].entityId == "E1" && report.decisions[1].exactMatch);

        WorkspaceStore apart = MakeStore(oracle, 0.8);
        apart.appendBatch(seed);
        apart.appendBatch(Batch({nick}, 1));
        apart.appendBatch(Batch({initials}, 2));

        assert(together.statistics().entities == 1 && apart.statistics().entities == 1);
        assert(together.queryByEntity("E1")->entity == apart.queryByEntity("E1")->entity);
        std::cout << "[PASS] Batch grouping does not change merge results." << std::endl;
    }

    // Malformed candidates and cascades
    {
        WorkspaceStore store = MakeStore();
        auto chunk = Chunk("C1", {Person("p1", "Dana"), Typed("s1", "spaceship", "Enterprise"),
                                  Person("p1", "Someone Else"), Person("p2", "")});
        chunk.events.push_back(MakeEvent("boarded", "p1", {"s1"}));
        chunk.events.push_back(MakeEvent("", "p1"));
        chunk.events.push_back(MakeEvent("met", "p2"));
        chunk.events.push_back(MakeEvent("waited", "p1"));
        CandidateQuestion orphan;
        orphan.subjectRef = "s1";
        orphan.text = "Who owns the ship?";
        chunk.questions.push_back(orphan);

        MergeReport report = store.appendBatch(Batch({chunk}));
        // spaceship, repeated p1, empty name, two cascaded events, one verbless event, one question
        assert(report.malformedCandidates == 7);
        assert(report.newEntities == 1 && report.newEvents == 1 && report.newQuestions == 0);
        assert(report.decisions.size() == 4);
        assert(report.decisions[1].kind == MergeDecision::Kind::Dropped);
        assert(store.queryByEntity("E1")->entity.name == "Dana");
        assert(store.timeline().empty());

        auto shredded = Chunk("C2", {Person("p1", "Dana")});
        shredded.malformedItems = 3;
        MergeReport later = store.appendBatch(Batch({shredded}, 1));
        assert(later.malformedCandidates == 3 && later.mergedEntities == 1);
        std::cout << "[PASS] Malformed candidates dropped and counted." << std::endl;
    }

    // Dangling reference rolls the whole batch back
    {
        WorkspaceStore store = MakeStore();
        store.appendBatch(Batch({Chunk("C1", {Person("p1", "Eve")})}));
        Workspace before = store.workspace();
        std::string beforeBytes = store.snapshot();

        auto chunk = Chunk("C2", {Person("p1", "Frank")});
        chunk.events.push_back(MakeEvent("sued", "p1", {"E77"}));
        bool threw = false;
        try {
            store.appendBatch(Batch({chunk}, 1));
        } catch (const ReferenceIntegrityViolation& e) {
            threw = true;
            assert(e.missingReference() == "E77");
        }
        assert(threw);
        assert(store.workspace() == before);
        assert(store.snapshot() == beforeBytes);

        // Existing workspace ids are valid references
        auto ok = Chunk("C2", {Person("p1", "Frank")});
        ok.events.push_back(MakeEvent("sued", "p1", {"E1"}));
        MergeReport report = store.appendBatch(Batch({ok}, 1));
        assert(report.newEvents == 1);
        assert(store.queryByEntity("E1")->events.size() == 1);
        std::cout << "[PASS] Failed apply leaves the workspace untouched." << std::endl;
    }

    // Cancellation during resolve
    {
        WorkspaceStore store = MakeStore();
        store.appendBatch(Batch({Chunk("C1", {Person("p1", "Gina")})}));
        Workspace before = store.workspace();

        std::atomic<bool> cancelled{true};
        bool aborted = false;
        try {
            store.appendBatch(Batch({Chunk("C2", {Person("p1", "Hank")})}, 1), &cancelled);
        } catch (const BatchAborted&) {
            aborted = true;
        }
        assert(aborted);
        assert(store.workspace() == before);
        std::cout << "[PASS] Cancelled batch has no effect." << std::endl;
    }

    // Single writer
    {
        auto gate = std::make_shared<GateOracle>();
        ResolverSettings settings;
        settings.oracleTimeout = std::chrono::milliseconds(0);
        WorkspaceStore store(Workspace("family"), EntityResolver(gate, settings), 2);
        store.appendBatch(Batch({Chunk("C1", {Person("p1", "Ivy")})}));

        std::thread writer([&store] { store.appendBatch(Batch({Chunk("C2", {Person("p1", "Jack")})}, 1)); });
        while (!gate->entered) std::this_thread::sleep_for(std::chrono::milliseconds(1));

        bool rejected = false;
        try {
            store.appendBatch(Batch({Chunk("C3", {Person("p1", "Kim")})}, 2));
        } catch (const ConcurrentBatchError&) {
            rejected = true;
        }
        bool replaceRejected = false;
        try {
            store.replaceWorkspace(Workspace("family"));
        } catch (const ConcurrentBatchError&) {
            replaceRejected = true;
        }
        assert(store.statistics().entities == 1 && "Readers see the last committed state.");
        gate->released = true;
        writer.join();

        assert(rejected && replaceRejected);
        assert(store.statistics().entities == 2);
        std::cout << "[PASS] Concurrent batches are refused." << std::endl;
    }

    // Queries, answers and dropped questions
    {
        WorkspaceStore store = MakeStore();
        auto c1 = Chunk("C1", {Person("p1", "Ann Lee", {"wife", "applicant"}), Person("p2", "Bob Lee", {"husband"}),
                               Typed("t1", "date", "2015-06-01"), Typed("t2", "temporal", "2009-05-20"),
                               Typed("l1", "place", "Leeds")});
        CandidateState status;
        status.key = "marital_status";
        status.value = "Separated";
        status.rawTimestamp = "2015-06-01";
        c1.entities[0].states.push_back(status);
        c1.events.push_back(MakeEvent("filed", "p1", {"p2"}, std::string("t1"), std::string("l1")));
        c1.events.push_back(MakeEvent("married", "p1", {"p2"}, std::string("t2")));
        CandidateQuestion where;
        where.subjectRef = "p2";
        where.text = "Where does Bob live?";
        CandidateQuestion prenup;
        prenup.text = "Was there a prenuptial agreement?";
        c1.questions = {where, prenup};
        store.appendBatch(Batch({c1}));

        assert(store.unansweredQuestions().size() == 2);
        auto c2 = Chunk("C2", {Person("p1", "Bob Lee", {"respondent"})});
        c2.answers = {{"Q1", "In Leeds"}, {"Q2", "   "}, {"Q99", "No idea"}};
        c2.droppedQuestionIds = {"Q2"};
        MergeReport report = store.appendBatch(Batch({c2}, 1));
        assert(report.answeredQuestions == 1 && report.droppedQuestions == 1);
        assert(report.malformedCandidates == 2);
        assert(store.unansweredQuestions().empty());

        auto bob = store.queryByEntity("E2");
        assert(bob && bob->questions.size() == 1 && bob->questions[0].answer == std::optional<std::string>("In Leeds"));
        assert(bob->events.size() == 2);
        assert(!store.queryByEntity("E404").has_value());

        auto c1View = store.queryByCase("C1");
        assert(c1View.entities.size() == 5 && c1View.events.size() == 2 && c1View.questions.size() == 1);
        auto c2View = store.queryByCase("C2");
        assert(c2View.entities.size() == 1 && c2View.entities[0].id == "E2");
        assert(c2View.questions.size() == 1 && "Answered in C2.");

        assert(store.queryByRole("APPLIC").size() == 1);
        assert(store.queryByRole("husband")[0].id == "E2");
        assert(store.queryByState("Marital_Status").size() == 1);
        assert(store.queryByState("marital_status", std::string("separated")).size() == 1);
        assert(store.queryByState("marital_status", std::string("married")).empty());

        auto timeline = store.timeline();
        assert(timeline.size() == 2 && timeline[0].verb == "married" && timeline[1].verb == "filed");

        auto stats = store.statistics();
        assert(stats.entities == 5 && stats.entitiesByType["person"] == 2 && stats.entitiesByType["temporal"] == 2);
        assert(stats.events == 2 && stats.questions == 1 && stats.answeredQuestions == 1);

        auto top = store.ontologySummary(1);
        assert(top.size() == 1 && top[0].kind == TermKind::EntityType && top[0].term == "person" && top[0].count == 3);
        std::string context = store.ontologyContext(5);
        assert(context.find("Roles[4]{term,count}") != std::string::npos);
        assert(context.find("Verbs[2]{term,count}") != std::string::npos);
        assert(context.find("marital_status,1") != std::string::npos);
        std::cout << "[PASS] Queries over the committed workspace." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
