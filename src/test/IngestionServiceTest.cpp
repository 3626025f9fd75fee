#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include "application/EngineServices.hpp"
#include "domain/Errors.hpp"
#include "test/TestDoubles.hpp"

using namespace casegraph::domain;
using namespace casegraph::application;
using casegraph::infrastructure::EngineConfig;
using casegraph::test::Chunk;
using casegraph::test::Person;
using casegraph::test::ScriptedSupplier;
using casegraph::test::Typed;
using casegraph::test::VectorDocumentSource;
namespace fs = std::filesystem;

static std::string ReadFile(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

// Reports documents it can no longer deliver.
class TruncatedDocumentSource : public DocumentSource {
public:
    size_t totalDocuments() const override { return 3; }
    std::vector<SourceDocument> fetch(size_t, size_t) const override { return {}; }
};

static std::shared_ptr<ScriptedSupplier> MakeSupplier() {
    auto supplier = std::make_shared<ScriptedSupplier>();

    auto zero = Chunk("", {Person("a", "Ann Lee", {"wife"})});
    CandidateQuestion remarried;
    remarried.subjectRef = "a";
    remarried.text = "Did Ann remarry?";
    zero.questions.push_back(remarried);
    supplier->set("doc zero", zero);

    auto one = Chunk("", {Person("b", "Ann Lee", {"applicant"}), Typed("c", "court", "Family Court")});
    CandidateEvent heard;
    heard.verb = "heard";
    heard.agentRef = "c";
    heard.patientRefs = {"b"};
    one.events.push_back(heard);
    supplier->set("doc one", one);

    auto two = Chunk("", {Person("x", "Bob Lee", {"husband"})});
    two.answers.push_back({"Q1", "No"});
    supplier->set("doc two", two);

    supplier->set("doc four", Chunk("", {Person("y", "Bob Lee")}));
    supplier->set("doc five", Chunk("", {Person("z", "Carl Poe", {"witness"})}));
    return supplier;
}

int main() {
    std::cout << "[Test] Starting Ingestion Service Test..." << std::endl;

    const fs::path dataDir = fs::temp_directory_path() / "casegraph_ingestion_test";
    fs::remove_all(dataDir);

    EngineConfig config;
    config.dataDir = dataDir.string();
    config.batchSize = 2;
    config.resolveWorkers = 2;

    auto source = std::make_shared<VectorDocumentSource>();
    source->add("C-A", "doc zero");
    source->add("C-B", "doc one");
    source->add("C-C", "doc two");
    source->add("C-D", "doc three");
    source->add("C-E", "doc four");
    auto supplier = MakeSupplier();

    // First production run stops after one batch
    {
        EngineServices services = BuildEngineServices(config, "family", RunMode::Production, nullptr, supplier, source);
        assert(services.modeController->cursor().lastCommittedIndex == 0);
        assert(services.modeController->cursor().totalDocuments == 5);

        int statusUpdates = 0;
        auto result = services.ingestionService->ingestNextBatch([&](const std::string&) { ++statusUpdates; });
        assert(result.committed && result.batches == 1 && result.documentsProcessed == 2);
        assert(result.errors.empty() && !result.exhausted);
        assert(result.report.newEntities == 2 && result.report.mergedEntities == 1);
        assert(result.report.newEvents == 1 && result.report.newQuestions == 1);
        assert(statusUpdates == 3);

        const WorkspaceStore& store = services.modeController->store();
        auto ann = store.queryByEntity("E1");
        assert(ann && (ann->entity.involvedCases == std::set<std::string>{"C-A", "C-B"}));
        assert(store.queryByCase("C-B").events.size() == 1);
        assert(supplier->calls == 2);

        assert(fs::exists(dataDir / "family_workspace.toon"));
        assert(fs::exists(dataDir / "family_state.json"));
        std::cout << "[PASS] One production batch is committed and persisted." << std::endl;
    }

    // Restart resumes at the cursor
    {
        EngineServices services = BuildEngineServices(config, "family", RunMode::Production, nullptr, supplier, source);
        assert(services.modeController->cursor().lastCommittedIndex == 2);
        assert(services.modeController->store().statistics().entities == 2);

        std::string context = services.ingestionService->extractionContext();
        assert(context.find("OpenQuestions[1]{id,subject,text}") != std::string::npos);
        assert(context.find("Q1,E1,Did Ann remarry?") != std::string::npos);
        assert(context.find("Roles[2]{term,count}") != std::string::npos);

        auto result = services.ingestionService->ingestPending();
        assert(supplier->lastContext.find("husband,1") != std::string::npos);
        assert(supplier->lastContext.find("OpenQuestions[0]{}") != std::string::npos);
        assert(result.committed && result.exhausted);
        assert(result.batches == 2 && result.documentsProcessed == 3);
        assert(result.extractionFailures == 1 && result.errors.size() == 1);
        assert(result.errors[0].find("document 3") != std::string::npos);
        assert(result.report.newEntities == 1 && result.report.mergedEntities == 1);
        assert(result.report.answeredQuestions == 1);
        assert(supplier->calls == 5);

        const WorkspaceStore& store = services.modeController->store();
        assert(store.statistics().entities == 3 && store.unansweredQuestions().empty());
        auto bob = store.queryByEntity("E3");
        assert(bob && (bob->entity.involvedCases == std::set<std::string>{"C-C", "C-E"}));
        assert(store.statistics().documentCount == 5);

        auto idle = services.ingestionService->ingestNextBatch();
        assert(idle.exhausted && idle.batches == 0);
        assert(supplier->calls == 5);

        auto onDisk = services.persister->stateTracker().load("family");
        assert(onDisk && onDisk->lastCommittedIndex == 5 && onDisk->totalDocuments == 5);
        std::cout << "[PASS] Restart processes exactly the remaining documents." << std::endl;
    }

    source->add("C-F", "doc five");
    const std::string snapshotBefore = ReadFile(dataDir / "family_workspace.toon");
    const std::string cursorBefore = ReadFile(dataDir / "family_state.json");

    // Calibration over the same durable state writes nothing
    MergeReport calibrationReport;
    {
        EngineServices services = BuildEngineServices(config, "family", RunMode::Calibration, nullptr, supplier, source);
        auto result = services.ingestionService->ingestPending();
        assert(result.committed && result.exhausted && result.documentsProcessed == 1);
        assert(services.modeController->store().statistics().entities == 4);
        calibrationReport = result.report;
        services.modeController->finish();
    }
    assert(ReadFile(dataDir / "family_workspace.toon") == snapshotBefore);
    assert(ReadFile(dataDir / "family_state.json") == cursorBefore);

    {
        EngineServices services = BuildEngineServices(config, "family", RunMode::Production, nullptr, supplier, source);
        assert(services.modeController->cursor().lastCommittedIndex == 5);
        auto result = services.ingestionService->ingestPending();
        assert(result.committed && result.report == calibrationReport);
        assert(ReadFile(dataDir / "family_workspace.toon") != snapshotBefore);
        std::cout << "[PASS] Calibration decides like production and persists nothing." << std::endl;
    }

    // A fresh domain in calibration leaves no files behind
    {
        EngineServices services = BuildEngineServices(config, "probate", RunMode::Calibration, nullptr, supplier, source);
        auto result = services.ingestionService->ingestNextBatch();
        assert(result.committed);
        assert(!fs::exists(dataDir / "probate_workspace.toon"));
        assert(!fs::exists(dataDir / "probate_state.json"));
    }

    // A source that stops delivering ends the run with an error
    {
        EngineServices services = BuildEngineServices(config, "truncated", RunMode::Production, nullptr, supplier,
                                                      std::make_shared<TruncatedDocumentSource>());
        const int callsBefore = supplier->calls;
        auto result = services.ingestionService->ingestPending();
        assert(!result.committed && !result.exhausted && result.batches == 0);
        assert(result.errors.size() == 1 && result.errors[0].find("index 0 of 3") != std::string::npos);
        assert(supplier->calls == callsBefore);
        assert(services.modeController->cursor().lastCommittedIndex == 0);
        assert(!fs::exists(dataDir / "truncated_workspace.toon"));
        std::cout << "[PASS] Missing documents stop ingestion." << std::endl;
    }

    // A snapshot filed under the wrong domain is refused
    {
        fs::copy_file(dataDir / "family_workspace.toon", dataDir / "other_workspace.toon");
        bool refused = false;
        try {
            BuildEngineServices(config, "other", RunMode::Production, nullptr, supplier, source);
        } catch (const SnapshotFormatError&) {
            refused = true;
        }
        assert(refused);
        std::cout << "[PASS] Start-up refuses unusable snapshots." << std::endl;
    }

    fs::remove_all(dataDir);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
