#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include "infrastructure/FileWorkspacePersister.hpp"
#include "infrastructure/IngestionStateTracker.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace casegraph::infrastructure;
using casegraph::domain::IngestionCursor;
namespace fs = std::filesystem;

static std::string ReadFile(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

static size_t CountTempFiles(const fs::path& dir) {
    size_t n = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() == ".tmp") ++n;
    }
    return n;
}

int main() {
    std::cout << "[Test] Starting Persistence Test..." << std::endl;

    const fs::path testRoot = fs::temp_directory_path() / "casegraph_persistence_test";
    fs::remove_all(testRoot);
    assert(PathUtils::EnsureDirectory(testRoot));

    // Atomic writes
    {
        auto persistence = std::make_shared<PersistenceService>();
        const fs::path target = testRoot / "nested" / "file.txt";
        assert(persistence->writeAtomic(target.string(), "first").get());
        assert(ReadFile(target) == "first");

        for (int i = 0; i < 20; ++i) {
            persistence->writeAtomic(target.string(), "version " + std::to_string(i));
        }
        assert(persistence->writeAtomic(target.string(), "final").get());
        assert(ReadFile(target) == "final" && "Writes land in submission order.");
        assert(CountTempFiles(target.parent_path()) == 0);

        std::ofstream(testRoot / "blocker") << "not a directory";
        assert(!persistence->writeAtomic((testRoot / "blocker" / "x.txt").string(), "data").get());

        persistence->stop();
        assert(!persistence->writeAtomic(target.string(), "too late").get());
        assert(ReadFile(target) == "final");
        std::cout << "[PASS] Atomic writes are confirmed, ordered and refused after stop." << std::endl;
    }

    // Cursor file
    {
        IngestionCursor cursor;
        cursor.domain = "family";
        cursor.lastCommittedIndex = 40;
        cursor.batchSize = 10;
        cursor.totalDocuments = 125;
        auto parsed = IngestionStateTracker::Deserialize(IngestionStateTracker::Serialize(cursor));
        assert(parsed && *parsed == cursor);
        assert(!cursor.exhausted());

        assert(!IngestionStateTracker::Deserialize("{not json").has_value());
        assert(!IngestionStateTracker::Deserialize(R"({"domain":"family"})").has_value());
        assert(!IngestionStateTracker::Deserialize(R"({"domain":"family","last_committed_index":-4})").has_value());
        auto minimal = IngestionStateTracker::Deserialize(R"({"domain":"family","last_committed_index":7})");
        assert(minimal && minimal->lastCommittedIndex == 7 && minimal->batchSize == 10);

        auto persistence = std::make_shared<PersistenceService>();
        IngestionStateTracker tracker(testRoot.string(), persistence);
        assert(!tracker.load("family").has_value());
        IngestionCursor fresh = tracker.loadOrCreate("family", 5);
        assert(fresh.lastCommittedIndex == 0 && fresh.batchSize == 5 && fresh.domain == "family");

        assert(tracker.save(cursor));
        assert(fs::exists(testRoot / "family_state.json"));
        auto loaded = tracker.load("family");
        assert(loaded && *loaded == cursor);
        IngestionCursor resumed = tracker.loadOrCreate("family", 20);
        assert(resumed.lastCommittedIndex == 40 && resumed.batchSize == 20);

        // A cursor copied under another domain's name is ignored
        fs::copy_file(testRoot / "family_state.json", testRoot / "probate_state.json");
        assert(!tracker.load("probate").has_value());

        std::ofstream(testRoot / "broken_state.json") << "{\"domain\": \"broken\", ";
        assert(tracker.loadOrCreate("broken", 3).lastCommittedIndex == 0);

        IngestionCursor done = cursor;
        done.lastCommittedIndex = 125;
        assert(done.exhausted());
        std::cout << "[PASS] Cursor file round trip and validation." << std::endl;
    }

    // Snapshot files
    {
        auto persistence = std::make_shared<PersistenceService>();
        FileWorkspacePersister persister((testRoot / "workspaces").string(), persistence);
        assert(persister.isDurable());
        assert(!persister.loadSnapshot("family").has_value());

        const std::string bytes = "Meta[1]{schema}\ncasegraph.workspace/1\n";
        assert(persister.persistSnapshot("family", bytes));
        assert(persister.snapshotPath("family") == (testRoot / "workspaces" / "family_workspace.toon").string());
        assert(persister.loadSnapshot("family") == std::optional<std::string>(bytes));

        IngestionCursor cursor;
        cursor.domain = "family";
        cursor.lastCommittedIndex = 3;
        assert(persister.persistCursor(cursor));
        assert(persister.stateTracker().load("family")->lastCommittedIndex == 3);

        persistence->stop();
        assert(!persister.persistSnapshot("family", "lost"));
        assert(persister.loadSnapshot("family") == std::optional<std::string>(bytes));

        FileWorkspacePersister detached((testRoot / "workspaces").string(), nullptr);
        assert(!detached.persistSnapshot("family", bytes) && !detached.persistCursor(cursor));
        std::cout << "[PASS] Snapshot persister writes and reads files." << std::endl;
    }

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
