/**
 * @file EngineServices.cpp
 * @brief Wiring of one domain run.
 */

#include "application/EngineServices.hpp"
#include <iostream>
#include "domain/Errors.hpp"
#include "infrastructure/WorkspaceSnapshotCodec.hpp"

namespace casegraph::application {

EngineServices BuildEngineServices(const infrastructure::EngineConfig& config,
                                   const std::string& domain,
                                   RunMode mode,
                                   std::shared_ptr<domain::SimilarityOracle> oracle,
                                   std::shared_ptr<domain::ExtractionSupplier> supplier,
                                   std::shared_ptr<domain::DocumentSource> source) {
    EngineServices services;
    services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    services.persister =
        std::make_shared<infrastructure::FileWorkspacePersister>(config.workspacesDir(), services.persistenceService);

    domain::Workspace workspace(domain);
    if (auto bytes = services.persister->loadSnapshot(domain)) {
        workspace = infrastructure::WorkspaceSnapshotCodec::Decode(*bytes);
        if (workspace.domain() != domain) {
            throw domain::SnapshotFormatError("snapshot of '" + domain + "' is tagged '" + workspace.domain() + "'");
        }
        std::cout << "[EngineServices] Loaded '" << domain << "': " << workspace.entities().size()
                  << " entities, " << workspace.unansweredQuestions().size() << " open questions" << std::endl;
    } else {
        std::cout << "[EngineServices] New workspace for '" << domain << "'" << std::endl;
    }

    domain::IngestionCursor cursor = services.persister->stateTracker().loadOrCreate(domain, config.batchSize);
    if (source) cursor.totalDocuments = source->totalDocuments();

    domain::EntityResolver resolver(std::move(oracle), config.resolverSettings());
    services.modeController = std::make_unique<ModeController>(mode, std::move(workspace), std::move(resolver),
                                                               services.persister, cursor, config.resolveWorkers);
    services.ingestionService = std::make_unique<IngestionService>(std::move(source), std::move(supplier),
                                                                   *services.modeController, config.batchSize);
    return services;
}

} // namespace casegraph::application
