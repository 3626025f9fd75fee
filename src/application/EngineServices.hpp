/**
 * @file EngineServices.hpp
 * @brief Container for the services of one domain run, and the wiring that builds it.
 */

#pragma once

#include <memory>
#include <string>
#include "application/IngestionService.hpp"
#include "application/ModeController.hpp"
#include "domain/ExtractionSupplier.hpp"
#include "domain/SimilarityOracle.hpp"
#include "domain/SourceDocument.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileWorkspacePersister.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace casegraph::application {

/** Members are declared so that dependents are destroyed first. */
struct EngineServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<infrastructure::FileWorkspacePersister> persister;
    std::unique_ptr<ModeController> modeController;
    std::unique_ptr<IngestionService> ingestionService;
};

/**
 * @brief Loads the durable snapshot and cursor of @p domain and wires a run around them.
 *
 * A calibration run starts from the same durable state as production would, but gets the no-op
 * persister. A null @p oracle means exact alias matching only.
 * @throws domain::SnapshotSchemaMismatch, domain::SnapshotFormatError on an unusable snapshot.
 */
EngineServices BuildEngineServices(const infrastructure::EngineConfig& config,
                                   const std::string& domain,
                                   RunMode mode,
                                   std::shared_ptr<domain::SimilarityOracle> oracle,
                                   std::shared_ptr<domain::ExtractionSupplier> supplier,
                                   std::shared_ptr<domain::DocumentSource> source);

} // namespace casegraph::application
