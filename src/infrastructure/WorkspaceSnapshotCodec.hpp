/**
 * @file WorkspaceSnapshotCodec.hpp
 * @brief Maps a Workspace to TOON tables and back.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Workspace.hpp"
#include "infrastructure/ToonCodec.hpp"

namespace casegraph::infrastructure {

/**
 * @class WorkspaceSnapshotCodec
 * @brief Snapshot layout: Meta, Entities, Aliases, Roles, Cases, States, Events, Questions,
 * Ontology, Vocabulary. The Meta table carries the schema tag.
 */
class WorkspaceSnapshotCodec {
public:
    static constexpr const char* kSchemaTag = "casegraph.workspace/1";

    /** @brief Byte-identical output for equal workspaces. */
    static std::string Encode(const domain::Workspace& workspace);

    /**
     * @brief Rebuilds a workspace from snapshot bytes. Nothing is returned on failure.
     * @throws domain::SnapshotSchemaMismatch if the schema tag differs.
     * @throws domain::SnapshotFormatError on any structural damage.
     */
    static domain::Workspace Decode(const std::string& bytes);

    static std::vector<ToonTable> ToTables(const domain::Workspace& workspace);
    static domain::Workspace FromTables(const std::vector<ToonTable>& tables);
};

} // namespace casegraph::infrastructure
