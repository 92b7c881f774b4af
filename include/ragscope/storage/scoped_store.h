#pragma once

#include <ragscope/core/scope.h>
#include <ragscope/core/types.h>
#include <ragscope/storage/entities.h>

#include <memory>
#include <string>
#include <vector>

namespace ragscope::storage {

/**
 * Scoped persistent store for documents, chunks, embeddings and graphs.
 *
 * Every lookup is qualified by the scope it was issued for. An id that exists
 * under a different scope is reported as NotFound, never returned. Writes
 * reject malformed scopes with ValidationError. Implementations must be safe
 * for concurrent callers.
 */
class IScopedStore {
public:
    virtual ~IScopedStore() = default;

    virtual std::string backendName() const = 0;

    // Documents
    virtual Result<void> putDocument(const Document& document) = 0;
    virtual Result<Document> getDocument(const Scope& scope, const std::string& id) = 0;
    virtual Result<std::vector<Document>> listDocuments(const Scope& scope) = 0;
    virtual Result<void> deleteDocument(const Scope& scope, const std::string& id) = 0;

    // Chunks
    virtual Result<void> putChunk(const Chunk& chunk) = 0;
    virtual Result<Chunk> getChunk(const Scope& scope, const std::string& id) = 0;
    virtual Result<std::vector<Chunk>> listChunks(const Scope& scope) = 0;
    virtual Result<std::vector<Chunk>> listChunksByDocument(const Scope& scope,
                                                            const std::string& documentId) = 0;
    virtual Result<size_t> deleteChunksByDocument(const Scope& scope,
                                                  const std::string& documentId) = 0;

    // Embeddings (keyed by chunk id)
    virtual Result<void> putEmbedding(const EmbeddingRecord& embedding) = 0;
    virtual Result<EmbeddingRecord> getEmbedding(const Scope& scope,
                                                 const std::string& chunkId) = 0;
    virtual Result<std::vector<EmbeddingRecord>> listEmbeddings(const Scope& scope) = 0;
    virtual Result<size_t> deleteEmbeddingsByDocument(const Scope& scope,
                                                      const std::string& documentId) = 0;

    // Knowledge graph, one per scope
    virtual Result<void> putGraph(const KnowledgeGraph& graph) = 0;
    virtual Result<KnowledgeGraph> getGraph(const Scope& scope) = 0;
    virtual Result<void> deleteGraph(const Scope& scope) = 0;

    // Removes everything stored under the scope
    virtual Result<void> deleteScope(const Scope& scope) = 0;
};

enum class StoreBackend { Sqlite, Memory };

/**
 * Creates the store for the requested backend. The sqlite backend opens (and
 * creates if needed) the database at path; the memory backend ignores path.
 */
Result<std::shared_ptr<IScopedStore>> createScopedStore(StoreBackend backend,
                                                        const std::string& path = {});

Result<StoreBackend> storeBackendFromString(const std::string& value);

} // namespace ragscope::storage
