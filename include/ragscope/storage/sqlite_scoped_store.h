#pragma once

#include <ragscope/metadata/database.h>
#include <ragscope/storage/scoped_store.h>

#include <mutex>

namespace ragscope::storage {

/**
 * SQLite-backed scoped store. Every table carries (folder_id, owner_id) and
 * every query filters on both columns.
 */
class SqliteScopedStore : public IScopedStore {
public:
    SqliteScopedStore() = default;
    ~SqliteScopedStore() override;

    SqliteScopedStore(const SqliteScopedStore&) = delete;
    SqliteScopedStore& operator=(const SqliteScopedStore&) = delete;

    // Opens (creating if needed) the database and applies the schema.
    // ":memory:" gives a private in-memory database, useful in tests.
    Result<void> open(const std::string& path);
    void close();
    bool isOpen() const;

    std::string backendName() const override { return "sqlite"; }

    Result<void> putDocument(const Document& document) override;
    Result<Document> getDocument(const Scope& scope, const std::string& id) override;
    Result<std::vector<Document>> listDocuments(const Scope& scope) override;
    Result<void> deleteDocument(const Scope& scope, const std::string& id) override;

    Result<void> putChunk(const Chunk& chunk) override;
    Result<Chunk> getChunk(const Scope& scope, const std::string& id) override;
    Result<std::vector<Chunk>> listChunks(const Scope& scope) override;
    Result<std::vector<Chunk>> listChunksByDocument(const Scope& scope,
                                                    const std::string& documentId) override;
    Result<size_t> deleteChunksByDocument(const Scope& scope,
                                          const std::string& documentId) override;

    Result<void> putEmbedding(const EmbeddingRecord& embedding) override;
    Result<EmbeddingRecord> getEmbedding(const Scope& scope, const std::string& chunkId) override;
    Result<std::vector<EmbeddingRecord>> listEmbeddings(const Scope& scope) override;
    Result<size_t> deleteEmbeddingsByDocument(const Scope& scope,
                                              const std::string& documentId) override;

    Result<void> putGraph(const KnowledgeGraph& graph) override;
    Result<KnowledgeGraph> getGraph(const Scope& scope) override;
    Result<void> deleteGraph(const Scope& scope) override;

    Result<void> deleteScope(const Scope& scope) override;

private:
    Result<void> ensureSchema();
    Result<void> requireOpen() const;

    mutable std::mutex mutex_;
    metadata::Database db_;
};

} // namespace ragscope::storage
