#pragma once

#include <ragscope/storage/scoped_store.h>

#include <map>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace ragscope::storage {

/**
 * In-memory store with the same shape and isolation rules as the SQLite one.
 * Data lives in one bucket per scope, so a scope can only ever see its own.
 */
class MemoryScopedStore : public IScopedStore {
public:
    MemoryScopedStore() = default;

    std::string backendName() const override { return "memory"; }

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
    struct Bucket {
        std::map<std::string, Document> documents;
        std::map<std::string, Chunk> chunks;
        std::map<std::string, EmbeddingRecord> embeddings;
        std::optional<KnowledgeGraph> graph;
    };

    const Bucket* findBucket(const Scope& scope) const;

    // True when id is already stored under a scope other than scope
    template <typename Map>
    bool ownedByOtherScope(const Scope& scope, const std::string& id, Map Bucket::*field) const {
        for (const auto& [owner, bucket] : buckets_) {
            if (owner != scope && (bucket.*field).count(id) > 0)
                return true;
        }
        return false;
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<Scope, Bucket> buckets_;
};

} // namespace ragscope::storage
