#include <ragscope/storage/memory_scoped_store.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>

namespace ragscope::storage {

namespace {

void sortChunks(std::vector<Chunk>& chunks) {
    std::sort(chunks.begin(), chunks.end(), [](const Chunk& a, const Chunk& b) {
        if (a.document_id != b.document_id)
            return a.document_id < b.document_id;
        return a.chunk_index < b.chunk_index;
    });
}

} // namespace

const MemoryScopedStore::Bucket* MemoryScopedStore::findBucket(const Scope& scope) const {
    auto it = buckets_.find(scope);
    return it == buckets_.end() ? nullptr : &it->second;
}

Result<void> MemoryScopedStore::putDocument(const Document& document) {
    if (auto v = validateScope(document.scope); !v)
        return v;
    if (document.id.empty())
        return Error{ErrorCode::ValidationError, "Document id must not be empty"};

    std::unique_lock lock(mutex_);
    if (ownedByOtherScope(document.scope, document.id, &Bucket::documents)) {
        return Error{ErrorCode::ValidationError,
                     "Document id " + document.id + " belongs to another scope"};
    }
    buckets_[document.scope].documents[document.id] = document;
    return {};
}

Result<Document> MemoryScopedStore::getDocument(const Scope& scope, const std::string& id) {
    std::shared_lock lock(mutex_);
    const auto* bucket = findBucket(scope);
    if (bucket) {
        auto it = bucket->documents.find(id);
        if (it != bucket->documents.end())
            return it->second;
    }
    return Error{ErrorCode::NotFound, "Document not found: " + id};
}

Result<std::vector<Document>> MemoryScopedStore::listDocuments(const Scope& scope) {
    std::shared_lock lock(mutex_);
    std::vector<Document> out;
    if (const auto* bucket = findBucket(scope)) {
        out.reserve(bucket->documents.size());
        for (const auto& [_, doc] : bucket->documents)
            out.push_back(doc);
    }
    std::sort(out.begin(), out.end(), [](const Document& a, const Document& b) {
        if (a.created_at != b.created_at)
            return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return out;
}

Result<void> MemoryScopedStore::deleteDocument(const Scope& scope, const std::string& id) {
    std::unique_lock lock(mutex_);
    auto it = buckets_.find(scope);
    if (it == buckets_.end() || it->second.documents.erase(id) == 0) {
        return Error{ErrorCode::NotFound, "Document not found: " + id};
    }
    return {};
}

Result<void> MemoryScopedStore::putChunk(const Chunk& chunk) {
    if (auto v = validateScope(chunk.scope); !v)
        return v;
    if (chunk.id.empty() || chunk.document_id.empty())
        return Error{ErrorCode::ValidationError, "Chunk id and document id are required"};

    std::unique_lock lock(mutex_);
    if (ownedByOtherScope(chunk.scope, chunk.id, &Bucket::chunks)) {
        return Error{ErrorCode::ValidationError,
                     "Chunk id " + chunk.id + " belongs to another scope"};
    }
    buckets_[chunk.scope].chunks[chunk.id] = chunk;
    return {};
}

Result<Chunk> MemoryScopedStore::getChunk(const Scope& scope, const std::string& id) {
    std::shared_lock lock(mutex_);
    const auto* bucket = findBucket(scope);
    if (bucket) {
        auto it = bucket->chunks.find(id);
        if (it != bucket->chunks.end())
            return it->second;
    }
    return Error{ErrorCode::NotFound, "Chunk not found: " + id};
}

Result<std::vector<Chunk>> MemoryScopedStore::listChunks(const Scope& scope) {
    std::shared_lock lock(mutex_);
    std::vector<Chunk> out;
    if (const auto* bucket = findBucket(scope)) {
        out.reserve(bucket->chunks.size());
        for (const auto& [_, chunk] : bucket->chunks)
            out.push_back(chunk);
    }
    sortChunks(out);
    return out;
}

Result<std::vector<Chunk>> MemoryScopedStore::listChunksByDocument(const Scope& scope,
                                                                   const std::string& documentId) {
    std::shared_lock lock(mutex_);
    std::vector<Chunk> out;
    if (const auto* bucket = findBucket(scope)) {
        for (const auto& [_, chunk] : bucket->chunks) {
            if (chunk.document_id == documentId)
                out.push_back(chunk);
        }
    }
    sortChunks(out);
    return out;
}

Result<size_t> MemoryScopedStore::deleteChunksByDocument(const Scope& scope,
                                                         const std::string& documentId) {
    std::unique_lock lock(mutex_);
    auto it = buckets_.find(scope);
    if (it == buckets_.end())
        return size_t{0};
    return static_cast<size_t>(std::erase_if(
        it->second.chunks, [&](const auto& kv) { return kv.second.document_id == documentId; }));
}

Result<void> MemoryScopedStore::putEmbedding(const EmbeddingRecord& embedding) {
    if (auto v = validateScope(embedding.scope); !v)
        return v;
    if (embedding.id.empty())
        return Error{ErrorCode::ValidationError, "Embedding id must not be empty"};

    std::unique_lock lock(mutex_);
    if (ownedByOtherScope(embedding.scope, embedding.id, &Bucket::embeddings)) {
        return Error{ErrorCode::ValidationError,
                     "Embedding id " + embedding.id + " belongs to another scope"};
    }
    buckets_[embedding.scope].embeddings[embedding.id] = embedding;
    return {};
}

Result<EmbeddingRecord> MemoryScopedStore::getEmbedding(const Scope& scope,
                                                        const std::string& chunkId) {
    std::shared_lock lock(mutex_);
    const auto* bucket = findBucket(scope);
    if (bucket) {
        auto it = bucket->embeddings.find(chunkId);
        if (it != bucket->embeddings.end())
            return it->second;
    }
    return Error{ErrorCode::NotFound, "Embedding not found: " + chunkId};
}

Result<std::vector<EmbeddingRecord>> MemoryScopedStore::listEmbeddings(const Scope& scope) {
    std::shared_lock lock(mutex_);
    std::vector<EmbeddingRecord> out;
    if (const auto* bucket = findBucket(scope)) {
        out.reserve(bucket->embeddings.size());
        for (const auto& [_, emb] : bucket->embeddings)
            out.push_back(emb);
    }
    return out;
}

Result<size_t> MemoryScopedStore::deleteEmbeddingsByDocument(const Scope& scope,
                                                             const std::string& documentId) {
    std::unique_lock lock(mutex_);
    auto it = buckets_.find(scope);
    if (it == buckets_.end())
        return size_t{0};
    return static_cast<size_t>(std::erase_if(
        it->second.embeddings, [&](const auto& kv) { return kv.second.document_id == documentId; }));
}

Result<void> MemoryScopedStore::putGraph(const KnowledgeGraph& graph) {
    if (auto v = validateScope(graph.scope); !v)
        return v;

    std::unique_lock lock(mutex_);
    buckets_[graph.scope].graph = graph;
    return {};
}

Result<KnowledgeGraph> MemoryScopedStore::getGraph(const Scope& scope) {
    std::shared_lock lock(mutex_);
    const auto* bucket = findBucket(scope);
    if (bucket && bucket->graph)
        return *bucket->graph;
    return Error{ErrorCode::NotFound, "No knowledge graph for scope " + scope.toString()};
}

Result<void> MemoryScopedStore::deleteGraph(const Scope& scope) {
    std::unique_lock lock(mutex_);
    auto it = buckets_.find(scope);
    if (it != buckets_.end())
        it->second.graph.reset();
    return {};
}

Result<void> MemoryScopedStore::deleteScope(const Scope& scope) {
    std::unique_lock lock(mutex_);
    if (buckets_.erase(scope) > 0) {
        spdlog::debug("MemoryScopedStore: dropped bucket for scope {}", scope.toString());
    }
    return {};
}

} // namespace ragscope::storage
