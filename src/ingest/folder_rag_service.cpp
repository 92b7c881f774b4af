#include <ragscope/core/uuid.h>
#include <ragscope/ingest/folder_rag_service.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <boost/asio/post.hpp>

namespace ragscope::ingest {

namespace {

std::string mimeTypeFor(storage::DocumentType type) {
    switch (type) {
        case storage::DocumentType::Markdown:
            return "text/markdown";
        case storage::DocumentType::Json:
            return "application/json";
        case storage::DocumentType::Pdf:
            return "application/pdf";
        case storage::DocumentType::Url:
            return "text/uri-list";
        case storage::DocumentType::Code:
        case storage::DocumentType::Text:
            break;
    }
    return "text/plain";
}

std::shared_ptr<vector::IVectorIndex>
defaultIndex(std::shared_ptr<vector::IVectorIndex> index,
             const std::shared_ptr<storage::IScopedStore>& store) {
    if (index)
        return index;
    return std::make_shared<vector::FlatVectorIndex>(store);
}

} // namespace

const char* ingestStateToString(IngestState state) {
    switch (state) {
        case IngestState::Pending:
            return "pending";
        case IngestState::Processing:
            return "processing";
        case IngestState::Completed:
            return "completed";
        case IngestState::Failed:
            return "failed";
    }
    return "pending";
}

FolderRagService::FolderRagService(std::shared_ptr<storage::IScopedStore> store,
                                   std::shared_ptr<vector::IEmbeddingProvider> embedder,
                                   FolderRagServiceOptions options,
                                   std::shared_ptr<vector::IVectorIndex> index)
    : store_(std::move(store)), embedder_(std::move(embedder)),
      index_(defaultIndex(std::move(index), store_)), chunker_(options.chunking),
      orchestrator_(store_, embedder_, index_, options.folder),
      pool_(std::max<std::size_t>(1, options.worker_threads)) {
    spdlog::info("FolderRagService started: store={}, provider={}, index={}, workers={}",
                 store_->backendName(), embedder_->getProviderName(), index_->getIndexName(),
                 std::max<std::size_t>(1, options.worker_threads));
}

FolderRagService::~FolderRagService() {
    stop();
}

void FolderRagService::stop() {
    if (stop_.exchange(true))
        return;
    pool_.join();
    spdlog::debug("FolderRagService stopped: accepted={}, processed={}, failed={}",
                  accepted_.load(), processed_.load(), failed_.load());
}

// ============================================================================
// Lifecycle
// ============================================================================

Result<storage::Document> FolderRagService::addDocument(const AddDocumentRequest& request) {
    if (auto v = validateScope(request.scope); !v)
        return v.error();
    if (request.name.empty())
        return Error{ErrorCode::ValidationError, "Document name must not be empty"};
    if (stop_.load(std::memory_order_relaxed))
        return Error{ErrorCode::InvalidState, "FolderRagService is stopped"};

    storage::Document doc;
    doc.id = core::generateUUID();
    doc.scope = request.scope;
    doc.name = request.name;
    doc.type = request.type.value_or(storage::detectDocumentType(request.name));
    doc.content = request.content;
    doc.size = request.content.size();
    doc.metadata.original_file = request.original_file;
    doc.metadata.mime_type = request.mime_type.empty() ? mimeTypeFor(doc.type) : request.mime_type;
    doc.metadata.extra = request.extra;
    doc.created_at = std::chrono::system_clock::now();
    doc.updated_at = doc.created_at;

    if (auto r = store_->putDocument(doc); !r) {
        spdlog::error("addDocument: failed to store '{}' in scope {}: {}", doc.name,
                      doc.scope.toString(), r.error().message);
        return r.error();
    }
    spdlog::info("Stored document {} ('{}', {} bytes) in scope {}", doc.id, doc.name, doc.size,
                 doc.scope.toString());

    {
        std::lock_guard lock(statusMutex_);
        IngestStatus status;
        status.scope = doc.scope;
        statuses_[doc.id] = std::move(status);
        ++inFlight_;
    }
    accepted_.fetch_add(1, std::memory_order_relaxed);

    boost::asio::post(pool_, [this, job = doc]() {
        if (stop_.load(std::memory_order_relaxed)) {
            IngestStatus status;
            status.scope = job.scope;
            status.state = IngestState::Failed;
            status.error = "service stopped before processing";
            setStatus(job.id, std::move(status));
            failed_.fetch_add(1, std::memory_order_relaxed);
            finishJob();
            return;
        }
        try {
            runPipeline(job);
        } catch (const std::exception& e) {
            spdlog::error("Ingest pipeline for {} threw: {}", job.id, e.what());
            {
                // Counts already published by the pipeline are kept
                std::lock_guard lock(statusMutex_);
                auto& status = statuses_[job.id];
                status.scope = job.scope;
                status.state = IngestState::Failed;
                status.error = e.what();
            }
            failed_.fetch_add(1, std::memory_order_relaxed);
        }
        processed_.fetch_add(1, std::memory_order_relaxed);
        finishJob();
    });

    return doc;
}

Result<std::vector<storage::Document>> FolderRagService::getDocuments(const Scope& scope) {
    if (auto v = validateScope(scope); !v)
        return v.error();
    auto docs = store_->listDocuments(scope);
    if (!docs) {
        spdlog::warn("getDocuments: listing scope {} failed: {}", scope.toString(),
                     docs.error().message);
        return std::vector<storage::Document>{};
    }
    return docs;
}

Result<void> FolderRagService::deleteDocument(const Scope& scope, const std::string& documentId) {
    if (auto v = validateScope(scope); !v)
        return v;

    auto existing = store_->getDocument(scope, documentId);
    if (!existing)
        return existing.error();

    // Dependents before the document
    auto embeddings = store_->deleteEmbeddingsByDocument(scope, documentId);
    if (!embeddings)
        return embeddings.error();
    auto chunks = store_->deleteChunksByDocument(scope, documentId);
    if (!chunks)
        return chunks.error();
    if (auto r = pruneGraph(scope, documentId); !r)
        return r;
    if (auto r = store_->deleteDocument(scope, documentId); !r)
        return r;

    {
        std::lock_guard lock(statusMutex_);
        statuses_.erase(documentId);
    }
    spdlog::info("Deleted document {} from scope {} ({} chunks, {} embeddings)", documentId,
                 scope.toString(), chunks.value(), embeddings.value());
    return {};
}

Result<void> FolderRagService::cleanupScope(const Scope& scope) {
    if (auto v = validateScope(scope); !v)
        return v;

    {
        auto mtx = graphMutexFor(scope);
        std::lock_guard graphLock(*mtx);
        if (auto r = store_->deleteScope(scope); !r) {
            spdlog::error("cleanupScope: {} failed: {}", scope.toString(), r.error().message);
            return r;
        }
    }
    orchestrator_.clearFolderContext(scope);
    {
        std::lock_guard lock(statusMutex_);
        std::erase_if(statuses_, [&](const auto& kv) { return kv.second.scope == scope; });
    }
    spdlog::info("Cleaned up scope {}", scope.toString());
    return {};
}

// ============================================================================
// Search and context
// ============================================================================

Result<std::vector<vector::SearchResult>>
FolderRagService::searchSimilarContent(const Scope& scope, const std::string& query, int k) {
    if (auto v = validateScope(scope); !v)
        return v.error();
    auto results = orchestrator_.searchSimilarContent(scope, query, k);
    if (!results) {
        spdlog::warn("searchSimilarContent: scope {} degraded to empty: {}", scope.toString(),
                     results.error().message);
        return std::vector<vector::SearchResult>{};
    }
    return results;
}

Result<std::string> FolderRagService::buildContextForQuery(const Scope& scope,
                                                           const std::string& query,
                                                           size_t maxTokens) {
    if (auto v = validateScope(scope); !v)
        return v.error();
    auto text = orchestrator_.buildContextForQuery(scope, query, maxTokens);
    if (!text) {
        spdlog::warn("buildContextForQuery: scope {} degraded to empty: {}", scope.toString(),
                     text.error().message);
        return std::string{};
    }
    return text;
}

Result<context::MessageContext>
FolderRagService::buildFolderContext(const Scope& scope,
                                     const std::vector<context::Message>& history,
                                     const std::string& query, const std::string& basePrompt,
                                     const context::TokenLimits& limits) {
    return orchestrator_.buildFolderContext(scope, history, query, basePrompt, limits);
}

Result<storage::KnowledgeGraph> FolderRagService::getKnowledgeGraph(const Scope& scope) {
    if (auto v = validateScope(scope); !v)
        return v.error();
    return store_->getGraph(scope);
}

// ============================================================================
// Background pipeline
// ============================================================================

Result<IngestStatus> FolderRagService::getIngestStatus(const std::string& documentId) const {
    std::lock_guard lock(statusMutex_);
    auto it = statuses_.find(documentId);
    if (it == statuses_.end())
        return Error{ErrorCode::NotFound, "No ingest job for document " + documentId};
    return it->second;
}

bool FolderRagService::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(statusMutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return inFlight_ == 0; });
}

FolderRagService::Stats FolderRagService::getStats() const {
    return {accepted_.load(std::memory_order_relaxed), processed_.load(std::memory_order_relaxed),
            failed_.load(std::memory_order_relaxed)};
}

void FolderRagService::setStatus(const std::string& documentId, IngestStatus status) {
    std::lock_guard lock(statusMutex_);
    statuses_[documentId] = std::move(status);
}

void FolderRagService::finishJob() {
    {
        std::lock_guard lock(statusMutex_);
        if (inFlight_ > 0)
            --inFlight_;
    }
    idleCv_.notify_all();
}

std::shared_ptr<std::mutex> FolderRagService::graphMutexFor(const Scope& scope) {
    std::lock_guard lock(graphLocksMutex_);
    auto& mtx = graphLocks_[scope];
    if (!mtx)
        mtx = std::make_shared<std::mutex>();
    return mtx;
}

void FolderRagService::runPipeline(const storage::Document& document) {
    IngestStatus status;
    status.scope = document.scope;
    status.state = IngestState::Processing;
    setStatus(document.id, status);

    auto chunked = chunker_.chunkDocument(document);
    if (!chunked) {
        spdlog::error("Chunking document {} failed: {}", document.id, chunked.error().message);
        status.state = IngestState::Failed;
        status.error = chunked.error().message;
        setStatus(document.id, std::move(status));
        failed_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    std::vector<storage::Chunk> stored;
    stored.reserve(chunked.value().size());
    for (const auto& chunk : chunked.value()) {
        if (auto r = store_->putChunk(chunk); !r) {
            spdlog::error("Storing chunk {} of {} failed: {}", chunk.chunk_index, document.id,
                          r.error().message);
            ++status.failed_chunks;
            status.error = r.error().message;
            continue;
        }
        stored.push_back(chunk);

        auto vec = embedder_->generateEmbedding(chunk.content);
        if (!vec) {
            spdlog::error("Embedding chunk {} of {} failed: {}", chunk.chunk_index, document.id,
                          vec.error().message);
            ++status.failed_chunks;
            status.error = vec.error().message;
            continue;
        }
        if (!vector::embedding_utils::validateEmbedding(vec.value(),
                                                        embedder_->getEmbeddingDimension())) {
            spdlog::error("Embedding for chunk {} of {} has {} dims, expected {}",
                          chunk.chunk_index, document.id, vec.value().size(),
                          embedder_->getEmbeddingDimension());
            ++status.failed_chunks;
            status.error = "embedding dimension mismatch";
            continue;
        }

        storage::EmbeddingRecord record;
        record.id = chunk.id;
        record.document_id = document.id;
        record.scope = document.scope;
        record.vector = std::move(vec).value();
        record.model = embedder_->getModelName();
        record.created_at = std::chrono::system_clock::now();
        if (auto r = store_->putEmbedding(record); !r) {
            spdlog::error("Storing embedding for chunk {} of {} failed: {}", chunk.chunk_index,
                          document.id, r.error().message);
            ++status.failed_chunks;
            status.error = r.error().message;
            continue;
        }
        ++status.embeddings;
    }
    status.chunks = stored.size();
    setStatus(document.id, status);

    if (auto r = updateGraph(document, stored); !r) {
        spdlog::error("Knowledge graph update for {} failed: {}", document.id, r.error().message);
        status.error = r.error().message;
    }

    // A delete that raced the pipeline leaves nothing behind
    if (auto still = store_->getDocument(document.scope, document.id);
        !still && still.error().code == ErrorCode::NotFound) {
        spdlog::info("Document {} deleted during ingestion, discarding derived data", document.id);
        auto embeddings = store_->deleteEmbeddingsByDocument(document.scope, document.id);
        auto chunks = store_->deleteChunksByDocument(document.scope, document.id);
        auto pruned = pruneGraph(document.scope, document.id);
        if (!embeddings || !chunks || !pruned) {
            spdlog::warn("Derived data for deleted document {} was not fully removed",
                         document.id);
        }
        std::lock_guard lock(statusMutex_);
        statuses_.erase(document.id);
        return;
    }

    const bool failed = !chunked.value().empty() && stored.empty();
    status.state = failed ? IngestState::Failed : IngestState::Completed;
    if (failed)
        failed_.fetch_add(1, std::memory_order_relaxed);
    spdlog::info("Ingested document {}: {} chunks, {} embeddings, {} failures", document.id,
                 status.chunks, status.embeddings, status.failed_chunks);
    setStatus(document.id, std::move(status));
}

Result<void> FolderRagService::updateGraph(const storage::Document& document,
                                           const std::vector<storage::Chunk>& chunks) {
    auto fragment = graphBuilder_.buildDocumentGraph(document, chunks);

    auto mtx = graphMutexFor(document.scope);
    std::lock_guard lock(*mtx);

    storage::KnowledgeGraph graph;
    auto existing = store_->getGraph(document.scope);
    if (existing) {
        graph = std::move(existing).value();
    } else if (existing.error().code == ErrorCode::NotFound) {
        graph.id = storage::graphIdForScope(document.scope);
        graph.scope = document.scope;
        graph.created_at = std::chrono::system_clock::now();
    } else {
        return existing.error();
    }

    graph::KnowledgeGraphBuilder::merge(graph, std::move(fragment));
    return store_->putGraph(graph);
}

Result<void> FolderRagService::pruneGraph(const Scope& scope, const std::string& documentId) {
    auto mtx = graphMutexFor(scope);
    std::lock_guard lock(*mtx);

    auto existing = store_->getGraph(scope);
    if (!existing) {
        if (existing.error().code == ErrorCode::NotFound)
            return {};
        return existing.error();
    }
    auto graph = std::move(existing).value();
    if (graph::KnowledgeGraphBuilder::pruneDocument(graph, documentId) == 0)
        return {};
    graph.updated_at = std::chrono::system_clock::now();
    return store_->putGraph(graph);
}

} // namespace ragscope::ingest
