/**
 * FolderRagService
 *
 * Entry point for scoped document lifecycle, similarity search and prompt
 * context building. Documents are stored synchronously; chunking, embedding
 * and the knowledge-graph update then run on a background thread pool.
 * Completion is observable through getIngestStatus() or waitForIdle().
 */
#pragma once

#include <ragscope/chunking/document_chunker.h>
#include <ragscope/context/folder_context.h>
#include <ragscope/core/scope.h>
#include <ragscope/core/types.h>
#include <ragscope/graph/knowledge_graph_builder.h>
#include <ragscope/storage/scoped_store.h>
#include <ragscope/vector/embedding_provider.h>
#include <ragscope/vector/vector_index.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/thread_pool.hpp>

namespace ragscope::ingest {

enum class IngestState { Pending, Processing, Completed, Failed };

const char* ingestStateToString(IngestState state);

struct IngestStatus {
    Scope scope;
    IngestState state = IngestState::Pending;
    size_t chunks = 0;
    size_t embeddings = 0;
    size_t failed_chunks = 0;
    std::string error; // Last stage failure, empty when none
};

struct AddDocumentRequest {
    Scope scope;
    std::string name;
    std::string content;
    std::optional<storage::DocumentType> type; // Detected from name when unset
    std::optional<std::string> original_file;
    std::string mime_type;
    storage::ExtensionMap extra;
};

struct FolderRagServiceOptions {
    chunking::ChunkingConfig chunking;
    context::FolderContextConfig folder;
    std::size_t worker_threads = 2;
};

class FolderRagService {
public:
    /**
     * index may be null, in which case a FlatVectorIndex over store is used.
     */
    FolderRagService(std::shared_ptr<storage::IScopedStore> store,
                     std::shared_ptr<vector::IEmbeddingProvider> embedder,
                     FolderRagServiceOptions options = {},
                     std::shared_ptr<vector::IVectorIndex> index = nullptr);

    /// Stops accepting work and joins the pool.
    ~FolderRagService();

    FolderRagService(const FolderRagService&) = delete;
    FolderRagService& operator=(const FolderRagService&) = delete;

    // Idempotent. Queued jobs that have not started are marked Failed.
    void stop();

    // Lifecycle
    Result<storage::Document> addDocument(const AddDocumentRequest& request);
    Result<std::vector<storage::Document>> getDocuments(const Scope& scope);
    Result<void> deleteDocument(const Scope& scope, const std::string& documentId);
    Result<void> cleanupScope(const Scope& scope);

    // Search and context
    Result<std::vector<vector::SearchResult>> searchSimilarContent(const Scope& scope,
                                                                   const std::string& query,
                                                                   int k = 5);
    Result<std::string> buildContextForQuery(const Scope& scope, const std::string& query,
                                             size_t maxTokens = 2000);
    Result<context::MessageContext> buildFolderContext(const Scope& scope,
                                                       const std::vector<context::Message>& history,
                                                       const std::string& query,
                                                       const std::string& basePrompt,
                                                       const context::TokenLimits& limits = {});
    Result<storage::KnowledgeGraph> getKnowledgeGraph(const Scope& scope);

    // Background pipeline
    Result<IngestStatus> getIngestStatus(const std::string& documentId) const;
    bool waitForIdle(std::chrono::milliseconds timeout);

    struct Stats {
        std::uint64_t accepted{0};
        std::uint64_t processed{0};
        std::uint64_t failed{0};
    };
    Stats getStats() const;

    context::FolderContextOrchestrator& orchestrator() { return orchestrator_; }
    const chunking::SentenceWindowChunker& chunker() const { return chunker_; }

private:
    void runPipeline(const storage::Document& document);
    Result<void> updateGraph(const storage::Document& document,
                             const std::vector<storage::Chunk>& chunks);
    Result<void> pruneGraph(const Scope& scope, const std::string& documentId);
    void setStatus(const std::string& documentId, IngestStatus status);
    void finishJob();
    std::shared_ptr<std::mutex> graphMutexFor(const Scope& scope);

    std::shared_ptr<storage::IScopedStore> store_;
    std::shared_ptr<vector::IEmbeddingProvider> embedder_;
    std::shared_ptr<vector::IVectorIndex> index_;
    chunking::SentenceWindowChunker chunker_;
    graph::KnowledgeGraphBuilder graphBuilder_;
    context::FolderContextOrchestrator orchestrator_;

    boost::asio::thread_pool pool_;
    std::atomic<bool> stop_{false};
    std::atomic<std::uint64_t> accepted_{0};
    std::atomic<std::uint64_t> processed_{0};
    std::atomic<std::uint64_t> failed_{0};

    mutable std::mutex statusMutex_;
    std::condition_variable idleCv_;
    std::unordered_map<std::string, IngestStatus> statuses_;
    size_t inFlight_ = 0;

    std::mutex graphLocksMutex_;
    std::unordered_map<Scope, std::shared_ptr<std::mutex>> graphLocks_;
};

} // namespace ragscope::ingest
