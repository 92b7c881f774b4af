#pragma once

#include <ragscope/context/context_assembler.h>
#include <ragscope/core/scope.h>
#include <ragscope/storage/scoped_store.h>
#include <ragscope/vector/embedding_provider.h>
#include <ragscope/vector/vector_index.h>

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ragscope::context {

struct FolderContextConfig {
    bool include_rag_data = true;
    size_t max_rag_tokens = 2000;
    double similarity_threshold = 0.7; // Chunks at or below are never included
    size_t max_conversation_tokens = 4000;
    size_t retrieval_candidates = 10;
};

// Partial update; unset fields keep their current value
struct FolderContextConfigUpdate {
    std::optional<bool> include_rag_data;
    std::optional<size_t> max_rag_tokens;
    std::optional<double> similarity_threshold;
    std::optional<size_t> max_conversation_tokens;
    std::optional<size_t> retrieval_candidates;
};

struct FolderStats {
    size_t document_count = 0;
    size_t total_chunks = 0;
    size_t total_tokens = 0;
    std::optional<TimePoint> last_updated;
};

struct RetrievalPreview {
    std::string content; // First 200 bytes, cut on a UTF-8 boundary, followed by "..."
    double similarity = 0.0;
    std::string source;
};

/**
 * Retrieved chunks rendered for prompt injection, plus what went into them.
 */
struct RetrievedContext {
    std::string text;
    std::vector<vector::SearchResult> included;
    size_t total_tokens = 0;
};

/**
 * Combines scoped retrieval with context assembly.
 *
 * Every call is bound to the scope it was invoked with: the query is embedded,
 * searched within exactly that (folder, owner) pair, and the surviving chunks
 * are spliced into the system prompt between scope-identifying delimiters
 * together with isolation instructions. Retrieval failures degrade to a prompt
 * stating that no folder resources are available.
 */
class FolderContextOrchestrator {
public:
    FolderContextOrchestrator(std::shared_ptr<storage::IScopedStore> store,
                              std::shared_ptr<vector::IEmbeddingProvider> embedder,
                              std::shared_ptr<vector::IVectorIndex> index,
                              FolderContextConfig defaults = {},
                              ContextAssembler assembler = ContextAssembler{});

    void setFolderConfig(const Scope& scope, const FolderContextConfigUpdate& update);
    FolderContextConfig getFolderConfig(const Scope& scope) const;
    const FolderContextConfig& getDefaultConfig() const { return defaults_; }

    // Drops the scope's override; later calls see the defaults again
    void clearFolderContext(const Scope& scope);

    /**
     * Embeds the query and returns the top-k chunks of the scope.
     */
    Result<std::vector<vector::SearchResult>> searchSimilarContent(const Scope& scope,
                                                                   const std::string& query,
                                                                   int k);

    /**
     * Ranked chunks accumulated in order until the next one would exceed
     * maxTokens. Chunks at or below the threshold are skipped.
     */
    Result<RetrievedContext> retrieveContext(const Scope& scope, const std::string& query,
                                             size_t maxTokens, double similarityThreshold,
                                             size_t candidates);

    // retrieveContext with the scope's configured threshold and candidate count
    Result<std::string> buildContextForQuery(const Scope& scope, const std::string& query,
                                             size_t maxTokens);

    Result<MessageContext> buildFolderContext(const Scope& scope,
                                              const std::vector<Message>& history,
                                              const std::string& query,
                                              const std::string& basePrompt,
                                              const TokenLimits& limits = {});

    std::string buildFolderSystemPrompt(const std::string& basePrompt, const Scope& scope,
                                        const std::string& ragContext) const;

    FolderStats getFolderStats(const Scope& scope);

    std::vector<RetrievalPreview> previewRetrieval(const Scope& scope, const std::string& query,
                                                   int limit = 3);

private:
    std::shared_ptr<storage::IScopedStore> store_;
    std::shared_ptr<vector::IEmbeddingProvider> embedder_;
    std::shared_ptr<vector::IVectorIndex> index_;
    FolderContextConfig defaults_;
    ContextAssembler assembler_;

    mutable std::shared_mutex configMutex_;
    std::unordered_map<Scope, FolderContextConfig> configs_;
};

} // namespace ragscope::context
