#include <ragscope/context/folder_context.h>
#include <ragscope/core/utf8.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <mutex>

namespace ragscope::context {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string wrapFolderContext(const Scope& scope, const std::string& text) {
    return "\n--- FOLDER CONTEXT (Folder ID: " + std::to_string(scope.folder_id) +
           ", Owner: " + scope.owner_id + ") ---\n" + text + "\n--- END FOLDER CONTEXT ---\n";
}

} // namespace

FolderContextOrchestrator::FolderContextOrchestrator(
    std::shared_ptr<storage::IScopedStore> store,
    std::shared_ptr<vector::IEmbeddingProvider> embedder,
    std::shared_ptr<vector::IVectorIndex> index, FolderContextConfig defaults,
    ContextAssembler assembler)
    : store_(std::move(store)), embedder_(std::move(embedder)), index_(std::move(index)),
      defaults_(defaults), assembler_(std::move(assembler)) {}

void FolderContextOrchestrator::setFolderConfig(const Scope& scope,
                                                const FolderContextConfigUpdate& update) {
    std::unique_lock lock(configMutex_);
    auto it = configs_.find(scope);
    FolderContextConfig config = it != configs_.end() ? it->second : defaults_;
    if (update.include_rag_data)
        config.include_rag_data = *update.include_rag_data;
    if (update.max_rag_tokens)
        config.max_rag_tokens = *update.max_rag_tokens;
    if (update.similarity_threshold)
        config.similarity_threshold = *update.similarity_threshold;
    if (update.max_conversation_tokens)
        config.max_conversation_tokens = *update.max_conversation_tokens;
    if (update.retrieval_candidates)
        config.retrieval_candidates = *update.retrieval_candidates;
    configs_[scope] = config;
}

FolderContextConfig FolderContextOrchestrator::getFolderConfig(const Scope& scope) const {
    std::shared_lock lock(configMutex_);
    auto it = configs_.find(scope);
    return it != configs_.end() ? it->second : defaults_;
}

void FolderContextOrchestrator::clearFolderContext(const Scope& scope) {
    std::unique_lock lock(configMutex_);
    configs_.erase(scope);
}

Result<std::vector<vector::SearchResult>>
FolderContextOrchestrator::searchSimilarContent(const Scope& scope, const std::string& query,
                                                int k) {
    if (auto v = validateScope(scope); !v)
        return v.error();
    if (k <= 0)
        return std::vector<vector::SearchResult>{};

    auto queryVector = embedder_->generateEmbedding(query);
    if (!queryVector)
        return queryVector.error();

    auto results = index_->search(scope, queryVector.value(), k);
    if (!results)
        return results.error();

    // Last line of defence against a backend ignoring the scope filter
    std::vector<vector::SearchResult> scoped;
    scoped.reserve(results.value().size());
    for (auto& r : std::move(results).value()) {
        if (r.chunk.scope != scope) {
            spdlog::error("Dropping chunk {} from scope {} in search for {}", r.chunk.id,
                          r.chunk.scope.toString(), scope.toString());
            continue;
        }
        scoped.push_back(std::move(r));
    }
    return scoped;
}

Result<RetrievedContext> FolderContextOrchestrator::retrieveContext(const Scope& scope,
                                                                    const std::string& query,
                                                                    size_t maxTokens,
                                                                    double similarityThreshold,
                                                                    size_t candidates) {
    const auto k = static_cast<int>(
        std::min<size_t>(candidates, static_cast<size_t>(std::numeric_limits<int>::max())));
    auto results = searchSimilarContent(scope, query, k);
    if (!results)
        return results.error();

    RetrievedContext retrieved;
    std::string text;
    for (auto& result : std::move(results).value()) {
        const size_t chunkTokens = result.chunk.token_count;
        if (retrieved.total_tokens + chunkTokens > maxTokens)
            break;
        if (result.similarity <= similarityThreshold)
            continue;
        text += "\n--- " + result.chunk.metadata.document_name + " ---\n" + result.chunk.content +
                "\n";
        retrieved.total_tokens += chunkTokens;
        retrieved.included.push_back(std::move(result));
    }
    retrieved.text = trim(text);
    return retrieved;
}

Result<std::string> FolderContextOrchestrator::buildContextForQuery(const Scope& scope,
                                                                    const std::string& query,
                                                                    size_t maxTokens) {
    const auto config = getFolderConfig(scope);
    auto retrieved = retrieveContext(scope, query, maxTokens, config.similarity_threshold,
                                     config.retrieval_candidates);
    if (!retrieved)
        return retrieved.error();
    return std::move(retrieved).value().text;
}

std::string FolderContextOrchestrator::buildFolderSystemPrompt(const std::string& basePrompt,
                                                               const Scope& scope,
                                                               const std::string& ragContext) const {
    std::string prompt = basePrompt;

    prompt += "\n\n## FOLDER CONTEXT ISOLATION\n";
    prompt += "You are working within a specific folder context (ID: " +
              std::to_string(scope.folder_id) + "). ";
    prompt += "IMPORTANT: Only use information from the provided folder context below. ";
    prompt += "Do not reference or contaminate this conversation with information from other "
              "folders or external sources.";

    if (!trim(ragContext).empty()) {
        prompt += "\n\n## AVAILABLE FOLDER RESOURCES\n";
        prompt += "The following resources are available in this folder for reference:";
        prompt += ragContext;
        prompt += "\n\nWhen answering questions, prioritize information from these folder "
                  "resources. ";
        prompt += "If the answer isn't in the provided resources, clearly state that the "
                  "information ";
        prompt += "is not available in the current folder context.";
    } else {
        prompt += "\n\nNo specific resources are available in this folder context. ";
        prompt += "Provide general assistance while noting that no folder-specific resources are "
                  "loaded.";
    }

    prompt += "\n\n## STRICT ISOLATION REQUIREMENT\n";
    prompt += "Maintain complete separation between this folder's context and any other "
              "conversations. ";
    prompt += "Each folder is an independent knowledge space with no cross-contamination.";
    return prompt;
}

Result<MessageContext> FolderContextOrchestrator::buildFolderContext(
    const Scope& scope, const std::vector<Message>& history, const std::string& query,
    const std::string& basePrompt, const TokenLimits& limits) {
    if (auto v = validateScope(scope); !v)
        return v.error();

    const auto config = getFolderConfig(scope);

    std::string ragContext;
    if (config.include_rag_data) {
        auto retrieved = retrieveContext(scope, query, config.max_rag_tokens,
                                         config.similarity_threshold, config.retrieval_candidates);
        if (!retrieved) {
            spdlog::warn("buildFolderContext: retrieval failed for scope {}: {}",
                         scope.toString(), retrieved.error().message);
        } else if (!retrieved.value().text.empty()) {
            spdlog::debug("buildFolderContext: scope {} injected {} chunks (~{} tokens)",
                          scope.toString(), retrieved.value().included.size(),
                          retrieved.value().total_tokens);
            ragContext = wrapFolderContext(scope, retrieved.value().text);
        }
    }

    const std::string systemPrompt = buildFolderSystemPrompt(basePrompt, scope, ragContext);

    TokenLimits folderLimits = limits;
    if (config.include_rag_data)
        folderLimits.reserve_tokens += config.max_rag_tokens;

    return assembler_.buildContext(history, systemPrompt, folderLimits);
}

FolderStats FolderContextOrchestrator::getFolderStats(const Scope& scope) {
    FolderStats stats;
    if (auto v = validateScope(scope); !v) {
        spdlog::warn("getFolderStats: {}", v.error().message);
        return stats;
    }

    auto documents = store_->listDocuments(scope);
    if (!documents) {
        spdlog::warn("getFolderStats: cannot list documents for {}: {}", scope.toString(),
                     documents.error().message);
        return stats;
    }
    stats.document_count = documents.value().size();

    auto chunks = store_->listChunks(scope);
    if (chunks) {
        stats.total_chunks = chunks.value().size();
        for (const auto& chunk : chunks.value())
            stats.total_tokens += chunk.token_count;
    } else {
        spdlog::warn("getFolderStats: cannot list chunks for {}: {}", scope.toString(),
                     chunks.error().message);
    }

    if (auto graph = store_->getGraph(scope)) {
        stats.last_updated = graph.value().updated_at;
    }
    return stats;
}

std::vector<RetrievalPreview> FolderContextOrchestrator::previewRetrieval(const Scope& scope,
                                                                          const std::string& query,
                                                                          int limit) {
    std::vector<RetrievalPreview> previews;
    auto results = searchSimilarContent(scope, query, limit);
    if (!results) {
        spdlog::warn("previewRetrieval: search failed for {}: {}", scope.toString(),
                     results.error().message);
        return previews;
    }
    for (const auto& result : results.value()) {
        RetrievalPreview preview;
        preview.content = std::string(core::utf8Prefix(result.chunk.content, 200)) + "...";
        preview.similarity = result.similarity;
        preview.source = result.chunk.metadata.document_name.empty()
                             ? "Unknown"
                             : result.chunk.metadata.document_name;
        previews.push_back(std::move(preview));
    }
    return previews;
}

} // namespace ragscope::context
