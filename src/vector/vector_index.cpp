#include <ragscope/vector/embedding_provider.h>
#include <ragscope/vector/vector_index.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace ragscope::vector {

Result<double> cosineSimilarity(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size()) {
        return Error{ErrorCode::InvalidArgument, "Dimension mismatch: " + std::to_string(a.size()) +
                                                     " vs " + std::to_string(b.size())};
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }

    const double denom = std::sqrt(normA) * std::sqrt(normB);
    if (denom == 0.0)
        return Error{ErrorCode::ComputationError, "Cosine similarity of a zero-magnitude vector"};
    return dot / denom;
}

FlatVectorIndex::FlatVectorIndex(std::shared_ptr<storage::IScopedStore> store)
    : store_(std::move(store)) {}

Result<std::vector<SearchResult>> FlatVectorIndex::search(const Scope& scope,
                                                          const Embedding& query, int k) {
    if (auto v = validateScope(scope); !v)
        return v.error();
    if (k <= 0)
        return std::vector<SearchResult>{};
    if (query.empty() || embedding_utils::computeMagnitude(query) == 0.0)
        return Error{ErrorCode::ComputationError, "Query vector has zero magnitude"};

    auto embeddings = store_->listEmbeddings(scope);
    if (!embeddings)
        return embeddings.error();

    struct Candidate {
        const storage::EmbeddingRecord* record;
        double similarity;
    };
    std::vector<Candidate> candidates;
    candidates.reserve(embeddings.value().size());

    for (const auto& record : embeddings.value()) {
        if (record.scope != scope) {
            spdlog::error("FlatVectorIndex: store returned embedding {} from scope {} for {}",
                          record.id, record.scope.toString(), scope.toString());
            continue;
        }
        auto sim = cosineSimilarity(query, record.vector);
        if (!sim) {
            spdlog::warn("FlatVectorIndex: skipping embedding {}: {}", record.id,
                         sim.error().message);
            continue;
        }
        candidates.push_back({&record, sim.value()});
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const Candidate& a, const Candidate& b) { return a.similarity > b.similarity; });

    std::vector<SearchResult> results;
    for (const auto& candidate : candidates) {
        if (results.size() >= static_cast<size_t>(k))
            break;
        auto chunk = store_->getChunk(scope, candidate.record->id);
        if (!chunk) {
            // Chunk deleted after its embedding was listed
            spdlog::debug("FlatVectorIndex: chunk {} vanished, skipping", candidate.record->id);
            continue;
        }
        results.push_back({std::move(chunk).value(), candidate.similarity});
    }

    spdlog::debug("FlatVectorIndex: scope {} scanned {} vectors, returned {}", scope.toString(),
                  embeddings.value().size(), results.size());
    return results;
}

} // namespace ragscope::vector
