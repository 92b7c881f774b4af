#pragma once

#include <ragscope/core/scope.h>
#include <ragscope/core/types.h>
#include <ragscope/storage/scoped_store.h>

#include <memory>
#include <string>
#include <vector>

namespace ragscope::vector {

/**
 * Cosine similarity dot(a,b) / (|a|·|b|).
 * Mismatched dimensions are an InvalidArgument; a zero-magnitude operand is a
 * ComputationError.
 */
Result<double> cosineSimilarity(const Embedding& a, const Embedding& b);

struct SearchResult {
    storage::Chunk chunk;
    double similarity = 0.0;
};

/**
 * Scoped nearest-neighbour lookup over stored chunk vectors. Only embeddings
 * whose scope matches both folder and owner of the request are candidates.
 */
class IVectorIndex {
public:
    virtual ~IVectorIndex() = default;

    /**
     * Top-k chunks by descending similarity to the query. k <= 0 or an empty
     * scope yields an empty result. Ties are unordered.
     */
    virtual Result<std::vector<SearchResult>> search(const Scope& scope, const Embedding& query,
                                                     int k) = 0;

    virtual std::string getIndexName() const = 0;
};

/**
 * Exhaustive scan over a scope's embeddings, O(n) per query. Stored vectors
 * with zero magnitude or the wrong dimension are skipped with a warning, as
 * are embeddings whose chunk no longer exists.
 */
class FlatVectorIndex : public IVectorIndex {
public:
    explicit FlatVectorIndex(std::shared_ptr<storage::IScopedStore> store);

    Result<std::vector<SearchResult>> search(const Scope& scope, const Embedding& query,
                                             int k) override;

    std::string getIndexName() const override { return "flat"; }

private:
    std::shared_ptr<storage::IScopedStore> store_;
};

} // namespace ragscope::vector
