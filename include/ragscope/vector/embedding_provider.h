#pragma once

#include <ragscope/core/types.h>

#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace ragscope::vector {

/**
 * Embedding model description
 */
struct ModelInfo {
    std::string model_id;
    size_t dimensions = 0;
    size_t max_input_tokens = 512;
    double cost_per_k_tokens = 0.0;

    bool validate() const { return !model_id.empty() && dimensions > 0; }
};

/**
 * Registry of known embedding models. Built-in models are registered on
 * construction; callers may add their own.
 */
class ModelRegistry {
public:
    ModelRegistry();

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;

    Result<void> registerModel(const ModelInfo& info);

    // Unknown model ids are a ValidationError
    Result<ModelInfo> getModel(const std::string& model_id) const;
    bool hasModel(const std::string& model_id) const;
    std::vector<ModelInfo> getAllModels() const;

    static constexpr const char* kDefaultModel = "local-sentence-transformer";

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, ModelInfo> models_;
};

// ============================================================================
// Abstract Embedding Provider Interface
// ============================================================================

/**
 * Text to fixed-dimension, unit-length vector. Callers rely only on the
 * dimension and normalization, never on how a provider derives its values.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    virtual Result<void> initialize() = 0;
    virtual void shutdown() = 0;
    virtual bool isInitialized() const = 0;

    /**
     * Generate embedding for a single text
     * @return Normalized vector of getEmbeddingDimension() floats, or error
     */
    virtual Result<Embedding> generateEmbedding(const std::string& text) = 0;

    virtual Result<std::vector<Embedding>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) = 0;

    virtual size_t getEmbeddingDimension() const = 0;
    virtual std::string getModelName() const = 0;
    virtual std::string getProviderName() const = 0;
};

/**
 * Deterministic pseudo-random unit vectors seeded from hash(text) ^ seed.
 * Identical text always maps to the identical vector for a given seed.
 */
class SeededEmbeddingProvider : public IEmbeddingProvider {
public:
    SeededEmbeddingProvider(ModelInfo model, uint64_t seed = 0);

    Result<void> initialize() override;
    void shutdown() override;
    bool isInitialized() const override { return initialized_; }

    Result<Embedding> generateEmbedding(const std::string& text) override;
    Result<std::vector<Embedding>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override;

    size_t getEmbeddingDimension() const override { return model_.dimensions; }
    std::string getModelName() const override { return model_.model_id; }
    std::string getProviderName() const override { return "seeded"; }

private:
    ModelInfo model_;
    uint64_t seed_;
    bool initialized_ = false;
};

/**
 * Bag-of-words feature hashing: lowercased alphanumeric tokens are hashed
 * into dimension buckets and the counts normalized. Texts sharing words
 * score higher. Needs no model files.
 */
class HashingEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(ModelInfo model);

    Result<void> initialize() override;
    void shutdown() override;
    bool isInitialized() const override { return initialized_; }

    Result<Embedding> generateEmbedding(const std::string& text) override;
    Result<std::vector<Embedding>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override;

    size_t getEmbeddingDimension() const override { return model_.dimensions; }
    std::string getModelName() const override { return model_.model_id; }
    std::string getProviderName() const override { return "hashing"; }

private:
    ModelInfo model_;
    bool initialized_ = false;
};

/**
 * Creates an initialized provider ("seeded" or "hashing") for a registry
 * model. Unknown provider or model names are a ValidationError.
 */
Result<std::unique_ptr<IEmbeddingProvider>>
createEmbeddingProvider(const std::string& provider, const std::string& model_id,
                        const ModelRegistry& registry, uint64_t seed = 0);

namespace embedding_utils {

double computeMagnitude(const Embedding& embedding);

/**
 * Normalize to unit length. A zero-magnitude vector cannot be normalized
 * and yields ComputationError.
 */
Result<Embedding> normalizeEmbedding(const Embedding& embedding);

/**
 * Validate embedding dimensions and values (finite, expected length)
 */
bool validateEmbedding(const Embedding& embedding, size_t expected_dim);

} // namespace embedding_utils

} // namespace ragscope::vector
