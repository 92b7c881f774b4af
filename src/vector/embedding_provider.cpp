#include <ragscope/core/uuid.h>
#include <ragscope/vector/embedding_provider.h>

#include <spdlog/spdlog.h>
#include <cctype>
#include <cmath>
#include <mutex>
#include <random>

namespace ragscope::vector {

// ============================================================================
// ModelRegistry
// ============================================================================

ModelRegistry::ModelRegistry() {
    models_["text-embedding-3-small"] = ModelInfo{"text-embedding-3-small", 1536, 8192, 0.00002};
    models_["local-sentence-transformer"] = ModelInfo{"local-sentence-transformer", 384, 512, 0.0};
}

Result<void> ModelRegistry::registerModel(const ModelInfo& info) {
    if (!info.validate()) {
        return Error{ErrorCode::ValidationError,
                     "Model needs an id and a positive dimension: '" + info.model_id + "'"};
    }
    std::unique_lock lock(mutex_);
    models_[info.model_id] = info;
    spdlog::debug("ModelRegistry: registered {} ({} dims)", info.model_id, info.dimensions);
    return {};
}

Result<ModelInfo> ModelRegistry::getModel(const std::string& model_id) const {
    std::shared_lock lock(mutex_);
    auto it = models_.find(model_id);
    if (it == models_.end())
        return Error{ErrorCode::ValidationError, "Unknown embedding model: " + model_id};
    return it->second;
}

bool ModelRegistry::hasModel(const std::string& model_id) const {
    std::shared_lock lock(mutex_);
    return models_.count(model_id) > 0;
}

std::vector<ModelInfo> ModelRegistry::getAllModels() const {
    std::shared_lock lock(mutex_);
    std::vector<ModelInfo> out;
    out.reserve(models_.size());
    for (const auto& [_, info] : models_)
        out.push_back(info);
    return out;
}

// ============================================================================
// embedding_utils
// ============================================================================

namespace embedding_utils {

double computeMagnitude(const Embedding& embedding) {
    double sum = 0.0;
    for (float v : embedding)
        sum += static_cast<double>(v) * static_cast<double>(v);
    return std::sqrt(sum);
}

Result<Embedding> normalizeEmbedding(const Embedding& embedding) {
    const double magnitude = computeMagnitude(embedding);
    if (magnitude == 0.0 || !std::isfinite(magnitude)) {
        return Error{ErrorCode::ComputationError, "Cannot normalize a zero-magnitude vector"};
    }
    Embedding out(embedding.size());
    for (size_t i = 0; i < embedding.size(); ++i)
        out[i] = static_cast<float>(embedding[i] / magnitude);
    return out;
}

bool validateEmbedding(const Embedding& embedding, size_t expected_dim) {
    if (embedding.size() != expected_dim)
        return false;
    for (float v : embedding) {
        if (!std::isfinite(v))
            return false;
    }
    return true;
}

} // namespace embedding_utils

// ============================================================================
// SeededEmbeddingProvider
// ============================================================================

SeededEmbeddingProvider::SeededEmbeddingProvider(ModelInfo model, uint64_t seed)
    : model_(std::move(model)), seed_(seed) {}

Result<void> SeededEmbeddingProvider::initialize() {
    if (!model_.validate())
        return Error{ErrorCode::ValidationError, "Invalid model for seeded provider"};
    initialized_ = true;
    spdlog::debug("SeededEmbeddingProvider ready: {} dims, seed {}", model_.dimensions, seed_);
    return {};
}

void SeededEmbeddingProvider::shutdown() {
    initialized_ = false;
}

Result<Embedding> SeededEmbeddingProvider::generateEmbedding(const std::string& text) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Seeded provider not initialized"};

    std::mt19937_64 gen(core::fnv1a64(text) ^ seed_);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    Embedding raw(model_.dimensions);
    for (auto& v : raw)
        v = dist(gen);
    return embedding_utils::normalizeEmbedding(raw);
}

Result<std::vector<Embedding>>
SeededEmbeddingProvider::generateBatchEmbeddings(const std::vector<std::string>& texts) {
    std::vector<Embedding> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        auto e = generateEmbedding(text);
        if (!e)
            return e.error();
        out.push_back(std::move(e).value());
    }
    return out;
}

// ============================================================================
// HashingEmbeddingProvider
// ============================================================================

HashingEmbeddingProvider::HashingEmbeddingProvider(ModelInfo model) : model_(std::move(model)) {}

Result<void> HashingEmbeddingProvider::initialize() {
    if (!model_.validate())
        return Error{ErrorCode::ValidationError, "Invalid model for hashing provider"};
    initialized_ = true;
    spdlog::debug("HashingEmbeddingProvider ready: {} buckets", model_.dimensions);
    return {};
}

void HashingEmbeddingProvider::shutdown() {
    initialized_ = false;
}

Result<Embedding> HashingEmbeddingProvider::generateEmbedding(const std::string& text) {
    if (!initialized_)
        return Error{ErrorCode::NotInitialized, "Hashing provider not initialized"};

    Embedding raw(model_.dimensions, 0.0f);
    std::string token;
    auto flush = [&]() {
        if (token.empty())
            return;
        raw[core::fnv1a64(token) % model_.dimensions] += 1.0f;
        token.clear();
    };
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            token.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();

    auto normalized = embedding_utils::normalizeEmbedding(raw);
    if (!normalized) {
        return Error{ErrorCode::ComputationError, "Text has no embeddable tokens"};
    }
    return normalized;
}

Result<std::vector<Embedding>>
HashingEmbeddingProvider::generateBatchEmbeddings(const std::vector<std::string>& texts) {
    std::vector<Embedding> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        auto e = generateEmbedding(text);
        if (!e)
            return e.error();
        out.push_back(std::move(e).value());
    }
    return out;
}

// ============================================================================
// Factory
// ============================================================================

Result<std::unique_ptr<IEmbeddingProvider>>
createEmbeddingProvider(const std::string& provider, const std::string& model_id,
                        const ModelRegistry& registry, uint64_t seed) {
    auto model = registry.getModel(model_id);
    if (!model)
        return model.error();

    std::unique_ptr<IEmbeddingProvider> instance;
    if (provider == "seeded") {
        instance = std::make_unique<SeededEmbeddingProvider>(model.value(), seed);
    } else if (provider == "hashing") {
        instance = std::make_unique<HashingEmbeddingProvider>(model.value());
    } else {
        return Error{ErrorCode::ValidationError, "Unknown embedding provider: " + provider};
    }

    if (auto r = instance->initialize(); !r)
        return r.error();
    spdlog::info("Embedding provider '{}' using model {} ({} dims)", provider, model_id,
                 instance->getEmbeddingDimension());
    return std::move(instance);
}

} // namespace ragscope::vector
