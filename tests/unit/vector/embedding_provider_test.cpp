#include <gtest/gtest.h>
#include <ragscope/vector/embedding_provider.h>
#include <ragscope/vector/vector_index.h>

#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace ragscope;
using namespace ragscope::vector;

// =============================================================================
// ModelRegistry
// =============================================================================

TEST(ModelRegistryTest, BuiltInModels) {
    ModelRegistry registry;

    auto small = registry.getModel("text-embedding-3-small");
    ASSERT_TRUE(small);
    EXPECT_EQ(small.value().dimensions, 1536u);
    EXPECT_EQ(small.value().max_input_tokens, 8192u);
    EXPECT_DOUBLE_EQ(small.value().cost_per_k_tokens, 0.00002);

    auto local = registry.getModel(ModelRegistry::kDefaultModel);
    ASSERT_TRUE(local);
    EXPECT_EQ(local.value().dimensions, 384u);
    EXPECT_EQ(local.value().max_input_tokens, 512u);
    EXPECT_DOUBLE_EQ(local.value().cost_per_k_tokens, 0.0);

    EXPECT_EQ(registry.getAllModels().size(), 2u);
}

TEST(ModelRegistryTest, UnknownModelIsValidationError) {
    ModelRegistry registry;
    auto missing = registry.getModel("no-such-model");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::ValidationError);
    EXPECT_FALSE(registry.hasModel("no-such-model"));
}

TEST(ModelRegistryTest, RegisterCustomModel) {
    ModelRegistry registry;
    EXPECT_FALSE(registry.registerModel(ModelInfo{"", 8, 512, 0.0}));
    EXPECT_FALSE(registry.registerModel(ModelInfo{"zero-dim", 0, 512, 0.0}));

    ASSERT_TRUE(registry.registerModel(ModelInfo{"tiny", 8, 128, 0.0}));
    auto tiny = registry.getModel("tiny");
    ASSERT_TRUE(tiny);
    EXPECT_EQ(tiny.value().dimensions, 8u);
}

// =============================================================================
// Providers
// =============================================================================

class EmbeddingProviderTest : public ::testing::Test {
protected:
    std::unique_ptr<IEmbeddingProvider> make(const std::string& provider, uint64_t seed = 0) {
        auto result = createEmbeddingProvider(provider, ModelRegistry::kDefaultModel, registry_, seed);
        EXPECT_TRUE(result) << provider;
        return result ? std::move(result).value() : nullptr;
    }

    ModelRegistry registry_;
};

TEST_F(EmbeddingProviderTest, FactoryRejectsUnknownNames) {
    auto badProvider = createEmbeddingProvider("onnx", ModelRegistry::kDefaultModel, registry_);
    ASSERT_FALSE(badProvider);
    EXPECT_EQ(badProvider.error().code, ErrorCode::ValidationError);

    auto badModel = createEmbeddingProvider("seeded", "no-such-model", registry_);
    ASSERT_FALSE(badModel);
    EXPECT_EQ(badModel.error().code, ErrorCode::ValidationError);
}

TEST_F(EmbeddingProviderTest, SeededIsDeterministicAndUnitLength) {
    auto provider = make("seeded", 42);
    ASSERT_NE(provider, nullptr);
    EXPECT_TRUE(provider->isInitialized());
    EXPECT_EQ(provider->getProviderName(), "seeded");
    EXPECT_EQ(provider->getModelName(), ModelRegistry::kDefaultModel);

    auto a = provider->generateEmbedding("the same text");
    auto b = provider->generateEmbedding("the same text");
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(a.value(), b.value());
    EXPECT_EQ(a.value().size(), provider->getEmbeddingDimension());
    EXPECT_NEAR(embedding_utils::computeMagnitude(a.value()), 1.0, 1e-5);

    auto other = provider->generateEmbedding("different text");
    ASSERT_TRUE(other);
    EXPECT_NE(a.value(), other.value());
}

TEST_F(EmbeddingProviderTest, SeededDependsOnSeed) {
    auto p1 = make("seeded", 1);
    auto p2 = make("seeded", 2);
    ASSERT_NE(p1, nullptr);
    ASSERT_NE(p2, nullptr);
    auto a = p1->generateEmbedding("hello");
    auto b = p2->generateEmbedding("hello");
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_NE(a.value(), b.value());
}

TEST_F(EmbeddingProviderTest, UninitializedProviderRefusesWork) {
    SeededEmbeddingProvider provider(ModelInfo{"tiny", 4, 16, 0.0});
    auto result = provider.generateEmbedding("text");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::NotInitialized);

    ASSERT_TRUE(provider.initialize());
    EXPECT_TRUE(provider.generateEmbedding("text"));
    provider.shutdown();
    EXPECT_FALSE(provider.isInitialized());
}

TEST_F(EmbeddingProviderTest, HashingRanksSharedVocabularyHigher) {
    auto provider = make("hashing");
    ASSERT_NE(provider, nullptr);

    auto query = provider->generateEmbedding("cat on the mat");
    auto related = provider->generateEmbedding("The cat sat on the mat.");
    auto unrelated = provider->generateEmbedding("Quarterly invoice totals");
    ASSERT_TRUE(query);
    ASSERT_TRUE(related);
    ASSERT_TRUE(unrelated);

    auto simRelated = cosineSimilarity(query.value(), related.value());
    auto simUnrelated = cosineSimilarity(query.value(), unrelated.value());
    ASSERT_TRUE(simRelated);
    ASSERT_TRUE(simUnrelated);
    EXPECT_GT(simRelated.value(), simUnrelated.value());
    EXPECT_NEAR(embedding_utils::computeMagnitude(related.value()), 1.0, 1e-5);
}

TEST_F(EmbeddingProviderTest, HashingIsCaseInsensitive) {
    auto provider = make("hashing");
    ASSERT_NE(provider, nullptr);
    auto lower = provider->generateEmbedding("invoice payment");
    auto upper = provider->generateEmbedding("INVOICE, Payment!");
    ASSERT_TRUE(lower);
    ASSERT_TRUE(upper);
    EXPECT_EQ(lower.value(), upper.value());
}

TEST_F(EmbeddingProviderTest, HashingRejectsTextWithoutTokens) {
    auto provider = make("hashing");
    ASSERT_NE(provider, nullptr);
    auto result = provider->generateEmbedding("!!! ...");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ComputationError);
}

TEST_F(EmbeddingProviderTest, BatchFailsOnFirstBadText) {
    auto provider = make("hashing");
    ASSERT_NE(provider, nullptr);
    auto ok = provider->generateBatchEmbeddings({"alpha", "beta"});
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value().size(), 2u);

    auto bad = provider->generateBatchEmbeddings({"alpha", "???"});
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::ComputationError);
}

// =============================================================================
// embedding_utils
// =============================================================================

TEST(EmbeddingUtilsTest, NormalizeRejectsZeroVector) {
    auto zero = embedding_utils::normalizeEmbedding(Embedding(4, 0.0f));
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().code, ErrorCode::ComputationError);

    auto unit = embedding_utils::normalizeEmbedding({3.0f, 4.0f});
    ASSERT_TRUE(unit);
    EXPECT_FLOAT_EQ(unit.value()[0], 0.6f);
    EXPECT_FLOAT_EQ(unit.value()[1], 0.8f);
}

TEST(EmbeddingUtilsTest, ValidateChecksDimensionAndFiniteness) {
    EXPECT_TRUE(embedding_utils::validateEmbedding({0.1f, 0.2f}, 2));
    EXPECT_FALSE(embedding_utils::validateEmbedding({0.1f, 0.2f}, 3));
    EXPECT_FALSE(embedding_utils::validateEmbedding(
        {0.1f, std::numeric_limits<float>::quiet_NaN()}, 2));
    EXPECT_FALSE(embedding_utils::validateEmbedding(
        {std::numeric_limits<float>::infinity(), 0.0f}, 2));
}
