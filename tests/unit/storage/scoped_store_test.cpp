#include <gtest/gtest.h>
#include <ragscope/storage/entity_json.h>
#include <ragscope/storage/memory_scoped_store.h>
#include <ragscope/storage/sqlite_scoped_store.h>

#include "tests/support/temp_dir_scope.hpp"

#include <chrono>
#include <memory>
#include <string>

using namespace ragscope;
using namespace ragscope::storage;

namespace {

Document makeDocument(const std::string& id, const Scope& scope, const std::string& name) {
    Document doc;
    doc.id = id;
    doc.scope = scope;
    doc.name = name;
    doc.type = detectDocumentType(name);
    doc.content = "Content of " + name;
    doc.size = doc.content.size();
    doc.metadata.original_file = "/tmp/" + name;
    doc.metadata.mime_type = "text/plain";
    doc.created_at = fromEpochMillis(1700000000000);
    doc.updated_at = doc.created_at;
    return doc;
}

Chunk makeChunk(const std::string& id, const std::string& docId, const Scope& scope,
                size_t index) {
    Chunk chunk;
    chunk.id = id;
    chunk.document_id = docId;
    chunk.scope = scope;
    chunk.content = "chunk " + std::to_string(index);
    chunk.start_offset = index * 10;
    chunk.end_offset = index * 10 + 7;
    chunk.chunk_index = index;
    chunk.token_count = 2;
    chunk.metadata.document_name = docId + ".txt";
    chunk.created_at = fromEpochMillis(1700000000000);
    return chunk;
}

EmbeddingRecord makeEmbedding(const std::string& chunkId, const std::string& docId,
                              const Scope& scope) {
    EmbeddingRecord record;
    record.id = chunkId;
    record.document_id = docId;
    record.scope = scope;
    record.vector = {0.25f, -0.5f, 0.125f, 1.0f};
    record.model = "local-sentence-transformer";
    record.created_at = fromEpochMillis(1700000000000);
    return record;
}

} // namespace

class ScopedStoreTest : public ::testing::TestWithParam<StoreBackend> {
protected:
    void SetUp() override {
        auto store = createScopedStore(GetParam(), ":memory:");
        ASSERT_TRUE(store) << store.error().message;
        store_ = std::move(store).value();
    }

    std::shared_ptr<IScopedStore> store_;
    Scope alice_{1, "alice"};
    Scope bob_{1, "bob"};
    Scope aliceOther_{2, "alice"};
};

TEST_P(ScopedStoreTest, DocumentRoundTrip) {
    auto doc = makeDocument("d1", alice_, "invoice.md");
    ASSERT_TRUE(doc.metadata.extra.set("customer", std::string("acme")));
    ASSERT_TRUE(doc.metadata.extra.set("pages", int64_t{3}));
    ASSERT_TRUE(store_->putDocument(doc));

    auto loaded = store_->getDocument(alice_, "d1");
    ASSERT_TRUE(loaded) << loaded.error().message;
    const auto& d = loaded.value();
    EXPECT_EQ(d.name, "invoice.md");
    EXPECT_EQ(d.type, DocumentType::Markdown);
    EXPECT_EQ(d.content, doc.content);
    EXPECT_EQ(d.size, doc.size);
    EXPECT_EQ(d.scope, alice_);
    EXPECT_EQ(d.metadata.original_file, doc.metadata.original_file);
    EXPECT_EQ(d.metadata.extra, doc.metadata.extra);
    EXPECT_EQ(toEpochMillis(d.created_at), 1700000000000);
}

TEST_P(ScopedStoreTest, DocumentInvisibleFromOtherScopes) {
    ASSERT_TRUE(store_->putDocument(makeDocument("d1", alice_, "a.txt")));

    for (const auto& other : {bob_, aliceOther_}) {
        auto r = store_->getDocument(other, "d1");
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, ErrorCode::NotFound);

        auto list = store_->listDocuments(other);
        ASSERT_TRUE(list);
        EXPECT_TRUE(list.value().empty());
    }
}

TEST_P(ScopedStoreTest, DeleteFromWrongScopeLeavesDocument) {
    ASSERT_TRUE(store_->putDocument(makeDocument("d1", alice_, "a.txt")));

    auto wrong = store_->deleteDocument(bob_, "d1");
    ASSERT_FALSE(wrong);
    EXPECT_EQ(wrong.error().code, ErrorCode::NotFound);
    EXPECT_TRUE(store_->getDocument(alice_, "d1"));

    EXPECT_TRUE(store_->deleteDocument(alice_, "d1"));
    auto gone = store_->getDocument(alice_, "d1");
    ASSERT_FALSE(gone);
    EXPECT_EQ(gone.error().code, ErrorCode::NotFound);
}

TEST_P(ScopedStoreTest, MalformedScopeRejectedOnWrite) {
    auto doc = makeDocument("d1", Scope{-1, "alice"}, "a.txt");
    auto r = store_->putDocument(doc);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);

    auto chunk = makeChunk("c1", "d1", Scope{1, ""}, 0);
    auto rc = store_->putChunk(chunk);
    ASSERT_FALSE(rc);
    EXPECT_EQ(rc.error().code, ErrorCode::ValidationError);
}

TEST_P(ScopedStoreTest, ListDocumentsInCreationOrder) {
    auto first = makeDocument("z-first", alice_, "first.txt");
    auto second = makeDocument("a-second", alice_, "second.txt");
    second.created_at = first.created_at + std::chrono::seconds(5);
    ASSERT_TRUE(store_->putDocument(second));
    ASSERT_TRUE(store_->putDocument(first));
    ASSERT_TRUE(store_->putDocument(makeDocument("b1", bob_, "bob.txt")));

    auto list = store_->listDocuments(alice_);
    ASSERT_TRUE(list);
    ASSERT_EQ(list.value().size(), 2u);
    EXPECT_EQ(list.value()[0].id, "z-first");
    EXPECT_EQ(list.value()[1].id, "a-second");
}

TEST_P(ScopedStoreTest, ChunksByDocumentAreOrderedAndDeletable) {
    ASSERT_TRUE(store_->putChunk(makeChunk("c2", "d1", alice_, 2)));
    ASSERT_TRUE(store_->putChunk(makeChunk("c0", "d1", alice_, 0)));
    ASSERT_TRUE(store_->putChunk(makeChunk("c1", "d1", alice_, 1)));
    ASSERT_TRUE(store_->putChunk(makeChunk("x0", "d2", alice_, 0)));
    ASSERT_TRUE(store_->putChunk(makeChunk("b0", "d1", bob_, 0)));

    auto byDoc = store_->listChunksByDocument(alice_, "d1");
    ASSERT_TRUE(byDoc);
    ASSERT_EQ(byDoc.value().size(), 3u);
    for (size_t i = 0; i < 3; ++i)
        EXPECT_EQ(byDoc.value()[i].chunk_index, i);
    EXPECT_EQ(byDoc.value()[1].content, "chunk 1");
    EXPECT_EQ(byDoc.value()[1].start_offset, 10u);
    EXPECT_EQ(byDoc.value()[1].metadata.document_name, "d1.txt");

    auto deleted = store_->deleteChunksByDocument(alice_, "d1");
    ASSERT_TRUE(deleted);
    EXPECT_EQ(deleted.value(), 3u);

    auto remaining = store_->listChunks(alice_);
    ASSERT_TRUE(remaining);
    ASSERT_EQ(remaining.value().size(), 1u);
    EXPECT_EQ(remaining.value()[0].id, "x0");

    EXPECT_TRUE(store_->getChunk(bob_, "b0"));
}

TEST_P(ScopedStoreTest, EmbeddingVectorsSurviveStorage) {
    ASSERT_TRUE(store_->putEmbedding(makeEmbedding("c1", "d1", alice_)));

    auto loaded = store_->getEmbedding(alice_, "c1");
    ASSERT_TRUE(loaded) << loaded.error().message;
    EXPECT_EQ(loaded.value().vector, (Embedding{0.25f, -0.5f, 0.125f, 1.0f}));
    EXPECT_EQ(loaded.value().model, "local-sentence-transformer");
    EXPECT_EQ(loaded.value().dimensions(), 4u);

    auto other = store_->getEmbedding(bob_, "c1");
    ASSERT_FALSE(other);
    EXPECT_EQ(other.error().code, ErrorCode::NotFound);

    auto deleted = store_->deleteEmbeddingsByDocument(alice_, "d1");
    ASSERT_TRUE(deleted);
    EXPECT_EQ(deleted.value(), 1u);
    auto list = store_->listEmbeddings(alice_);
    ASSERT_TRUE(list);
    EXPECT_TRUE(list.value().empty());
}

TEST_P(ScopedStoreTest, KnowledgeGraphPerScope) {
    auto missing = store_->getGraph(alice_);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    KnowledgeGraph graph;
    graph.id = graphIdForScope(alice_);
    graph.scope = alice_;
    KnowledgeNode doc;
    doc.id = "d1";
    doc.type = NodeType::Document;
    doc.label = "a.txt";
    doc.document_ids = {"d1"};
    KnowledgeNode concept_node;
    concept_node.id = "c1-concept-invoice";
    concept_node.label = "invoice";
    concept_node.document_ids = {"d1"};
    concept_node.chunk_ids = {"c1"};
    graph.nodes = {doc, concept_node};
    graph.edges = {KnowledgeEdge{"e1", "d1", "c1-concept-invoice", EdgeType::Contains, 0.8f}};
    graph.document_count = 1;
    graph.created_at = fromEpochMillis(1700000000000);
    graph.updated_at = graph.created_at;
    ASSERT_TRUE(store_->putGraph(graph));

    auto loaded = store_->getGraph(alice_);
    ASSERT_TRUE(loaded) << loaded.error().message;
    ASSERT_EQ(loaded.value().nodes.size(), 2u);
    ASSERT_EQ(loaded.value().edges.size(), 1u);
    EXPECT_EQ(loaded.value().nodes[1].label, "invoice");
    EXPECT_EQ(loaded.value().nodes[1].chunk_ids, std::vector<std::string>{"c1"});
    EXPECT_EQ(loaded.value().edges[0].type, EdgeType::Contains);
    EXPECT_FLOAT_EQ(loaded.value().edges[0].weight, 0.8f);
    EXPECT_EQ(loaded.value().document_count, 1u);

    EXPECT_FALSE(store_->getGraph(bob_));

    ASSERT_TRUE(store_->deleteGraph(alice_));
    EXPECT_FALSE(store_->getGraph(alice_));
}

TEST_P(ScopedStoreTest, DeleteScopeOnlyTouchesThatScope) {
    for (const auto& scope : {alice_, bob_}) {
        const std::string suffix = scope.owner_id;
        ASSERT_TRUE(store_->putDocument(makeDocument("d-" + suffix, scope, "a.txt")));
        ASSERT_TRUE(store_->putChunk(makeChunk("c-" + suffix, "d-" + suffix, scope, 0)));
        ASSERT_TRUE(store_->putEmbedding(makeEmbedding("c-" + suffix, "d-" + suffix, scope)));
    }

    ASSERT_TRUE(store_->deleteScope(alice_));

    EXPECT_TRUE(store_->listDocuments(alice_).value().empty());
    EXPECT_TRUE(store_->listChunks(alice_).value().empty());
    EXPECT_TRUE(store_->listEmbeddings(alice_).value().empty());

    EXPECT_EQ(store_->listDocuments(bob_).value().size(), 1u);
    EXPECT_EQ(store_->listChunks(bob_).value().size(), 1u);
    EXPECT_EQ(store_->listEmbeddings(bob_).value().size(), 1u);
}

TEST_P(ScopedStoreTest, IdOwnedByAnotherScopeCannotBeOverwritten) {
    ASSERT_TRUE(store_->putDocument(makeDocument("shared-id", alice_, "alice.txt")));
    ASSERT_TRUE(store_->putChunk(makeChunk("shared-chunk", "shared-id", alice_, 0)));
    ASSERT_TRUE(store_->putEmbedding(makeEmbedding("shared-chunk", "shared-id", alice_)));

    auto doc = store_->putDocument(makeDocument("shared-id", bob_, "bob.txt"));
    ASSERT_FALSE(doc);
    EXPECT_EQ(doc.error().code, ErrorCode::ValidationError);

    auto chunk = store_->putChunk(makeChunk("shared-chunk", "shared-id", bob_, 5));
    ASSERT_FALSE(chunk);
    EXPECT_EQ(chunk.error().code, ErrorCode::ValidationError);

    auto bobEmbedding = makeEmbedding("shared-chunk", "shared-id", bob_);
    bobEmbedding.vector = {1.0f, 0.0f, 0.0f, 0.0f};
    auto embedding = store_->putEmbedding(bobEmbedding);
    ASSERT_FALSE(embedding);
    EXPECT_EQ(embedding.error().code, ErrorCode::ValidationError);

    auto kept = store_->getDocument(alice_, "shared-id");
    ASSERT_TRUE(kept);
    EXPECT_EQ(kept.value().name, "alice.txt");
    EXPECT_EQ(store_->getChunk(alice_, "shared-chunk").value().chunk_index, 0u);
    EXPECT_FLOAT_EQ(store_->getEmbedding(alice_, "shared-chunk").value().vector[0], 0.25f);

    EXPECT_FALSE(store_->getDocument(bob_, "shared-id"));
    EXPECT_TRUE(store_->listChunks(bob_).value().empty());
    EXPECT_TRUE(store_->listEmbeddings(bob_).value().empty());

    // Same scope rewrites are still allowed
    EXPECT_TRUE(store_->putDocument(makeDocument("shared-id", alice_, "renamed.txt")));
    EXPECT_EQ(store_->getDocument(alice_, "shared-id").value().name, "renamed.txt");
}

INSTANTIATE_TEST_SUITE_P(Backends, ScopedStoreTest,
                         ::testing::Values(StoreBackend::Memory, StoreBackend::Sqlite),
                         [](const ::testing::TestParamInfo<StoreBackend>& info) {
                             return info.param == StoreBackend::Memory ? std::string("Memory")
                                                                       : std::string("Sqlite");
                         });

// =============================================================================
// SQLite specifics
// =============================================================================

class SqliteScopedStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmp_ = std::make_unique<test_support::TempDirScope>(
            test_support::TempDirScope::unique_under("ragscope-store"));
        dbPath_ = tmp_->file("nested/dir/ragscope.db");
    }

    std::unique_ptr<test_support::TempDirScope> tmp_;
    std::filesystem::path dbPath_;
    Scope alice_{1, "alice"};
    Scope bob_{1, "bob"};
};

TEST_F(SqliteScopedStoreTest, FactoryCreatesParentDirectoriesAndPersists) {
    {
        auto store = createScopedStore(StoreBackend::Sqlite, dbPath_.string());
        ASSERT_TRUE(store) << store.error().message;
        EXPECT_EQ(store.value()->backendName(), "sqlite");
        ASSERT_TRUE(store.value()->putDocument(makeDocument("d1", alice_, "a.txt")));
    }
    EXPECT_TRUE(std::filesystem::exists(dbPath_));

    auto reopened = createScopedStore(StoreBackend::Sqlite, dbPath_.string());
    ASSERT_TRUE(reopened);
    auto doc = reopened.value()->getDocument(alice_, "d1");
    ASSERT_TRUE(doc);
    EXPECT_EQ(doc.value().name, "a.txt");
}

TEST_F(SqliteScopedStoreTest, ClosedStoreReportsStorageError) {
    SqliteScopedStore store;
    EXPECT_FALSE(store.isOpen());
    auto r = store.listDocuments(alice_);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::StorageError);
}

TEST(StoreFactoryTest, BackendNamesAreCaseInsensitive) {
    auto sqlite = storeBackendFromString("SQLite");
    ASSERT_TRUE(sqlite);
    EXPECT_EQ(sqlite.value(), StoreBackend::Sqlite);
    auto memory = storeBackendFromString("memory");
    ASSERT_TRUE(memory);
    EXPECT_EQ(memory.value(), StoreBackend::Memory);

    auto bad = storeBackendFromString("redis");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
}

TEST(StoreFactoryTest, SqliteNeedsAPath) {
    auto r = createScopedStore(StoreBackend::Sqlite, "");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}
