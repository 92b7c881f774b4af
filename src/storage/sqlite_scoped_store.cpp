#include <ragscope/storage/entity_json.h>
#include <ragscope/storage/sqlite_scoped_store.h>

#include <spdlog/spdlog.h>
#include <cstring>
#include <span>

namespace ragscope::storage {

using json = nlohmann::json;
using metadata::Statement;

namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS documents (
    id TEXT PRIMARY KEY,
    folder_id INTEGER NOT NULL,
    owner_id TEXT NOT NULL,
    name TEXT NOT NULL,
    type TEXT NOT NULL,
    content TEXT NOT NULL,
    size INTEGER NOT NULL,
    metadata TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_documents_scope ON documents(folder_id, owner_id);

CREATE TABLE IF NOT EXISTS chunks (
    id TEXT PRIMARY KEY,
    document_id TEXT NOT NULL,
    folder_id INTEGER NOT NULL,
    owner_id TEXT NOT NULL,
    content TEXT NOT NULL,
    start_offset INTEGER NOT NULL,
    end_offset INTEGER NOT NULL,
    chunk_index INTEGER NOT NULL,
    token_count INTEGER NOT NULL,
    metadata TEXT NOT NULL,
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_chunks_scope ON chunks(folder_id, owner_id);
CREATE INDEX IF NOT EXISTS idx_chunks_document ON chunks(document_id);

CREATE TABLE IF NOT EXISTS embeddings (
    id TEXT PRIMARY KEY,
    document_id TEXT NOT NULL,
    folder_id INTEGER NOT NULL,
    owner_id TEXT NOT NULL,
    vector BLOB NOT NULL,
    dimensions INTEGER NOT NULL,
    model TEXT NOT NULL,
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_embeddings_scope ON embeddings(folder_id, owner_id);
CREATE INDEX IF NOT EXISTS idx_embeddings_document ON embeddings(document_id);

CREATE TABLE IF NOT EXISTS knowledge_graphs (
    folder_id INTEGER NOT NULL,
    owner_id TEXT NOT NULL,
    id TEXT NOT NULL,
    body TEXT NOT NULL,
    document_count INTEGER NOT NULL,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL,
    PRIMARY KEY (folder_id, owner_id)
);
)SQL";

constexpr const char* kDocumentColumns =
    "id, folder_id, owner_id, name, type, content, size, metadata, created_at, updated_at";
constexpr const char* kChunkColumns = "id, document_id, folder_id, owner_id, content, "
                                      "start_offset, end_offset, chunk_index, token_count, "
                                      "metadata, created_at";
constexpr const char* kEmbeddingColumns =
    "id, document_id, folder_id, owner_id, vector, dimensions, model, created_at";

json parseJsonColumn(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        spdlog::warn("SqliteScopedStore: discarding malformed metadata column");
        return json::object();
    }
    return j;
}

Document readDocument(const Statement& stmt) {
    Document doc;
    doc.id = stmt.getString(0);
    doc.scope = Scope{stmt.getInt64(1), stmt.getString(2)};
    doc.name = stmt.getString(3);
    doc.type = documentTypeFromString(stmt.getString(4)).value_or(DocumentType::Text);
    doc.content = stmt.getString(5);
    doc.size = static_cast<size_t>(stmt.getInt64(6));
    doc.metadata = documentMetadataFromJson(parseJsonColumn(stmt.getString(7)));
    doc.created_at = fromEpochMillis(stmt.getInt64(8));
    doc.updated_at = fromEpochMillis(stmt.getInt64(9));
    return doc;
}

Chunk readChunk(const Statement& stmt) {
    Chunk chunk;
    chunk.id = stmt.getString(0);
    chunk.document_id = stmt.getString(1);
    chunk.scope = Scope{stmt.getInt64(2), stmt.getString(3)};
    chunk.content = stmt.getString(4);
    chunk.start_offset = static_cast<size_t>(stmt.getInt64(5));
    chunk.end_offset = static_cast<size_t>(stmt.getInt64(6));
    chunk.chunk_index = static_cast<size_t>(stmt.getInt64(7));
    chunk.token_count = static_cast<size_t>(stmt.getInt64(8));
    chunk.metadata = chunkMetadataFromJson(parseJsonColumn(stmt.getString(9)));
    chunk.created_at = fromEpochMillis(stmt.getInt64(10));
    return chunk;
}

EmbeddingRecord readEmbedding(const Statement& stmt) {
    EmbeddingRecord rec;
    rec.id = stmt.getString(0);
    rec.document_id = stmt.getString(1);
    rec.scope = Scope{stmt.getInt64(2), stmt.getString(3)};
    auto blob = stmt.getBlob(4);
    rec.vector.resize(blob.size() / sizeof(float));
    if (!rec.vector.empty()) {
        std::memcpy(rec.vector.data(), blob.data(), rec.vector.size() * sizeof(float));
    }
    rec.model = stmt.getString(6);
    rec.created_at = fromEpochMillis(stmt.getInt64(7));
    return rec;
}

// Runs a SELECT that binds (folder_id, owner_id[, extra]) and maps each row
template <typename Row, typename Reader, typename... Extra>
Result<std::vector<Row>> queryRows(metadata::Database& db, const std::string& sql,
                                   const Scope& scope, Reader&& reader, Extra&&... extra) {
    auto stmtResult = db.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    if (auto b = stmt.bindAll(scope.folder_id, scope.owner_id, std::forward<Extra>(extra)...); !b)
        return b.error();

    std::vector<Row> rows;
    while (true) {
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            break;
        rows.push_back(reader(stmt));
    }
    return rows;
}

} // namespace

SqliteScopedStore::~SqliteScopedStore() {
    close();
}

Result<void> SqliteScopedStore::open(const std::string& path) {
    std::lock_guard lock(mutex_);
    auto mode = path == ":memory:" ? metadata::ConnectionMode::Memory
                                   : metadata::ConnectionMode::Create;
    if (auto r = db_.open(path, mode); !r)
        return r;
    if (mode != metadata::ConnectionMode::Memory) {
        if (auto wal = db_.enableWAL(); !wal) {
            spdlog::warn("SqliteScopedStore: WAL unavailable for '{}': {}", path,
                         wal.error().message);
        }
    }
    auto schema = ensureSchema();
    if (schema) {
        spdlog::info("SqliteScopedStore: opened '{}'", path);
    }
    return schema;
}

void SqliteScopedStore::close() {
    std::lock_guard lock(mutex_);
    db_.close();
}

bool SqliteScopedStore::isOpen() const {
    std::lock_guard lock(mutex_);
    return db_.isOpen();
}

Result<void> SqliteScopedStore::ensureSchema() {
    return db_.execute(kSchema);
}

Result<void> SqliteScopedStore::requireOpen() const {
    if (!db_.isOpen())
        return Error{ErrorCode::StorageError, "Store is not open"};
    return {};
}

Result<void> SqliteScopedStore::putDocument(const Document& document) {
    if (auto v = validateScope(document.scope); !v)
        return v;
    if (document.id.empty())
        return Error{ErrorCode::ValidationError, "Document id must not be empty"};

    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o;

    auto stmtResult = db_.prepare(
        "INSERT INTO documents (id, folder_id, owner_id, name, type, content, size, metadata, "
        "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET name = excluded.name, type = excluded.type, "
        "content = excluded.content, size = excluded.size, metadata = excluded.metadata, "
        "updated_at = excluded.updated_at "
        "WHERE documents.folder_id = excluded.folder_id AND documents.owner_id = "
        "excluded.owner_id");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    auto bound = stmt.bindAll(document.id, document.scope.folder_id, document.scope.owner_id,
                              document.name, std::string(documentTypeToString(document.type)),
                              document.content, static_cast<int64_t>(document.size),
                              dumpJson(toJson(document.metadata)),
                              toEpochMillis(document.created_at),
                              toEpochMillis(document.updated_at));
    if (!bound)
        return bound;
    if (auto r = stmt.execute(); !r)
        return r;
    if (db_.changes() == 0) {
        return Error{ErrorCode::ValidationError,
                     "Document id " + document.id + " belongs to another scope"};
    }
    return {};
}

Result<Document> SqliteScopedStore::getDocument(const Scope& scope, const std::string& id) {
    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o.error();
    auto rows = queryRows<Document>(db_,
                                    std::string("SELECT ") + kDocumentColumns +
                                        " FROM documents WHERE folder_id = ? AND owner_id = ? "
                                        "AND id = ?",
                                    scope, readDocument, id);
    if (!rows)
        return rows.error();
    if (rows.value().empty())
        return Error{ErrorCode::NotFound, "Document not found: " + id};
    return rows.value().front();
}

Result<std::vector<Document>> SqliteScopedStore::listDocuments(const Scope& scope) {
    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o.error();
    return queryRows<Document>(db_,
                               std::string("SELECT ") + kDocumentColumns +
                                   " FROM documents WHERE folder_id = ? AND owner_id = ? "
                                   "ORDER BY created_at, id",
                               scope, readDocument);
}

Result<void> SqliteScopedStore::deleteDocument(const Scope& scope, const std::string& id) {
    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o;
    auto stmtResult =
        db_.prepare("DELETE FROM documents WHERE folder_id = ? AND owner_id = ? AND id = ?");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    if (auto b = stmt.bindAll(scope.folder_id, scope.owner_id, id); !b)
        return b;
    if (auto r = stmt.execute(); !r)
        return r;
    if (db_.changes() == 0)
        return Error{ErrorCode::NotFound, "Document not found: " + id};
    return {};
}

Result<void> SqliteScopedStore::putChunk(const Chunk& chunk) {
    if (auto v = validateScope(chunk.scope); !v)
        return v;
    if (chunk.id.empty() || chunk.document_id.empty())
        return Error{ErrorCode::ValidationError, "Chunk id and document id are required"};

    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o;
    auto stmtResult = db_.prepare(
        "INSERT INTO chunks (id, document_id, folder_id, owner_id, content, start_offset, "
        "end_offset, chunk_index, token_count, metadata, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET content = excluded.content, "
        "start_offset = excluded.start_offset, end_offset = excluded.end_offset, "
        "chunk_index = excluded.chunk_index, token_count = excluded.token_count, "
        "metadata = excluded.metadata "
        "WHERE chunks.folder_id = excluded.folder_id AND chunks.owner_id = excluded.owner_id");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    auto bound = stmt.bindAll(chunk.id, chunk.document_id, chunk.scope.folder_id,
                              chunk.scope.owner_id, chunk.content,
                              static_cast<int64_t>(chunk.start_offset),
                              static_cast<int64_t>(chunk.end_offset),
                              static_cast<int64_t>(chunk.chunk_index),
                              static_cast<int64_t>(chunk.token_count),
                              dumpJson(toJson(chunk.metadata)), toEpochMillis(chunk.created_at));
    if (!bound)
        return bound;
    if (auto r = stmt.execute(); !r)
        return r;
    if (db_.changes() == 0)
        return Error{ErrorCode::ValidationError, "Chunk id " + chunk.id + " belongs to another scope"};
    return {};
}

Result<Chunk> SqliteScopedStore::getChunk(const Scope& scope, const std::string& id) {
    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o.error();
    auto rows = queryRows<Chunk>(db_,
                                 std::string("SELECT ") + kChunkColumns +
                                     " FROM chunks WHERE folder_id = ? AND owner_id = ? AND id = ?",
                                 scope, readChunk, id);
    if (!rows)
        return rows.error();
    if (rows.value().empty())
        return Error{ErrorCode::NotFound, "Chunk not found: " + id};
    return rows.value().front();
}

Result<std::vector<Chunk>> SqliteScopedStore::listChunks(const Scope& scope) {
    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o.error();
    return queryRows<Chunk>(db_,
                            std::string("SELECT ") + kChunkColumns +
                                " FROM chunks WHERE folder_id = ? AND owner_id = ? "
                                "ORDER BY document_id, chunk_index",
                            scope, readChunk);
}

Result<std::vector<Chunk>> SqliteScopedStore::listChunksByDocument(const Scope& scope,
                                                                   const std::string& documentId) {
    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o.error();
    return queryRows<Chunk>(db_,
                            std::string("SELECT ") + kChunkColumns +
                                " FROM chunks WHERE folder_id = ? AND owner_id = ? "
                                "AND document_id = ? ORDER BY chunk_index",
                            scope, readChunk, documentId);
}

Result<size_t> SqliteScopedStore::deleteChunksByDocument(const Scope& scope,
                                                         const std::string& documentId) {
    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o.error();
    auto stmtResult = db_.prepare(
        "DELETE FROM chunks WHERE folder_id = ? AND owner_id = ? AND document_id = ?");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    if (auto b = stmt.bindAll(scope.folder_id, scope.owner_id, documentId); !b)
        return b.error();
    if (auto r = stmt.execute(); !r)
        return r.error();
    return static_cast<size_t>(db_.changes());
}

Result<void> SqliteScopedStore::putEmbedding(const EmbeddingRecord& embedding) {
    if (auto v = validateScope(embedding.scope); !v)
        return v;
    if (embedding.id.empty())
        return Error{ErrorCode::ValidationError, "Embedding id must not be empty"};

    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o;
    auto stmtResult = db_.prepare(
        "INSERT INTO embeddings (id, document_id, folder_id, owner_id, vector, dimensions, model, "
        "created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET vector = excluded.vector, "
        "dimensions = excluded.dimensions, model = excluded.model, "
        "created_at = excluded.created_at "
        "WHERE embeddings.folder_id = excluded.folder_id AND embeddings.owner_id = "
        "excluded.owner_id");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    auto bytes = std::as_bytes(std::span<const float>(embedding.vector));
    auto bound = stmt.bindAll(embedding.id, embedding.document_id, embedding.scope.folder_id,
                              embedding.scope.owner_id, bytes,
                              static_cast<int64_t>(embedding.vector.size()), embedding.model,
                              toEpochMillis(embedding.created_at));
    if (!bound)
        return bound;
    if (auto r = stmt.execute(); !r)
        return r;
    if (db_.changes() == 0) {
        return Error{ErrorCode::ValidationError,
                     "Embedding id " + embedding.id + " belongs to another scope"};
    }
    return {};
}

Result<EmbeddingRecord> SqliteScopedStore::getEmbedding(const Scope& scope,
                                                        const std::string& chunkId) {
    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o.error();
    auto rows = queryRows<EmbeddingRecord>(
        db_,
        std::string("SELECT ") + kEmbeddingColumns +
            " FROM embeddings WHERE folder_id = ? AND owner_id = ? AND id = ?",
        scope, readEmbedding, chunkId);
    if (!rows)
        return rows.error();
    if (rows.value().empty())
        return Error{ErrorCode::NotFound, "Embedding not found: " + chunkId};
    return rows.value().front();
}

Result<std::vector<EmbeddingRecord>> SqliteScopedStore::listEmbeddings(const Scope& scope) {
    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o.error();
    return queryRows<EmbeddingRecord>(db_,
                                      std::string("SELECT ") + kEmbeddingColumns +
                                          " FROM embeddings WHERE folder_id = ? AND owner_id = ?",
                                      scope, readEmbedding);
}

Result<size_t> SqliteScopedStore::deleteEmbeddingsByDocument(const Scope& scope,
                                                             const std::string& documentId) {
    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o.error();
    auto stmtResult = db_.prepare(
        "DELETE FROM embeddings WHERE folder_id = ? AND owner_id = ? AND document_id = ?");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    if (auto b = stmt.bindAll(scope.folder_id, scope.owner_id, documentId); !b)
        return b.error();
    if (auto r = stmt.execute(); !r)
        return r.error();
    return static_cast<size_t>(db_.changes());
}

Result<void> SqliteScopedStore::putGraph(const KnowledgeGraph& graph) {
    if (auto v = validateScope(graph.scope); !v)
        return v;

    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o;
    auto stmtResult = db_.prepare(
        "INSERT OR REPLACE INTO knowledge_graphs (folder_id, owner_id, id, body, document_count, "
        "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    auto bound = stmt.bindAll(graph.scope.folder_id, graph.scope.owner_id, graph.id,
                              dumpJson(graphBodyToJson(graph)),
                              static_cast<int64_t>(graph.document_count),
                              toEpochMillis(graph.created_at), toEpochMillis(graph.updated_at));
    if (!bound)
        return bound;
    return stmt.execute();
}

Result<KnowledgeGraph> SqliteScopedStore::getGraph(const Scope& scope) {
    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o.error();

    auto stmtResult = db_.prepare("SELECT id, body, document_count, created_at, updated_at FROM "
                                  "knowledge_graphs WHERE folder_id = ? AND owner_id = ?");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    if (auto b = stmt.bindAll(scope.folder_id, scope.owner_id); !b)
        return b.error();
    auto step = stmt.step();
    if (!step)
        return step.error();
    if (!step.value())
        return Error{ErrorCode::NotFound, "No knowledge graph for scope " + scope.toString()};

    KnowledgeGraph graph;
    graph.scope = scope;
    graph.id = stmt.getString(0);
    auto body = json::parse(stmt.getString(1), nullptr, false);
    if (body.is_discarded())
        return Error{ErrorCode::StorageError, "Corrupt knowledge graph body for " + scope.toString()};
    if (auto r = graphBodyFromJson(body, graph); !r)
        return r.error();
    graph.document_count = static_cast<size_t>(stmt.getInt64(2));
    graph.created_at = fromEpochMillis(stmt.getInt64(3));
    graph.updated_at = fromEpochMillis(stmt.getInt64(4));
    return graph;
}

Result<void> SqliteScopedStore::deleteGraph(const Scope& scope) {
    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o;
    auto stmtResult =
        db_.prepare("DELETE FROM knowledge_graphs WHERE folder_id = ? AND owner_id = ?");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    if (auto b = stmt.bindAll(scope.folder_id, scope.owner_id); !b)
        return b;
    return stmt.execute();
}

Result<void> SqliteScopedStore::deleteScope(const Scope& scope) {
    std::lock_guard lock(mutex_);
    if (auto o = requireOpen(); !o)
        return o;

    return db_.transaction([&]() -> Result<void> {
        // Dependents first so a partial failure never leaves orphaned vectors
        for (const char* table : {"embeddings", "chunks", "documents", "knowledge_graphs"}) {
            auto stmtResult = db_.prepare(std::string("DELETE FROM ") + table +
                                          " WHERE folder_id = ? AND owner_id = ?");
            if (!stmtResult)
                return stmtResult.error();
            Statement stmt = std::move(stmtResult).value();
            if (auto b = stmt.bindAll(scope.folder_id, scope.owner_id); !b)
                return b;
            if (auto r = stmt.execute(); !r)
                return r;
        }
        return {};
    });
}

} // namespace ragscope::storage
