#pragma once

#include <ragscope/core/scope.h>
#include <ragscope/core/types.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ragscope::storage {

/**
 * Value stored in an entity's extension map. Known fields live on the entity
 * itself; this is the escape hatch for caller-defined data.
 */
using MetadataValue = std::variant<std::string, int64_t, double, bool>;

/**
 * Bounded key/value map for extension data.
 */
class ExtensionMap {
public:
    static constexpr size_t kMaxEntries = 32;

    Result<void> set(const std::string& key, MetadataValue value);
    std::optional<MetadataValue> get(const std::string& key) const;
    bool erase(const std::string& key);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::map<std::string, MetadataValue>& entries() const { return entries_; }

    bool operator==(const ExtensionMap& other) const { return entries_ == other.entries_; }

private:
    std::map<std::string, MetadataValue> entries_;
};

enum class DocumentType { Text, Code, Markdown, Json, Url, Pdf };

const char* documentTypeToString(DocumentType type);
Result<DocumentType> documentTypeFromString(const std::string& value);

// Infers the type from a file name or URL
DocumentType detectDocumentType(const std::string& name);

struct DocumentMetadata {
    std::optional<std::string> original_file;
    std::string mime_type = "text/plain";
    ExtensionMap extra;
};

struct Document {
    std::string id;
    Scope scope;
    std::string name;
    DocumentType type = DocumentType::Text;
    std::string content;
    size_t size = 0;
    DocumentMetadata metadata;
    TimePoint created_at;
    TimePoint updated_at;
};

struct ChunkMetadata {
    std::string document_name;
    DocumentType document_type = DocumentType::Text;
    ExtensionMap extra;
};

struct Chunk {
    std::string id;
    std::string document_id;
    Scope scope;
    std::string content;
    size_t start_offset = 0; // Character offset in document
    size_t end_offset = 0;   // Exclusive end offset
    size_t chunk_index = 0;  // Emission order
    size_t token_count = 0;  // Estimated token count
    ChunkMetadata metadata;
    TimePoint created_at;
};

/**
 * Stored vector for one chunk. id always equals the chunk id.
 */
struct EmbeddingRecord {
    std::string id;
    std::string document_id;
    Scope scope;
    Embedding vector;
    std::string model;
    TimePoint created_at;

    size_t dimensions() const { return vector.size(); }
};

enum class NodeType { Document, Concept, Entity, Topic };
enum class EdgeType { Contains, RelatesTo, References, DerivedFrom };

const char* nodeTypeToString(NodeType type);
Result<NodeType> nodeTypeFromString(const std::string& value);
const char* edgeTypeToString(EdgeType type);
Result<EdgeType> edgeTypeFromString(const std::string& value);

struct KnowledgeNode {
    std::string id;
    NodeType type = NodeType::Concept;
    std::string label;
    std::string content;
    std::vector<std::string> document_ids;
    std::vector<std::string> chunk_ids;
    ExtensionMap extra;
};

struct KnowledgeEdge {
    std::string id;
    std::string source_id;
    std::string target_id;
    EdgeType type = EdgeType::RelatesTo;
    float weight = 1.0f; // [0,1]
};

/**
 * One graph per scope, append-merged as documents are ingested.
 */
struct KnowledgeGraph {
    std::string id;
    Scope scope;
    std::vector<KnowledgeNode> nodes;
    std::vector<KnowledgeEdge> edges;
    size_t document_count = 0;
    TimePoint created_at;
    TimePoint updated_at;
};

// Graph id is derived from the scope so each scope owns exactly one graph
std::string graphIdForScope(const Scope& scope);

} // namespace ragscope::storage
