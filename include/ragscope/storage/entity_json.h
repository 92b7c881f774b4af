#pragma once

#include <ragscope/storage/entities.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace ragscope::storage {

// Serializes with invalid UTF-8 replaced by U+FFFD instead of throwing
std::string dumpJson(const nlohmann::json& j, int indent = -1);

// Time points travel as unix epoch milliseconds
int64_t toEpochMillis(TimePoint tp);
TimePoint fromEpochMillis(int64_t ms);

nlohmann::json extensionToJson(const ExtensionMap& map);
ExtensionMap extensionFromJson(const nlohmann::json& j);

nlohmann::json toJson(const DocumentMetadata& metadata);
DocumentMetadata documentMetadataFromJson(const nlohmann::json& j);

nlohmann::json toJson(const ChunkMetadata& metadata);
ChunkMetadata chunkMetadataFromJson(const nlohmann::json& j);

nlohmann::json toJson(const KnowledgeNode& node);
Result<KnowledgeNode> knowledgeNodeFromJson(const nlohmann::json& j);

nlohmann::json toJson(const KnowledgeEdge& edge);
Result<KnowledgeEdge> knowledgeEdgeFromJson(const nlohmann::json& j);

// Serializes nodes and edges only; scope and timestamps are stored alongside
nlohmann::json graphBodyToJson(const KnowledgeGraph& graph);
Result<void> graphBodyFromJson(const nlohmann::json& j, KnowledgeGraph& graph);

} // namespace ragscope::storage
