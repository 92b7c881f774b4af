#include <ragscope/storage/entity_json.h>

#include <spdlog/spdlog.h>

namespace ragscope::storage {

using json = nlohmann::json;

std::string dumpJson(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpochMillis(int64_t ms) {
    return TimePoint{std::chrono::milliseconds{ms}};
}

json extensionToJson(const ExtensionMap& map) {
    json j = json::object();
    for (const auto& [key, value] : map.entries()) {
        std::visit([&j, &k = key](const auto& v) { j[k] = v; }, value);
    }
    return j;
}

ExtensionMap extensionFromJson(const json& j) {
    ExtensionMap map;
    if (!j.is_object())
        return map;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& v = it.value();
        Result<void> r;
        if (v.is_string()) {
            r = map.set(it.key(), v.get<std::string>());
        } else if (v.is_boolean()) {
            r = map.set(it.key(), v.get<bool>());
        } else if (v.is_number_integer()) {
            r = map.set(it.key(), v.get<int64_t>());
        } else if (v.is_number()) {
            r = map.set(it.key(), v.get<double>());
        } else {
            spdlog::debug("extensionFromJson: skipping non-scalar key '{}'", it.key());
            continue;
        }
        if (!r) {
            spdlog::warn("extensionFromJson: dropping key '{}': {}", it.key(), r.error().message);
        }
    }
    return map;
}

json toJson(const DocumentMetadata& metadata) {
    json j;
    if (metadata.original_file)
        j["original_file"] = *metadata.original_file;
    j["mime_type"] = metadata.mime_type;
    j["extra"] = extensionToJson(metadata.extra);
    return j;
}

DocumentMetadata documentMetadataFromJson(const json& j) {
    DocumentMetadata metadata;
    if (!j.is_object())
        return metadata;
    if (j.contains("original_file") && j["original_file"].is_string())
        metadata.original_file = j["original_file"].get<std::string>();
    metadata.mime_type = j.value("mime_type", std::string{"text/plain"});
    if (j.contains("extra"))
        metadata.extra = extensionFromJson(j["extra"]);
    return metadata;
}

json toJson(const ChunkMetadata& metadata) {
    return json{{"document_name", metadata.document_name},
                {"document_type", documentTypeToString(metadata.document_type)},
                {"extra", extensionToJson(metadata.extra)}};
}

ChunkMetadata chunkMetadataFromJson(const json& j) {
    ChunkMetadata metadata;
    if (!j.is_object())
        return metadata;
    metadata.document_name = j.value("document_name", std::string{});
    if (auto type = documentTypeFromString(j.value("document_type", std::string{"text"})))
        metadata.document_type = type.value();
    if (j.contains("extra"))
        metadata.extra = extensionFromJson(j["extra"]);
    return metadata;
}

json toJson(const KnowledgeNode& node) {
    return json{{"id", node.id},
                {"type", nodeTypeToString(node.type)},
                {"label", node.label},
                {"content", node.content},
                {"document_ids", node.document_ids},
                {"chunk_ids", node.chunk_ids},
                {"extra", extensionToJson(node.extra)}};
}

Result<KnowledgeNode> knowledgeNodeFromJson(const json& j) {
    try {
        KnowledgeNode node;
        node.id = j.at("id").get<std::string>();
        auto type = nodeTypeFromString(j.at("type").get<std::string>());
        if (!type)
            return type.error();
        node.type = type.value();
        node.label = j.value("label", std::string{});
        node.content = j.value("content", std::string{});
        node.document_ids = j.value("document_ids", std::vector<std::string>{});
        node.chunk_ids = j.value("chunk_ids", std::vector<std::string>{});
        if (j.contains("extra"))
            node.extra = extensionFromJson(j["extra"]);
        return node;
    } catch (const json::exception& e) {
        return Error{ErrorCode::StorageError, std::string("Malformed graph node: ") + e.what()};
    }
}

json toJson(const KnowledgeEdge& edge) {
    return json{{"id", edge.id},
                {"source_id", edge.source_id},
                {"target_id", edge.target_id},
                {"type", edgeTypeToString(edge.type)},
                {"weight", edge.weight}};
}

Result<KnowledgeEdge> knowledgeEdgeFromJson(const json& j) {
    try {
        KnowledgeEdge edge;
        edge.id = j.at("id").get<std::string>();
        edge.source_id = j.at("source_id").get<std::string>();
        edge.target_id = j.at("target_id").get<std::string>();
        auto type = edgeTypeFromString(j.at("type").get<std::string>());
        if (!type)
            return type.error();
        edge.type = type.value();
        edge.weight = j.value("weight", 1.0f);
        return edge;
    } catch (const json::exception& e) {
        return Error{ErrorCode::StorageError, std::string("Malformed graph edge: ") + e.what()};
    }
}

json graphBodyToJson(const KnowledgeGraph& graph) {
    json nodes = json::array();
    for (const auto& node : graph.nodes)
        nodes.push_back(toJson(node));
    json edges = json::array();
    for (const auto& edge : graph.edges)
        edges.push_back(toJson(edge));
    return json{{"nodes", std::move(nodes)}, {"edges", std::move(edges)}};
}

Result<void> graphBodyFromJson(const json& j, KnowledgeGraph& graph) {
    graph.nodes.clear();
    graph.edges.clear();
    if (j.contains("nodes")) {
        for (const auto& n : j["nodes"]) {
            auto node = knowledgeNodeFromJson(n);
            if (!node)
                return node.error();
            graph.nodes.push_back(std::move(node).value());
        }
    }
    if (j.contains("edges")) {
        for (const auto& e : j["edges"]) {
            auto edge = knowledgeEdgeFromJson(e);
            if (!edge)
                return edge.error();
            graph.edges.push_back(std::move(edge).value());
        }
    }
    return {};
}

} // namespace ragscope::storage
