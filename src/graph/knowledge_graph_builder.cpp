#include <ragscope/core/utf8.h>
#include <ragscope/graph/knowledge_graph_builder.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace ragscope::graph {

namespace {

const std::unordered_set<std::string>& stopWords() {
    static const std::unordered_set<std::string> words = {
        "the",   "and",   "this",  "that",  "with",   "have",  "will",  "from",
        "they",  "been",  "their", "there", "which",  "would", "about", "these",
        "those", "other", "could", "should", "where", "after", "being", "while"};
    return words;
}

bool isWordChar(unsigned char c) {
    return std::isalnum(c) || c == '_';
}

void setExtra(storage::KnowledgeNode& node, const std::string& key, storage::MetadataValue value) {
    if (auto r = node.extra.set(key, std::move(value)); !r)
        spdlog::warn("KnowledgeGraphBuilder: node {} dropped '{}': {}", node.id, key,
                     r.error().message);
}

} // namespace

std::vector<std::string> HeuristicConceptExtractor::extract(const std::string& text) const {
    std::vector<std::string> concepts;
    std::unordered_set<std::string> seen;
    std::string word;

    auto flush = [&]() {
        if (word.size() > 4 && !stopWords().count(word) && seen.insert(word).second)
            concepts.push_back(word);
        word.clear();
    };

    for (unsigned char c : text) {
        if (concepts.size() >= maxConcepts_)
            break;
        if (isWordChar(c)) {
            word.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    if (concepts.size() < maxConcepts_)
        flush();
    return concepts;
}

KnowledgeGraphBuilder::KnowledgeGraphBuilder(std::shared_ptr<IConceptExtractor> extractor)
    : extractor_(extractor ? std::move(extractor)
                           : std::make_shared<HeuristicConceptExtractor>()) {}

GraphFragment KnowledgeGraphBuilder::buildDocumentGraph(
    const storage::Document& document, const std::vector<storage::Chunk>& chunks) const {
    GraphFragment fragment;

    storage::KnowledgeNode docNode;
    docNode.id = document.id;
    docNode.type = storage::NodeType::Document;
    docNode.label = document.name;
    docNode.content = std::string(core::utf8Prefix(document.content, 200)) + "...";
    docNode.document_ids = {document.id};
    for (const auto& chunk : chunks)
        docNode.chunk_ids.push_back(chunk.id);
    setExtra(docNode, "type", std::string(storage::documentTypeToString(document.type)));
    setExtra(docNode, "size", static_cast<int64_t>(document.size));
    fragment.nodes.push_back(std::move(docNode));

    for (const auto& chunk : chunks) {
        for (const auto& label : extractor_->extract(chunk.content)) {
            storage::KnowledgeNode node;
            node.id = chunk.id + "-concept-" + label;
            node.type = storage::NodeType::Concept;
            node.label = label;
            node.content = label;
            node.document_ids = {document.id};
            node.chunk_ids = {chunk.id};
            setExtra(node, "chunk_index", static_cast<int64_t>(chunk.chunk_index));

            storage::KnowledgeEdge edge;
            edge.id = document.id + "-contains-" + node.id;
            edge.source_id = document.id;
            edge.target_id = node.id;
            edge.type = storage::EdgeType::Contains;
            edge.weight = kContainsWeight;

            fragment.nodes.push_back(std::move(node));
            fragment.edges.push_back(std::move(edge));
        }
    }

    spdlog::debug("KnowledgeGraphBuilder: document {} -> {} nodes, {} edges", document.id,
                  fragment.nodes.size(), fragment.edges.size());
    return fragment;
}

void KnowledgeGraphBuilder::merge(storage::KnowledgeGraph& graph, GraphFragment fragment) {
    for (const auto& node : fragment.nodes) {
        if (node.type == storage::NodeType::Document)
            pruneDocument(graph, node.id);
    }

    graph.nodes.insert(graph.nodes.end(), std::make_move_iterator(fragment.nodes.begin()),
                       std::make_move_iterator(fragment.nodes.end()));
    graph.edges.insert(graph.edges.end(), std::make_move_iterator(fragment.edges.begin()),
                       std::make_move_iterator(fragment.edges.end()));

    graph.document_count = static_cast<size_t>(
        std::count_if(graph.nodes.begin(), graph.nodes.end(), [](const auto& n) {
            return n.type == storage::NodeType::Document;
        }));
    graph.updated_at = std::chrono::system_clock::now();
}

size_t KnowledgeGraphBuilder::pruneDocument(storage::KnowledgeGraph& graph,
                                            const std::string& documentId) {
    std::unordered_set<std::string> removed;

    for (auto& node : graph.nodes) {
        auto& ids = node.document_ids;
        const bool sourced = std::find(ids.begin(), ids.end(), documentId) != ids.end();
        if (node.id == documentId || (sourced && ids.size() == 1)) {
            removed.insert(node.id);
        } else if (sourced) {
            std::erase(ids, documentId);
        }
    }

    std::erase_if(graph.nodes, [&](const auto& n) { return removed.count(n.id) > 0; });
    std::erase_if(graph.edges, [&](const auto& e) {
        return removed.count(e.source_id) > 0 || removed.count(e.target_id) > 0;
    });

    graph.document_count = static_cast<size_t>(
        std::count_if(graph.nodes.begin(), graph.nodes.end(), [](const auto& n) {
            return n.type == storage::NodeType::Document;
        }));
    return removed.size();
}

} // namespace ragscope::graph
