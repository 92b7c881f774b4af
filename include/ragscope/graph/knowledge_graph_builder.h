#pragma once

#include <ragscope/storage/entities.h>

#include <memory>
#include <string>
#include <vector>

namespace ragscope::graph {

/**
 * Pulls concept labels out of a chunk of text. Implementations range from the
 * keyword heuristic below to a real NLP pipeline; the graph shape is the same.
 */
class IConceptExtractor {
public:
    virtual ~IConceptExtractor() = default;

    virtual std::vector<std::string> extract(const std::string& text) const = 0;
    virtual std::string name() const = 0;
};

/**
 * Keyword heuristic: lowercased words longer than four characters, split on
 * non-word characters, minus a small stop-word list. Returns at most
 * maxConcepts distinct words in first-seen order.
 */
class HeuristicConceptExtractor : public IConceptExtractor {
public:
    explicit HeuristicConceptExtractor(size_t maxConcepts = 5) : maxConcepts_(maxConcepts) {}

    std::vector<std::string> extract(const std::string& text) const override;
    std::string name() const override { return "heuristic"; }

private:
    size_t maxConcepts_;
};

// Nodes and edges derived from one document, ready to merge into a scope graph
struct GraphFragment {
    std::vector<storage::KnowledgeNode> nodes;
    std::vector<storage::KnowledgeEdge> edges;
};

class KnowledgeGraphBuilder {
public:
    static constexpr float kContainsWeight = 0.8f;

    explicit KnowledgeGraphBuilder(std::shared_ptr<IConceptExtractor> extractor =
                                       std::make_shared<HeuristicConceptExtractor>());

    /**
     * One document node plus, per chunk, a concept node for each extracted
     * concept linked from the document by a contains edge.
     */
    GraphFragment buildDocumentGraph(const storage::Document& document,
                                     const std::vector<storage::Chunk>& chunks) const;

    /**
     * Appends a fragment to the scope graph. A document already present is
     * pruned first so re-ingesting replaces rather than duplicates.
     */
    static void merge(storage::KnowledgeGraph& graph, GraphFragment fragment);

    /**
     * Removes the document node, every node sourced only from that document,
     * and every edge touching a removed node. Returns the removed node count.
     */
    static size_t pruneDocument(storage::KnowledgeGraph& graph, const std::string& documentId);

    const IConceptExtractor& extractor() const { return *extractor_; }

private:
    std::shared_ptr<IConceptExtractor> extractor_;
};

} // namespace ragscope::graph
