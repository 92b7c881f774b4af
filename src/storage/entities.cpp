#include <ragscope/storage/entities.h>

#include <algorithm>
#include <cctype>

namespace ragscope::storage {

Result<void> ExtensionMap::set(const std::string& key, MetadataValue value) {
    if (key.empty()) {
        return Error{ErrorCode::ValidationError, "Extension key must not be empty"};
    }
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second = std::move(value);
        return {};
    }
    if (entries_.size() >= kMaxEntries) {
        return Error{ErrorCode::ValidationError,
                     "Extension map full (" + std::to_string(kMaxEntries) + " entries)"};
    }
    entries_.emplace(key, std::move(value));
    return {};
}

std::optional<MetadataValue> ExtensionMap::get(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ExtensionMap::erase(const std::string& key) {
    return entries_.erase(key) > 0;
}

const char* documentTypeToString(DocumentType type) {
    switch (type) {
        case DocumentType::Text: return "text";
        case DocumentType::Code: return "code";
        case DocumentType::Markdown: return "markdown";
        case DocumentType::Json: return "json";
        case DocumentType::Url: return "url";
        case DocumentType::Pdf: return "pdf";
    }
    return "text";
}

Result<DocumentType> documentTypeFromString(const std::string& value) {
    if (value == "text")
        return DocumentType::Text;
    if (value == "code")
        return DocumentType::Code;
    if (value == "markdown" || value == "md")
        return DocumentType::Markdown;
    if (value == "json")
        return DocumentType::Json;
    if (value == "url")
        return DocumentType::Url;
    if (value == "pdf")
        return DocumentType::Pdf;
    return Error{ErrorCode::ValidationError, "Unknown document type: " + value};
}

DocumentType detectDocumentType(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0) {
        return DocumentType::Url;
    }

    auto dot = lower.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= lower.size()) {
        return DocumentType::Text;
    }
    const std::string ext = lower.substr(dot + 1);

    if (ext == "pdf")
        return DocumentType::Pdf;
    if (ext == "md" || ext == "markdown")
        return DocumentType::Markdown;
    if (ext == "json")
        return DocumentType::Json;
    static const char* const kCodeExtensions[] = {"js",   "ts", "jsx", "tsx", "py",
                                                  "java", "cpp", "c",  "h",   "hpp"};
    for (const char* code : kCodeExtensions) {
        if (ext == code)
            return DocumentType::Code;
    }
    return DocumentType::Text;
}

const char* nodeTypeToString(NodeType type) {
    switch (type) {
        case NodeType::Document: return "document";
        case NodeType::Concept: return "concept";
        case NodeType::Entity: return "entity";
        case NodeType::Topic: return "topic";
    }
    return "concept";
}

Result<NodeType> nodeTypeFromString(const std::string& value) {
    if (value == "document")
        return NodeType::Document;
    if (value == "concept")
        return NodeType::Concept;
    if (value == "entity")
        return NodeType::Entity;
    if (value == "topic")
        return NodeType::Topic;
    return Error{ErrorCode::ValidationError, "Unknown node type: " + value};
}

const char* edgeTypeToString(EdgeType type) {
    switch (type) {
        case EdgeType::Contains: return "contains";
        case EdgeType::RelatesTo: return "relates_to";
        case EdgeType::References: return "references";
        case EdgeType::DerivedFrom: return "derived_from";
    }
    return "relates_to";
}

Result<EdgeType> edgeTypeFromString(const std::string& value) {
    if (value == "contains")
        return EdgeType::Contains;
    if (value == "relates_to")
        return EdgeType::RelatesTo;
    if (value == "references")
        return EdgeType::References;
    if (value == "derived_from")
        return EdgeType::DerivedFrom;
    return Error{ErrorCode::ValidationError, "Unknown edge type: " + value};
}

std::string graphIdForScope(const Scope& scope) {
    return scope.toString() + "-graph";
}

} // namespace ragscope::storage
