#include <ragscope/chunking/document_chunker.h>
#include <ragscope/core/uuid.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace ragscope::chunking {

namespace {

bool isTerminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

TokenEstimator defaultTokenEstimator() {
    return [](std::string_view text) { return estimateTokens(text); };
}

Result<void> validateChunkingConfig(const ChunkingConfig& config) {
    if (config.max_tokens == 0) {
        return Error{ErrorCode::ValidationError, "chunking.max_tokens must be greater than zero"};
    }
    return {};
}

std::vector<TextSpan> splitSentences(std::string_view text) {
    std::vector<TextSpan> segments;
    size_t start = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (!isTerminal(text[i])) {
            ++i;
            continue;
        }
        while (i < text.size() && isTerminal(text[i]))
            ++i;
        while (i < text.size() && isSpace(text[i]))
            ++i;
        segments.push_back({start, i});
        start = i;
    }
    if (start < text.size())
        segments.push_back({start, text.size()});
    return segments;
}

// ChunkStream

ChunkStream::ChunkStream(const storage::Document& document, ChunkingConfig config,
                         TokenEstimator estimator, std::shared_ptr<Counters> counters)
    : documentId_(document.id), scope_(document.scope), content_(document.content),
      config_(config), estimator_(std::move(estimator)), counters_(std::move(counters)) {
    metadata_.document_name = document.name;
    metadata_.document_type = document.type;
    segments_ = splitSentences(content_);
    finished_ = segments_.empty();
    counters_->documents.fetch_add(1, std::memory_order_relaxed);
}

size_t ChunkStream::estimateRange(size_t firstSeg, size_t lastSeg) const {
    if (firstSeg >= lastSeg)
        return 0;
    const size_t start = segments_[firstSeg].start;
    const size_t end = segments_[lastSeg - 1].end;
    return estimator_(std::string_view(content_).substr(start, end - start));
}

storage::Chunk ChunkStream::makeChunk(size_t firstSeg, size_t lastSeg) {
    storage::Chunk chunk;
    chunk.id = core::generateUUID();
    chunk.document_id = documentId_;
    chunk.scope = scope_;
    chunk.start_offset = segments_[firstSeg].start;
    chunk.end_offset = segments_[lastSeg - 1].end;
    chunk.content = content_.substr(chunk.start_offset, chunk.end_offset - chunk.start_offset);
    chunk.chunk_index = chunkIndex_++;
    chunk.token_count = estimateRange(firstSeg, lastSeg);
    chunk.metadata = metadata_;
    chunk.created_at = std::chrono::system_clock::now();
    counters_->chunks.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("ChunkStream: document {} chunk {} [{}, {}) ~{} tokens", documentId_,
                  chunk.chunk_index, chunk.start_offset, chunk.end_offset, chunk.token_count);
    return chunk;
}

std::optional<storage::Chunk> ChunkStream::next() {
    if (finished_)
        return std::nullopt;

    while (nextSegment_ < segments_.size()) {
        const size_t candidate = nextSegment_;
        const bool bufferEmpty = bufferFirst_ == bufferLast_;

        if (bufferEmpty || estimateRange(bufferFirst_, candidate + 1) <= config_.max_tokens) {
            if (bufferEmpty)
                bufferFirst_ = candidate;
            bufferLast_ = candidate + 1;
            ++nextSegment_;
            continue;
        }

        // Close the buffer, then seed the next one with the overlap window
        auto chunk = makeChunk(bufferFirst_, bufferLast_);

        const size_t buffered = bufferLast_ - bufferFirst_;
        size_t seedFirst = bufferLast_ - std::min(config_.overlap_sentences, buffered);
        while (seedFirst < bufferLast_ &&
               estimateRange(seedFirst, candidate + 1) > config_.max_tokens) {
            ++seedFirst;
        }
        bufferFirst_ = seedFirst == bufferLast_ ? candidate : seedFirst;
        bufferLast_ = candidate + 1;
        ++nextSegment_;
        return chunk;
    }

    finished_ = true;
    if (bufferFirst_ == bufferLast_)
        return std::nullopt;

    const size_t tailTokens = estimateRange(bufferFirst_, bufferLast_);
    if (config_.drop_undersized_tail && tailTokens < config_.min_chunk_size) {
        counters_->dropped_tails.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("ChunkStream: dropping {}-token tail of document {} (min {})", tailTokens,
                      documentId_, config_.min_chunk_size);
        return std::nullopt;
    }
    return makeChunk(bufferFirst_, bufferLast_);
}

std::vector<storage::Chunk> ChunkStream::collect() {
    std::vector<storage::Chunk> chunks;
    while (auto chunk = next())
        chunks.push_back(std::move(*chunk));
    return chunks;
}

// SentenceWindowChunker

SentenceWindowChunker::SentenceWindowChunker(ChunkingConfig config, TokenEstimator estimator)
    : config_(config), estimator_(estimator ? std::move(estimator) : defaultTokenEstimator()),
      counters_(std::make_shared<ChunkStream::Counters>()) {}

Result<ChunkStream> SentenceWindowChunker::stream(const storage::Document& document) {
    if (auto v = validateChunkingConfig(config_); !v)
        return v.error();
    if (auto v = validateScope(document.scope); !v)
        return v.error();
    return ChunkStream(document, config_, estimator_, counters_);
}

Result<std::vector<storage::Chunk>>
SentenceWindowChunker::chunkDocument(const storage::Document& document) {
    auto s = stream(document);
    if (!s)
        return s.error();
    auto chunks = std::move(s).value().collect();
    spdlog::debug("SentenceWindowChunker: document {} produced {} chunks", document.id,
                  chunks.size());
    return chunks;
}

ChunkingStats SentenceWindowChunker::getStats() const {
    ChunkingStats stats;
    stats.documents = counters_->documents.load(std::memory_order_relaxed);
    stats.chunks = counters_->chunks.load(std::memory_order_relaxed);
    stats.dropped_tails = counters_->dropped_tails.load(std::memory_order_relaxed);
    return stats;
}

Result<std::unique_ptr<IDocumentChunker>> createSentenceWindowChunker(ChunkingConfig config) {
    if (auto v = validateChunkingConfig(config); !v)
        return v.error();
    return std::unique_ptr<IDocumentChunker>(std::make_unique<SentenceWindowChunker>(config));
}

} // namespace ragscope::chunking
