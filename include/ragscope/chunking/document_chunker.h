#pragma once

#include <ragscope/core/types.h>
#include <ragscope/storage/entities.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ragscope::chunking {

// Maps text to an estimated token count. Swappable for a real tokenizer.
using TokenEstimator = std::function<size_t(std::string_view)>;

// ceil(chars / 4)
constexpr size_t estimateTokens(std::string_view text) noexcept {
    return (text.size() + 3) / 4;
}

TokenEstimator defaultTokenEstimator();

// Chunking configuration
struct ChunkingConfig {
    size_t max_tokens = 512;
    size_t overlap_sentences = 50; // Sentences carried from the previous chunk
    size_t min_chunk_size = 100;   // Tokens; smaller trailing remainders are dropped
    bool drop_undersized_tail = true;
};

Result<void> validateChunkingConfig(const ChunkingConfig& config);

// Half-open character range [start, end) into the source text
struct TextSpan {
    size_t start = 0;
    size_t end = 0;

    size_t size() const { return end - start; }
    bool operator==(const TextSpan&) const = default;
};

/**
 * Splits text into sentence-like segments. A run of terminal punctuation
 * ('.', '!', '?') and the whitespace after it belong to the segment they end.
 * The segments tile the input exactly.
 */
std::vector<TextSpan> splitSentences(std::string_view text);

struct ChunkingStats {
    uint64_t documents = 0;
    uint64_t chunks = 0;
    uint64_t dropped_tails = 0;
};

/**
 * Single-pass, ordered chunk sequence for one document. Each call to next()
 * yields the following chunk until the document is exhausted. The stream owns
 * a copy of the document text and cannot be restarted.
 */
class ChunkStream {
public:
    ChunkStream(ChunkStream&&) noexcept = default;
    ChunkStream& operator=(ChunkStream&&) noexcept = default;
    ChunkStream(const ChunkStream&) = delete;
    ChunkStream& operator=(const ChunkStream&) = delete;

    std::optional<storage::Chunk> next();

    bool done() const { return finished_; }

    // Drains the remaining chunks
    std::vector<storage::Chunk> collect();

private:
    friend class SentenceWindowChunker;

    struct Counters {
        std::atomic<uint64_t> documents{0};
        std::atomic<uint64_t> chunks{0};
        std::atomic<uint64_t> dropped_tails{0};
    };

    ChunkStream(const storage::Document& document, ChunkingConfig config, TokenEstimator estimator,
                std::shared_ptr<Counters> counters);

    size_t estimateRange(size_t firstSeg, size_t lastSeg) const;
    storage::Chunk makeChunk(size_t firstSeg, size_t lastSeg);

    std::string documentId_;
    Scope scope_;
    storage::ChunkMetadata metadata_;
    std::string content_;
    std::vector<TextSpan> segments_;
    ChunkingConfig config_;
    TokenEstimator estimator_;
    std::shared_ptr<Counters> counters_;

    // Buffer is the contiguous segment range [bufferFirst_, bufferLast_)
    size_t bufferFirst_ = 0;
    size_t bufferLast_ = 0;
    size_t nextSegment_ = 0;
    size_t chunkIndex_ = 0;
    bool finished_ = false;
};

// Interface for document chunkers
class IDocumentChunker {
public:
    virtual ~IDocumentChunker() = default;

    virtual const ChunkingConfig& getConfig() const = 0;

    // Chunk a whole document into scope-tagged chunks in emission order
    virtual Result<std::vector<storage::Chunk>> chunkDocument(const storage::Document& document) = 0;

    virtual ChunkingStats getStats() const = 0;
};

/**
 * Greedy sentence-window chunker. Sentences accumulate until the next one
 * would push the estimate past max_tokens; the closed chunk's last
 * overlap_sentences sentences then seed the next chunk, trimmed from the
 * oldest until overlap plus the new sentence fits.
 */
class SentenceWindowChunker : public IDocumentChunker {
public:
    explicit SentenceWindowChunker(ChunkingConfig config = {},
                                   TokenEstimator estimator = defaultTokenEstimator());

    const ChunkingConfig& getConfig() const override { return config_; }

    Result<std::vector<storage::Chunk>> chunkDocument(const storage::Document& document) override;

    // Lazy variant; chunks are produced on demand
    Result<ChunkStream> stream(const storage::Document& document);

    ChunkingStats getStats() const override;

private:
    ChunkingConfig config_;
    TokenEstimator estimator_;
    std::shared_ptr<ChunkStream::Counters> counters_;
};

// Factory function; fails on an invalid config
Result<std::unique_ptr<IDocumentChunker>> createSentenceWindowChunker(ChunkingConfig config = {});

} // namespace ragscope::chunking
