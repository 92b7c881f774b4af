#include <gtest/gtest.h>
#include <ragscope/chunking/document_chunker.h>

#include <string>
#include <string_view>
#include <vector>

using namespace ragscope;
using namespace ragscope::chunking;

namespace {

// One token per whitespace-separated word
size_t countWords(std::string_view text) {
    size_t words = 0;
    bool inWord = false;
    for (char c : text) {
        const bool space = c == ' ' || c == '\n' || c == '\t';
        if (!space && !inWord)
            ++words;
        inWord = !space;
    }
    return words;
}

} // namespace

class SentenceWindowChunkerTest : public ::testing::Test {
protected:
    storage::Document makeDocument(const std::string& content) {
        storage::Document doc;
        doc.id = "doc-1";
        doc.scope = Scope{7, "alice"};
        doc.name = "notes.txt";
        doc.type = storage::DocumentType::Text;
        doc.content = content;
        doc.size = content.size();
        return doc;
    }

    ChunkingConfig smallConfig(size_t maxTokens, size_t overlap) {
        ChunkingConfig config;
        config.max_tokens = maxTokens;
        config.overlap_sentences = overlap;
        config.min_chunk_size = 1;
        return config;
    }
};

// =============================================================================
// Sentence splitting
// =============================================================================

TEST(SplitSentencesTest, TerminalPunctuationAndTrailingSpaceEndASegment) {
    const std::string text = "Hello world. How are you? Fine!";
    auto segments = splitSentences(text);
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(text.substr(segments[0].start, segments[0].size()), "Hello world. ");
    EXPECT_EQ(text.substr(segments[1].start, segments[1].size()), "How are you? ");
    EXPECT_EQ(text.substr(segments[2].start, segments[2].size()), "Fine!");
}

TEST(SplitSentencesTest, PunctuationRunsStayTogether) {
    const std::string text = "Wait... what?!  Ok";
    auto segments = splitSentences(text);
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(text.substr(segments[0].start, segments[0].size()), "Wait... ");
    EXPECT_EQ(text.substr(segments[1].start, segments[1].size()), "what?!  ");
    EXPECT_EQ(text.substr(segments[2].start, segments[2].size()), "Ok");
}

TEST(SplitSentencesTest, SegmentsTileTheInput) {
    const std::string text = "First line\nno stop here. Second!   Third? trailing words";
    auto segments = splitSentences(text);
    ASSERT_FALSE(segments.empty());
    EXPECT_EQ(segments.front().start, 0u);
    EXPECT_EQ(segments.back().end, text.size());
    for (size_t i = 1; i < segments.size(); ++i) {
        EXPECT_EQ(segments[i].start, segments[i - 1].end);
    }
}

TEST(SplitSentencesTest, EmptyAndUnpunctuatedInput) {
    EXPECT_TRUE(splitSentences("").empty());
    auto one = splitSentences("no terminal punctuation at all");
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one[0], (TextSpan{0, 30}));
}

TEST(EstimateTokensTest, RoundsUpQuarterOfCharacters) {
    EXPECT_EQ(estimateTokens(""), 0u);
    EXPECT_EQ(estimateTokens("abcd"), 1u);
    EXPECT_EQ(estimateTokens("abcde"), 2u);
    static_assert(estimateTokens("abcdefgh") == 2);
}

// =============================================================================
// Chunking
// =============================================================================

TEST_F(SentenceWindowChunkerTest, RejectsZeroMaxTokens) {
    ChunkingConfig config;
    config.max_tokens = 0;
    EXPECT_FALSE(validateChunkingConfig(config));

    auto factory = createSentenceWindowChunker(config);
    ASSERT_FALSE(factory);
    EXPECT_EQ(factory.error().code, ErrorCode::ValidationError);

    SentenceWindowChunker chunker(config);
    auto result = chunker.chunkDocument(makeDocument("Some text."));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ValidationError);
}

TEST_F(SentenceWindowChunkerTest, RejectsMalformedScope) {
    SentenceWindowChunker chunker(smallConfig(10, 0));
    auto doc = makeDocument("A sentence.");
    doc.scope.owner_id.clear();
    auto result = chunker.chunkDocument(doc);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ValidationError);
}

TEST_F(SentenceWindowChunkerTest, EmptyDocumentYieldsNoChunks) {
    SentenceWindowChunker chunker(smallConfig(10, 0));
    auto result = chunker.chunkDocument(makeDocument(""));
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().empty());
}

TEST_F(SentenceWindowChunkerTest, OversizedSentencesBecomeTheirOwnChunks) {
    SentenceWindowChunker chunker(smallConfig(3, 0));
    const std::string text = "The cat sat. The dog ran. A bird flew.";
    auto result = chunker.chunkDocument(makeDocument(text));
    ASSERT_TRUE(result);

    const auto& chunks = result.value();
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].content, "The cat sat. ");
    EXPECT_EQ(chunks[1].content, "The dog ran. ");
    EXPECT_EQ(chunks[2].content, "A bird flew.");
    EXPECT_EQ(chunks[0].token_count, 4u);
    EXPECT_EQ(chunks[2].start_offset, 26u);
    EXPECT_EQ(chunks[2].end_offset, text.size());
}

TEST_F(SentenceWindowChunkerTest, ChunksCarryDocumentIdentityAndOrder) {
    SentenceWindowChunker chunker(smallConfig(3, 0));
    auto doc = makeDocument("The cat sat. The dog ran. A bird flew.");
    auto result = chunker.chunkDocument(doc);
    ASSERT_TRUE(result);

    for (size_t i = 0; i < result.value().size(); ++i) {
        const auto& chunk = result.value()[i];
        EXPECT_EQ(chunk.chunk_index, i);
        EXPECT_EQ(chunk.document_id, doc.id);
        EXPECT_EQ(chunk.scope, doc.scope);
        EXPECT_EQ(chunk.metadata.document_name, "notes.txt");
        EXPECT_EQ(chunk.metadata.document_type, storage::DocumentType::Text);
        EXPECT_FALSE(chunk.id.empty());
        EXPECT_EQ(doc.content.substr(chunk.start_offset, chunk.end_offset - chunk.start_offset),
                  chunk.content);
    }
}

TEST_F(SentenceWindowChunkerTest, OverlapCarriesTrailingSentences) {
    SentenceWindowChunker chunker(smallConfig(4, 1), countWords);
    auto result = chunker.chunkDocument(makeDocument("s1 a. s2 b. s3 c. s4 d. s5 e."));
    ASSERT_TRUE(result);

    const auto& chunks = result.value();
    ASSERT_EQ(chunks.size(), 4u);
    EXPECT_EQ(chunks[0].content, "s1 a. s2 b. ");
    EXPECT_EQ(chunks[1].content, "s2 b. s3 c. ");
    EXPECT_EQ(chunks[2].content, "s3 c. s4 d. ");
    EXPECT_EQ(chunks[3].content, "s4 d. s5 e.");
    for (size_t i = 1; i < chunks.size(); ++i) {
        EXPECT_LT(chunks[i].start_offset, chunks[i - 1].end_offset);
    }
}

TEST_F(SentenceWindowChunkerTest, OverlapIsTrimmedToFitTheBudget) {
    SentenceWindowChunker chunker(smallConfig(4, 2), countWords);
    auto result = chunker.chunkDocument(makeDocument("s1 a. s2 b. s3 c. s4 d. s5 e."));
    ASSERT_TRUE(result);
    for (const auto& chunk : result.value()) {
        EXPECT_LE(chunk.token_count, 4u) << chunk.content;
    }
    ASSERT_GE(result.value().size(), 2u);
    EXPECT_EQ(result.value()[1].content, "s2 b. s3 c. ");
}

TEST_F(SentenceWindowChunkerTest, OffsetsReassembleTheDocument) {
    const std::string text = "Alpha beta gamma. Delta epsilon! Zeta eta theta iota? Kappa.\n"
                             "Lambda mu nu xi omicron. Pi rho. Sigma tau upsilon phi chi. Psi "
                             "omega and a trailing clause without a stop";
    for (size_t overlap : {0u, 1u, 2u}) {
        SentenceWindowChunker chunker(smallConfig(7, overlap), countWords);
        auto result = chunker.chunkDocument(makeDocument(text));
        ASSERT_TRUE(result);
        ASSERT_FALSE(result.value().empty());

        std::string rebuilt;
        size_t covered = 0;
        for (const auto& chunk : result.value()) {
            ASSERT_LE(chunk.start_offset, covered) << "gap before chunk " << chunk.chunk_index;
            if (chunk.end_offset > covered) {
                rebuilt += chunk.content.substr(covered - chunk.start_offset);
                covered = chunk.end_offset;
            }
        }
        EXPECT_EQ(rebuilt, text) << "overlap " << overlap;
    }
}

TEST_F(SentenceWindowChunkerTest, EveryChunkStaysWithinBudgetWithOverlap) {
    std::string text;
    for (int i = 0; i < 40; ++i) {
        text += "Sentence " + std::to_string(i) + std::string(static_cast<size_t>(i % 7) * 3, 'x') +
                " ends here. ";
    }
    constexpr size_t kBudget = 16;
    SentenceWindowChunker chunker(smallConfig(kBudget, 3));
    auto result = chunker.chunkDocument(makeDocument(text));
    ASSERT_TRUE(result);

    const auto& chunks = result.value();
    ASSERT_GT(chunks.size(), 3u);
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_LE(chunks[i].token_count, kBudget) << chunks[i].content;
        EXPECT_EQ(chunks[i].token_count, estimateTokens(chunks[i].content));
        if (i > 0) {
            EXPECT_LE(chunks[i].start_offset, chunks[i - 1].end_offset);
        }
    }
}

TEST_F(SentenceWindowChunkerTest, UndersizedTailIsDroppedByDefault) {
    ChunkingConfig config; // min_chunk_size = 100
    SentenceWindowChunker chunker(config);
    auto result = chunker.chunkDocument(makeDocument("Short text."));
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().empty());
    EXPECT_EQ(chunker.getStats().dropped_tails, 1u);
    EXPECT_EQ(chunker.getStats().documents, 1u);
}

TEST_F(SentenceWindowChunkerTest, UndersizedTailKeptWhenDroppingDisabled) {
    ChunkingConfig config;
    config.drop_undersized_tail = false;
    SentenceWindowChunker chunker(config);
    auto result = chunker.chunkDocument(makeDocument("Short text."));
    ASSERT_TRUE(result);
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].content, "Short text.");
    EXPECT_EQ(chunker.getStats().chunks, 1u);
}

TEST_F(SentenceWindowChunkerTest, StreamProducesChunksLazily) {
    SentenceWindowChunker chunker(smallConfig(3, 0));
    auto stream = chunker.stream(makeDocument("The cat sat. The dog ran. A bird flew."));
    ASSERT_TRUE(stream);
    auto s = std::move(stream).value();

    auto first = s.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->chunk_index, 0u);
    EXPECT_FALSE(s.done());
    EXPECT_EQ(chunker.getStats().chunks, 1u);

    auto rest = s.collect();
    EXPECT_EQ(rest.size(), 2u);
    EXPECT_TRUE(s.done());
    EXPECT_FALSE(s.next().has_value());
}

TEST_F(SentenceWindowChunkerTest, CustomEstimatorDrivesBoundaries) {
    SentenceWindowChunker chunker(smallConfig(100, 0), countWords);
    auto result = chunker.chunkDocument(makeDocument("One two three. Four five six."));
    ASSERT_TRUE(result);
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].token_count, 6u);
}
