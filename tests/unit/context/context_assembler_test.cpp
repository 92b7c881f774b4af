#include <gtest/gtest.h>
#include <ragscope/context/context_assembler.h>

#include <string>
#include <string_view>
#include <vector>

using namespace ragscope;
using namespace ragscope::context;

class ContextAssemblerTest : public ::testing::Test {
protected:
    std::vector<Message> conversation() {
        return {{Role::User, "first question"},
                {Role::Assistant, "first answer"},
                {Role::User, "second question"},
                {Role::Assistant, "second answer"},
                {Role::User, "third question"}};
    }

    ContextAssembler assembler_;
};

TEST_F(ContextAssemblerTest, EmptyHistoryYieldsOnlySystemMessage) {
    auto ctx = assembler_.buildContext({}, "You are helpful.");
    ASSERT_EQ(ctx.messages.size(), 1u);
    EXPECT_EQ(ctx.messages[0].role, Role::System);
    EXPECT_EQ(ctx.messages[0].content, "You are helpful.");
    EXPECT_EQ(ctx.total_tokens,
              chunking::estimateTokens("You are helpful.") + ContextAssembler::kMessageOverhead);
    EXPECT_FALSE(ctx.truncated);
}

TEST_F(ContextAssemblerTest, WholeConversationFitsInChronologicalOrder) {
    auto history = conversation();
    auto ctx = assembler_.buildContext(history, "sys");

    ASSERT_EQ(ctx.messages.size(), history.size() + 1);
    EXPECT_EQ(ctx.messages[0].role, Role::System);
    for (size_t i = 0; i < history.size(); ++i) {
        EXPECT_EQ(ctx.messages[i + 1], history[i]);
    }
    EXPECT_FALSE(ctx.truncated);

    size_t expected = assembler_.estimateMessageTokens({Role::System, "sys"});
    for (const auto& m : history)
        expected += assembler_.estimateMessageTokens(m);
    EXPECT_EQ(ctx.total_tokens, expected);
}

TEST_F(ContextAssemblerTest, MessageLimitStopsAtFirstPairThatDoesNotFit) {
    TokenLimits limits;
    limits.max_messages = 4;
    auto ctx = assembler_.buildContext(conversation(), "sys", limits);

    ASSERT_EQ(ctx.messages.size(), 4u);
    EXPECT_EQ(ctx.messages[0].role, Role::System);
    EXPECT_EQ(ctx.messages[1].content, "second question");
    EXPECT_EQ(ctx.messages[2].content, "second answer");
    EXPECT_EQ(ctx.messages[3].content, "third question");
    EXPECT_TRUE(ctx.truncated);
}

TEST_F(ContextAssemblerTest, MessageLimitCountsTheSystemMessage) {
    TokenLimits limits;
    limits.max_messages = 3;
    auto ctx = assembler_.buildContext(conversation(), "sys", limits);

    ASSERT_EQ(ctx.messages.size(), 2u);
    EXPECT_EQ(ctx.messages[0].role, Role::System);
    EXPECT_EQ(ctx.messages[1].content, "third question");
    EXPECT_TRUE(ctx.truncated);
}

TEST_F(ContextAssemblerTest, LongHistoryStaysWithinDefaultLimits) {
    std::vector<Message> history;
    for (int i = 0; i < 61; ++i) {
        history.push_back({i % 2 == 0 ? Role::User : Role::Assistant,
                           "message number " + std::to_string(i)});
    }
    const TokenLimits limits;
    auto ctx = assembler_.buildContext(history, "You are helpful.", limits);

    EXPECT_LE(ctx.messages.size(), limits.max_messages);
    EXPECT_EQ(ctx.messages.size(), limits.max_messages);
    EXPECT_LE(ctx.total_tokens, limits.max_tokens - limits.reserve_tokens);
    EXPECT_TRUE(ctx.truncated);
    EXPECT_EQ(ctx.messages.back().content, "message number 60");

    auto validation = validateContext(ctx, "unknown-model");
    EXPECT_TRUE(validation.valid) << validation.reason;
}

TEST_F(ContextAssemblerTest, TokenBudgetDropsOlderPairs) {
    auto history = conversation();
    history[0].content = std::string(400, 'x'); // 100 tokens

    TokenLimits limits;
    limits.max_tokens = 100;
    limits.reserve_tokens = 0;
    auto ctx = assembler_.buildContext(history, "", limits);

    // system 10 + third question 14 + second pair 28 fit; the first pair does not
    ASSERT_EQ(ctx.messages.size(), 4u);
    EXPECT_EQ(ctx.messages[1].content, "second question");
    EXPECT_TRUE(ctx.truncated);
    EXPECT_LE(ctx.total_tokens, limits.max_tokens);
}

TEST_F(ContextAssemblerTest, OversizedLatestUserMessageIsTruncated) {
    std::vector<Message> history{{Role::User, std::string(1000, 'y')}};
    TokenLimits limits;
    limits.max_tokens = 100;
    limits.reserve_tokens = 0;

    auto ctx = assembler_.buildContext(history, "", limits);
    ASSERT_EQ(ctx.messages.size(), 2u);
    EXPECT_TRUE(ctx.truncated);
    // 90 available, minus the per-message overhead, at 4 characters per token
    EXPECT_EQ(ctx.messages[1].content, std::string(320, 'y') + "...");
}

TEST_F(ContextAssemblerTest, CustomEstimatorIsUsed) {
    ContextAssembler counting([](std::string_view text) { return text.size(); });
    EXPECT_EQ(counting.estimateMessageTokens({Role::User, "abcdef"}),
              6u + ContextAssembler::kMessageOverhead);
}

// =============================================================================
// Free helpers
// =============================================================================

TEST(TruncateTextTest, ShortTextUnchanged) {
    EXPECT_EQ(truncateText("hello world", 10), "hello world");
}

TEST(TruncateTextTest, PrefersLateWordBoundary) {
    EXPECT_EQ(truncateText("aaaa bbbb cccc dddd eeee", 5), "aaaa bbbb cccc dddd...");
}

TEST(TruncateTextTest, HardCutsWhenBoundaryIsEarly) {
    EXPECT_EQ(truncateText("abcdefghij klmnopqrstuvwxyz", 5), "abcdefghij klmnopqrs...");
}

TEST(TruncateTextTest, CutBacksOffToACharacterBoundary) {
    // Budget of 2 tokens is 8 bytes; the 8th byte would split U+00E9
    const std::string text = "abcdefg\xC3\xA9xyz";
    EXPECT_EQ(truncateText(text, 2), "abcdefg...");

    const std::string wide = "\xE2\x82\xAC\xE2\x82\xAC\xE2\x82\xAC"; // three euro signs
    EXPECT_EQ(truncateText(wide, 1), "\xE2\x82\xAC...");
}

TEST(TruncateTextTest, NonPositiveBudget) {
    EXPECT_EQ(truncateText("anything", 0), "...");
    EXPECT_EQ(truncateText("anything", -4), "...");
}

TEST(ModelLimitsTest, PresetsAndDefaults) {
    auto gpt4 = getModelLimits("gpt-4");
    EXPECT_EQ(gpt4.max_tokens, 8000u);
    EXPECT_EQ(gpt4.reserve_tokens, 2000u);
    EXPECT_EQ(gpt4.max_messages, 20u);

    auto haiku = getModelLimits("claude-3-haiku");
    EXPECT_EQ(haiku.max_tokens, 200000u);

    auto unknown = getModelLimits("mystery-model");
    EXPECT_EQ(unknown.max_tokens, 8000u);
    EXPECT_EQ(unknown.reserve_tokens, 1500u);
}

TEST(ValidateContextTest, ReportsTokenAndMessageOverruns) {
    MessageContext ctx;
    ctx.total_tokens = 9000;
    auto tooLong = validateContext(ctx, "gpt-4");
    EXPECT_FALSE(tooLong.valid);
    EXPECT_EQ(tooLong.reason, "Context too long: 9000 tokens exceeds 8000 limit");

    ctx.total_tokens = 100;
    ctx.messages.assign(21, Message{Role::User, "hi"});
    auto tooMany = validateContext(ctx, "gpt-4");
    EXPECT_FALSE(tooMany.valid);
    EXPECT_EQ(tooMany.reason, "Too many messages: 21 exceeds 20 limit");

    ctx.messages.resize(3);
    EXPECT_TRUE(validateContext(ctx, "gpt-4").valid);
}

TEST(SystemPromptTest, ProjectContextSections) {
    EXPECT_EQ(buildSystemPrompt("Base"), "Base");

    ProjectContext project;
    project.description = "Invoice tooling";
    project.tech_stack = {"C++", "SQLite"};
    for (int i = 0; i < 12; ++i)
        project.files.push_back("f" + std::to_string(i) + ".cpp");

    auto prompt = buildSystemPrompt("Base", project);
    EXPECT_NE(prompt.find("## Project Context"), std::string::npos);
    EXPECT_NE(prompt.find("Project Description: Invoice tooling"), std::string::npos);
    EXPECT_NE(prompt.find("Tech Stack: C++, SQLite"), std::string::npos);
    EXPECT_NE(prompt.find("f9.cpp (and 2 more)"), std::string::npos);
    EXPECT_EQ(prompt.find("f10.cpp"), std::string::npos);
}

TEST(RoleTest, StringConversions) {
    EXPECT_STREQ(roleToString(Role::Assistant), "assistant");
    auto user = roleFromString("user");
    ASSERT_TRUE(user);
    EXPECT_EQ(user.value(), Role::User);
    auto bad = roleFromString("robot");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
}
