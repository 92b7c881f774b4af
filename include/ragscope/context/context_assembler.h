#pragma once

#include <ragscope/chunking/document_chunker.h>
#include <ragscope/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ragscope::context {

enum class Role { System, User, Assistant };

const char* roleToString(Role role);
Result<Role> roleFromString(const std::string& value);

struct Message {
    Role role = Role::User;
    std::string content;

    bool operator==(const Message&) const = default;
};

struct TokenLimits {
    size_t max_tokens = 8000;
    size_t max_messages = 20;
    size_t reserve_tokens = 1500; // Held back for the model's response
};

/**
 * Bounded message window: system message first, then the admitted history in
 * chronological order.
 */
struct MessageContext {
    std::vector<Message> messages;
    size_t total_tokens = 0;
    bool truncated = false;
};

struct ContextValidation {
    bool valid = true;
    std::string reason;
};

struct ProjectContext {
    std::string description;
    std::vector<std::string> tech_stack;
    std::vector<std::string> files;
};

/**
 * Builds token-bounded prompt contexts from conversation history.
 *
 * Every message costs estimate(content) + kMessageOverhead tokens. The most
 * recent message, when it comes from the user, is always kept (truncated if it
 * alone overflows the budget). Older history is admitted newest first in
 * whole pairs until a pair would exceed either the token budget or
 * max_messages; the first such pair ends the walk.
 */
class ContextAssembler {
public:
    static constexpr size_t kMessageOverhead = 10;

    explicit ContextAssembler(chunking::TokenEstimator estimator = chunking::defaultTokenEstimator());

    MessageContext buildContext(const std::vector<Message>& history,
                                const std::string& systemPrompt,
                                const TokenLimits& limits = {}) const;

    size_t estimateMessageTokens(const Message& message) const;

private:
    chunking::TokenEstimator estimator_;
};

/**
 * Cuts text to a character budget of maxTokens * 4. Prefers the last space
 * when it lies beyond 80% of the budget, else hard-cuts; appends "...".
 * Text that already fits is returned unchanged.
 */
std::string truncateText(const std::string& text, int64_t maxTokens);

// Known model presets; unknown models get the defaults
TokenLimits getModelLimits(const std::string& model);

// Checks a built context against the model's limits, independent of assembly
ContextValidation validateContext(const MessageContext& context, const std::string& model);

std::string buildSystemPrompt(const std::string& basePrompt,
                              const std::optional<ProjectContext>& project = std::nullopt);

} // namespace ragscope::context
