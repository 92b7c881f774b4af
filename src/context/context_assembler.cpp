#include <ragscope/context/context_assembler.h>
#include <ragscope/core/utf8.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <deque>
#include <unordered_map>

namespace ragscope::context {

const char* roleToString(Role role) {
    switch (role) {
        case Role::System:
            return "system";
        case Role::User:
            return "user";
        case Role::Assistant:
            return "assistant";
    }
    return "user";
}

Result<Role> roleFromString(const std::string& value) {
    if (value == "system")
        return Role::System;
    if (value == "user")
        return Role::User;
    if (value == "assistant")
        return Role::Assistant;
    return Error{ErrorCode::InvalidArgument, "Unknown message role: " + value};
}

ContextAssembler::ContextAssembler(chunking::TokenEstimator estimator)
    : estimator_(estimator ? std::move(estimator) : chunking::defaultTokenEstimator()) {}

size_t ContextAssembler::estimateMessageTokens(const Message& message) const {
    return estimator_(message.content) + kMessageOverhead;
}

std::string truncateText(const std::string& text, int64_t maxTokens) {
    const int64_t maxChars = std::max<int64_t>(maxTokens, 0) * 4;
    if (static_cast<int64_t>(text.size()) <= maxChars)
        return text;

    std::string cut(core::utf8Prefix(text, static_cast<size_t>(maxChars)));
    auto lastSpace = cut.rfind(' ');
    if (lastSpace != std::string::npos &&
        static_cast<double>(lastSpace) > static_cast<double>(maxChars) * 0.8) {
        return cut.substr(0, lastSpace) + "...";
    }
    return cut + "...";
}

MessageContext ContextAssembler::buildContext(const std::vector<Message>& history,
                                              const std::string& systemPrompt,
                                              const TokenLimits& limits) const {
    MessageContext result;
    Message systemMessage{Role::System, systemPrompt};
    const size_t systemTokens = estimateMessageTokens(systemMessage);
    const int64_t availableTokens = static_cast<int64_t>(limits.max_tokens) -
                                    static_cast<int64_t>(limits.reserve_tokens) -
                                    static_cast<int64_t>(systemTokens);

    if (history.empty()) {
        result.messages.push_back(std::move(systemMessage));
        result.total_tokens = systemTokens;
        return result;
    }

    std::deque<Message> selected;
    int64_t usedTokens = 0;

    const Message& latest = history.back();
    if (latest.role == Role::User) {
        const auto tokens = static_cast<int64_t>(estimateMessageTokens(latest));
        if (tokens <= availableTokens) {
            selected.push_front(latest);
            usedTokens += tokens;
        } else {
            Message shortened{latest.role,
                              truncateText(latest.content,
                                           availableTokens - static_cast<int64_t>(kMessageOverhead))};
            usedTokens += static_cast<int64_t>(estimateMessageTokens(shortened));
            selected.push_front(std::move(shortened));
            result.truncated = true;
            spdlog::debug("ContextAssembler: latest message truncated to {} chars",
                          selected.front().content.size());
        }
    }

    // Older history in pairs, walking back from the message before the latest
    const size_t n = history.size();
    for (size_t back = 1; back + 2 <= n; back += 2) {
        const Message& newer = history[n - 1 - back];
        const Message& older = history[n - 2 - back];

        const auto pairTokens = static_cast<int64_t>(estimateMessageTokens(newer) +
                                                     estimateMessageTokens(older));
        if (usedTokens + pairTokens <= availableTokens &&
            1 + selected.size() + 2 <= limits.max_messages) {
            selected.push_front(newer);
            selected.push_front(older);
            usedTokens += pairTokens;
        } else {
            result.truncated = true;
            break;
        }
    }

    result.messages.reserve(selected.size() + 1);
    result.messages.push_back(std::move(systemMessage));
    for (auto& m : selected)
        result.messages.push_back(std::move(m));
    result.total_tokens = systemTokens + static_cast<size_t>(std::max<int64_t>(usedTokens, 0));
    return result;
}

TokenLimits getModelLimits(const std::string& model) {
    struct Preset {
        size_t max_tokens;
        size_t reserve_tokens;
    };
    static const std::unordered_map<std::string, Preset> presets = {
        {"gpt-4o", {120000, 4000}},          {"gpt-4o-mini", {120000, 1500}},
        {"gpt-4", {8000, 2000}},             {"gpt-3.5-turbo", {4000, 1000}},
        {"claude-3-sonnet", {200000, 4000}}, {"claude-3-haiku", {200000, 2000}},
        {"llama-2-70b", {4000, 1000}},
    };

    TokenLimits limits;
    if (auto it = presets.find(model); it != presets.end()) {
        limits.max_tokens = it->second.max_tokens;
        limits.reserve_tokens = it->second.reserve_tokens;
    }
    return limits;
}

ContextValidation validateContext(const MessageContext& context, const std::string& model) {
    const auto limits = getModelLimits(model);
    if (context.total_tokens > limits.max_tokens) {
        return {false, "Context too long: " + std::to_string(context.total_tokens) +
                           " tokens exceeds " + std::to_string(limits.max_tokens) + " limit"};
    }
    if (context.messages.size() > limits.max_messages) {
        return {false, "Too many messages: " + std::to_string(context.messages.size()) +
                           " exceeds " + std::to_string(limits.max_messages) + " limit"};
    }
    return {};
}

std::string buildSystemPrompt(const std::string& basePrompt,
                              const std::optional<ProjectContext>& project) {
    if (!project)
        return basePrompt;

    std::string prompt = basePrompt + "\n\n## Project Context\n";
    if (!project->description.empty())
        prompt += "Project Description: " + project->description + "\n";

    auto join = [](const std::vector<std::string>& items, size_t limit) {
        std::string out;
        for (size_t i = 0; i < items.size() && i < limit; ++i) {
            if (i > 0)
                out += ", ";
            out += items[i];
        }
        return out;
    };

    if (!project->tech_stack.empty())
        prompt += "Tech Stack: " + join(project->tech_stack, project->tech_stack.size()) + "\n";

    if (!project->files.empty()) {
        prompt += "Relevant Files: " + join(project->files, 10);
        if (project->files.size() > 10)
            prompt += " (and " + std::to_string(project->files.size() - 10) + " more)";
    }
    return prompt;
}

} // namespace ragscope::context
