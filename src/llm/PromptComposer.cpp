// SPDX-License-Identifier: Apache-2.0
#include "PromptComposer.hpp"

#include <algorithm>
#include <format>

namespace apkforge
{

namespace
{
    constexpr auto MinimumUserBudget = std::size_t { 256 };

    auto isContinuationByte(char c) -> bool
    {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }

    auto backToBoundary(std::string_view text, std::size_t pos) -> std::size_t
    {
        while (pos > 0 && pos < text.size() && isContinuationByte(text[pos]))
            --pos;
        return pos;
    }

    auto forwardToBoundary(std::string_view text, std::size_t pos) -> std::size_t
    {
        while (pos < text.size() && isContinuationByte(text[pos]))
            ++pos;
        return pos;
    }
} // namespace

PromptComposer::PromptComposer(std::size_t maxChars): _maxChars(maxChars)
{
}

auto PromptComposer::compose(const InferenceRequest& request) const -> std::vector<PromptMessage>
{
    auto messages = std::vector<PromptMessage> {};

    auto systemLength = std::size_t { 0 };
    if (request.systemPrompt && !request.systemPrompt->empty())
    {
        messages.push_back(PromptMessage { .role = "system", .content = *request.systemPrompt });
        systemLength = request.systemPrompt->size();
    }

    auto user = std::string {};
    if (request.memory && !request.memory->empty())
    {
        user += "RELEVANT_MEMORY:\n";
        for (const auto& entry: *request.memory)
            user += std::format("[{} #{}]\n{}\n\n", roleToString(entry.role), entry.sequence, entry.text);
    }
    user += std::format("TASK: {}", request.userPrompt);

    auto const budget = std::max(MinimumUserBudget, _maxChars > systemLength ? _maxChars - systemLength : 0);
    messages.push_back(PromptMessage { .role = "user", .content = truncateMiddle(user, budget) });
    return messages;
}

auto PromptComposer::truncateMiddle(std::string_view text, std::size_t maxChars) -> std::string
{
    if (text.size() <= maxChars)
        return std::string(text);

    auto const headEnd = backToBoundary(text, maxChars / 2);
    auto const tailStart = forwardToBoundary(text, text.size() - maxChars / 2);

    return std::format("{}\n\n... {} ...\n\n{}", text.substr(0, headEnd), TruncationMarker, text.substr(tailStart));
}

} // namespace apkforge
