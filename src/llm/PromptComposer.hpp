// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/InferenceClient.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace apkforge
{

/// @brief One chat-template message ("system", "user" or "assistant").
struct PromptMessage
{
    std::string role;
    std::string content;

    auto operator==(const PromptMessage&) const -> bool = default;
};

/// @brief Marker inserted where an over-long prompt was cut.
inline constexpr auto TruncationMarker = std::string_view { "[CONTENT TRUNCATED FOR LENGTH]" };

/// @brief Turns an InferenceRequest into chat messages that fit a character budget.
///
/// The system prompt becomes the system message. Memory entries are rendered in order,
/// each tagged with the role that produced it, followed by the task itself; that user
/// message is truncated in the middle when the whole prompt exceeds the budget.
class PromptComposer
{
  public:
    /// @brief Constructs a composer.
    /// @param maxChars Approximate character budget for the whole prompt.
    explicit PromptComposer(std::size_t maxChars);

    /// @brief Builds the message list for a request.
    [[nodiscard]] auto compose(const InferenceRequest& request) const -> std::vector<PromptMessage>;

    /// @brief Returns the character budget.
    [[nodiscard]] auto maxChars() const noexcept -> std::size_t { return _maxChars; }

    /// @brief Keeps the head and the tail of @p text, replacing the middle with TruncationMarker.
    ///
    /// Text no longer than @p maxChars is returned unchanged. Cut points never split a UTF-8 sequence.
    [[nodiscard]] static auto truncateMiddle(std::string_view text, std::size_t maxChars) -> std::string;

  private:
    std::size_t _maxChars;
};

} // namespace apkforge
