// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace apkforge
{

/// @brief Callback invoked for each generated piece of text while a completion streams.
using StreamCallback = std::function<void(std::string_view piece)>;

/// @brief One request to the inference backend.
struct InferenceRequest
{
    AgentRole role = AgentRole::Planner;
    std::optional<std::string> systemPrompt;
    std::string userPrompt;

    /// Everything prior stages produced, oldest first. May be null for an empty log.
    MemorySnapshot memory;
};

/// @brief Abstract text-completion backend used by the agent pipeline.
///
/// Implementations must honour the stop token: once a stop is requested, complete()
/// returns promptly with an ErrorCode::Cancelled error. Failures that may succeed on
/// retry are reported as TransientInferenceError, everything else as FatalInferenceError.
class InferenceClient
{
  public:
    virtual ~InferenceClient() = default;

    /// @brief Produces a completion for the request.
    /// @param request Role, prompts and memory snapshot.
    /// @param stopToken Cancels the in-flight call.
    /// @param onPiece Optional streaming callback.
    /// @return The full completion text or an error.
    [[nodiscard]] virtual auto complete(const InferenceRequest& request,
                                        std::stop_token stopToken,
                                        const StreamCallback& onPiece) -> Result<std::string> = 0;
};

} // namespace apkforge
