// SPDX-License-Identifier: Apache-2.0
#include "Events.hpp"

#include <format>
#include <type_traits>

namespace apkforge
{

auto describe(const AgentEvent& event) -> std::string
{
    return std::visit(
        [](const auto& e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, event::Progress>)
                return std::format("Progress: {}", e.message);
            else if constexpr (std::is_same_v<T, event::OutputFile>)
                return std::format("OutputFile: {}", e.path.string());
            else if constexpr (std::is_same_v<T, event::Done>)
                return std::format("Done: {}", e.summary);
            else if constexpr (std::is_same_v<T, event::Error>)
                return std::format("Error: {}", e.message);
            else
            {
                static_assert(std::is_same_v<T, event::Cancelled>, "unhandled event type");
                return std::format("Cancelled: {}", e.message);
            }
        },
        event);
}

} // namespace apkforge
