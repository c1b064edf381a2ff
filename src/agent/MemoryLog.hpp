// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstddef>
#include <string>

namespace apkforge
{

/// @brief Append-only record of the stage outputs of one generation task.
///
/// Every append publishes a fresh immutable vector, so snapshots handed out earlier
/// never change underneath their holders.
class MemoryLog
{
  public:
    MemoryLog();

    /// @brief Appends a stage output.
    /// @param role The role that produced the text.
    /// @param text The completion text.
    /// @return The entry as stored, including its sequence index.
    auto append(AgentRole role, std::string text) -> MemoryEntry;

    /// @brief Returns the entries appended so far.
    [[nodiscard]] auto snapshot() const -> MemorySnapshot;

    [[nodiscard]] auto size() const -> std::size_t;

  private:
    MemorySnapshot _entries;
};

} // namespace apkforge
