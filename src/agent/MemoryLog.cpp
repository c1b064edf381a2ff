// SPDX-License-Identifier: Apache-2.0
#include "MemoryLog.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace apkforge
{

MemoryLog::MemoryLog(): _entries(std::make_shared<const std::vector<MemoryEntry>>())
{
}

auto MemoryLog::append(AgentRole role, std::string text) -> MemoryEntry
{
    auto next = std::make_shared<std::vector<MemoryEntry>>(*_entries);
    next->push_back(MemoryEntry { .role = role, .text = std::move(text), .sequence = next->size() });
    auto entry = next->back();
    _entries = std::move(next);
    return entry;
}

auto MemoryLog::snapshot() const -> MemorySnapshot
{
    return _entries;
}

auto MemoryLog::size() const -> std::size_t
{
    return _entries->size();
}

} // namespace apkforge
