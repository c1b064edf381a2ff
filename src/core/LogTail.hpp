// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace apkforge
{

/// @brief Keeps the last bytes of a stream of output.
///
/// Memory use is bounded by the capacity no matter how much is appended. Once output was
/// dropped, text() starts at the next line boundary so the excerpt never begins mid-line.
class LogTail
{
  public:
    explicit LogTail(std::size_t capacity);

    void append(std::string_view chunk);

    /// @brief Returns the retained output.
    [[nodiscard]] auto text() const -> std::string;

    /// @brief Returns true if earlier output was dropped.
    [[nodiscard]] auto truncated() const noexcept -> bool { return _totalBytes > _buffer.size(); }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return _capacity; }

  private:
    std::size_t _capacity;
    std::size_t _totalBytes = 0;
    std::string _buffer;
};

} // namespace apkforge
