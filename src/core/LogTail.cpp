// SPDX-License-Identifier: Apache-2.0
#include "LogTail.hpp"

namespace apkforge
{

LogTail::LogTail(std::size_t capacity): _capacity(capacity)
{
    _buffer.reserve(capacity);
}

void LogTail::append(std::string_view chunk)
{
    _totalBytes += chunk.size();
    if (_capacity == 0)
        return;

    if (chunk.size() >= _capacity)
    {
        _buffer.assign(chunk.substr(chunk.size() - _capacity));
        return;
    }

    auto const overflow = _buffer.size() + chunk.size();
    if (overflow > _capacity)
        _buffer.erase(0, overflow - _capacity);
    _buffer.append(chunk);
}

auto LogTail::text() const -> std::string
{
    if (!truncated())
        return _buffer;

    auto const nl = _buffer.find('\n');
    if (nl == std::string::npos || nl + 1 >= _buffer.size())
        return _buffer;
    return _buffer.substr(nl + 1);
}

} // namespace apkforge
