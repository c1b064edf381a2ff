// SPDX-License-Identifier: Apache-2.0
#include "Fetcher.hpp"

#include <core/Log.hpp>
#include <core/LogTail.hpp>
#include <core/Process.hpp>

#include <array>
#include <cstdlib>
#include <format>
#include <utility>

namespace apkforge
{

namespace
{
    /// Proxy settings are the only part of the ambient environment a download honours.
    constexpr auto ForwardedVariables = std::array {
        "HOME", "HTTPS_PROXY", "https_proxy", "HTTP_PROXY", "http_proxy", "NO_PROXY", "no_proxy",
    };
} // namespace

CurlFetcher::CurlFetcher(std::filesystem::path curlExecutable, std::chrono::milliseconds timeout):
    _curl(std::move(curlExecutable)), _timeout(timeout)
{
    if (_curl.empty())
        _curl = findInSearchPath("curl", systemSearchPath()).value_or(std::filesystem::path {});
}

auto CurlFetcher::fetch(std::string_view url, const std::filesystem::path& destination, std::stop_token stopToken)
    -> VoidResult
{
    if (_curl.empty())
        return makeError(ErrorCode::DownloadError, "curl not found in the system search path");

    auto ec = std::error_code {};
    std::filesystem::create_directories(destination.parent_path(), ec);

    auto spec = ProcessSpec {
        .executable = _curl,
        .args = { "-fsSL", "--retry", "2", "-o", destination.string(), std::string(url) },
        .env = { { "PATH", std::string(systemSearchPath()) } },
    };
    for (auto const* name: ForwardedVariables)
    {
        if (auto const* value = std::getenv(name))
            spec.env[name] = value;
    }

    log::info("Downloading {}", url);
    auto tail = LogTail { 4096 };
    auto outcome = runProcess(
        spec, RunOptions { .timeout = _timeout }, [&](std::string_view chunk) { tail.append(chunk); }, stopToken);
    if (!outcome)
        return makeError(ErrorCode::DownloadError, std::format("Cannot run curl: {}", outcome.error().message));
    if (outcome->cancelled)
        return makeError(ErrorCode::Cancelled, std::format("Download of {} cancelled", url));
    if (outcome->timedOut)
        return makeError(ErrorCode::DownloadError, std::format("Download of {} timed out", url));
    if (outcome->exitCode != 0)
        return makeError(ErrorCode::DownloadError,
                         std::format("Download of {} failed (curl exit {}): {}", url, outcome->exitCode, tail.text()));

    if (!std::filesystem::exists(destination, ec) || std::filesystem::file_size(destination, ec) == 0)
        return makeError(ErrorCode::DownloadError, std::format("Download of {} produced an empty file", url));
    return {};
}

} // namespace apkforge
