// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <filesystem>
#include <stop_token>
#include <string_view>

namespace apkforge
{

/// @brief Downloads a URL into a local file.
class Fetcher
{
  public:
    virtual ~Fetcher() = default;

    /// @brief Downloads @p url to @p destination, replacing it.
    /// @return Success, a DownloadError, or Cancelled when @p stopToken fires.
    [[nodiscard]] virtual auto fetch(std::string_view url,
                                     const std::filesystem::path& destination,
                                     std::stop_token stopToken) -> VoidResult = 0;
};

/// @brief Fetcher backed by the curl command line tool.
class CurlFetcher final: public Fetcher
{
  public:
    /// @param curlExecutable Absolute path of curl; empty searches the system search path.
    /// @param timeout Upper bound for a single download; zero disables it.
    explicit CurlFetcher(std::filesystem::path curlExecutable = {},
                         std::chrono::milliseconds timeout = std::chrono::hours { 1 });

    [[nodiscard]] auto fetch(std::string_view url, const std::filesystem::path& destination, std::stop_token stopToken)
        -> VoidResult override;

  private:
    std::filesystem::path _curl;
    std::chrono::milliseconds _timeout;
};

} // namespace apkforge
