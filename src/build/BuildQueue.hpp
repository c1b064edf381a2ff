// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <build/BuildRunner.hpp>
#include <core/Error.hpp>
#include <toolchain/ToolchainState.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <future>
#include <memory>
#include <stop_token>

namespace apkforge
{

/// @brief A build waiting for a worker.
struct BuildJob
{
    std::filesystem::path projectRoot;
    ToolchainState toolchain;
    std::chrono::milliseconds timeout { 0 };

    /// Cancels this job only, whether it is still queued or already running.
    std::stop_token stopToken;
};

/// @brief Runs builds on a bounded pool of worker threads.
///
/// Jobs start in submission order, except that a job is held back while another job for the
/// same project root is running. Destroying the queue stops running builds and completes every
/// job that has not started with a Cancelled error.
class BuildQueue
{
  public:
    /// @param runner Executes the builds; must outlive the queue.
    /// @param workers Number of concurrent builds; 0 selects defaultConcurrency().
    explicit BuildQueue(const BuildRunner& runner, std::size_t workers = 0);
    ~BuildQueue();

    BuildQueue(const BuildQueue&) = delete;
    BuildQueue& operator=(const BuildQueue&) = delete;

    /// @brief Enqueues a build.
    /// @return Becomes ready when the build finished, failed to start or was cancelled.
    [[nodiscard]] auto submit(BuildJob job) -> std::future<Result<BuildResult>>;

    /// @brief Stops running builds and drops pending ones; they complete with Cancelled.
    void cancelAll();

    [[nodiscard]] auto workerCount() const noexcept -> std::size_t;

    /// @brief Half the hardware threads, at least one.
    [[nodiscard]] static auto defaultConcurrency() -> std::size_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace apkforge
