// SPDX-License-Identifier: Apache-2.0
#include "BuildQueue.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <format>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace apkforge
{

namespace
{
    auto rootKey(const std::filesystem::path& projectRoot) -> std::string
    {
        auto ec = std::error_code {};
        auto absolute = std::filesystem::absolute(projectRoot, ec);
        return (ec ? projectRoot : absolute).lexically_normal().generic_string();
    }

    auto cancelledBeforeStart(std::string_view key) -> Result<BuildResult>
    {
        return makeError(ErrorCode::Cancelled, std::format("Build of {} cancelled before it started", key));
    }

    struct PendingBuild
    {
        BuildJob job;
        std::string key;
        std::promise<Result<BuildResult>> promise;

        /// Completes the job as soon as its own token is stopped while it waits for a worker.
        /// Declared last so that it is unregistered before the promise goes away.
        std::optional<std::stop_callback<std::function<void()>>> watcher;
    };

    using PendingBuildPtr = std::shared_ptr<PendingBuild>;

    struct RunningBuild
    {
        std::string key;
        std::stop_source stop;
    };
} // namespace

struct BuildQueue::Impl
{
    const BuildRunner& runner;

    std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<PendingBuildPtr> pending;
    std::list<RunningBuild> running;
    std::vector<std::jthread> workers;

    /// Jobs completed by their watcher. They are released outside of any watcher invocation.
    std::vector<PendingBuildPtr> retired;

    explicit Impl(const BuildRunner& r): runner(r) {}

    /// @brief First pending job whose project is not being built right now.
    auto findRunnableLocked() -> std::deque<PendingBuildPtr>::iterator
    {
        return std::ranges::find_if(pending, [this](const PendingBuildPtr& candidate) {
            return std::ranges::none_of(running, [&](const RunningBuild& r) { return r.key == candidate->key; });
        });
    }

    /// @brief Drops @p target from the queue and completes it, unless a worker took it already.
    void cancelPending(const PendingBuild* target)
    {
        auto entry = PendingBuildPtr {};
        {
            auto lock = std::lock_guard(mutex);
            auto const it = std::ranges::find_if(pending, [&](const PendingBuildPtr& p) { return p.get() == target; });
            if (it == pending.end())
                return;
            entry = std::move(*it);
            pending.erase(it);
            retired.push_back(entry);
        }
        log::info("Dropped queued build of {}", entry->key);
        entry->promise.set_value(cancelledBeforeStart(entry->key));
    }

    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto job = PendingBuildPtr {};
            auto slot = std::list<RunningBuild>::iterator {};
            {
                auto lock = std::unique_lock(mutex);
                auto next = pending.end();
                cv.wait(lock, stopToken, [&] {
                    next = findRunnableLocked();
                    return next != pending.end();
                });
                if (stopToken.stop_requested())
                    return;

                job = std::move(*next);
                pending.erase(next);
                slot = running.insert(running.end(), RunningBuild { .key = job->key, .stop = {} });
            }

            // Waits for a watcher invocation that lost the race for the mutex.
            job->watcher.reset();

            log::debug("Build worker picked up {}", job->key);
            auto result = [&]() -> Result<BuildResult> {
                auto const forwardShutdown = std::stop_callback(stopToken, [&] { slot->stop.request_stop(); });
                auto const forwardJob = std::stop_callback(job->job.stopToken, [&] { slot->stop.request_stop(); });
                if (slot->stop.stop_requested())
                    return cancelledBeforeStart(job->key);
                return runner.build(job->job.projectRoot, job->job.toolchain, job->job.timeout, slot->stop.get_token());
            }();

            {
                auto lock = std::lock_guard(mutex);
                running.erase(slot);
            }
            cv.notify_all();
            job->promise.set_value(std::move(result));
        }
    }
};

BuildQueue::BuildQueue(const BuildRunner& runner, std::size_t workers): _impl(std::make_unique<Impl>(runner))
{
    auto const count = workers == 0 ? defaultConcurrency() : workers;
    _impl->workers.reserve(count);
    for (auto i = std::size_t { 0 }; i < count; ++i)
        _impl->workers.emplace_back([this](const std::stop_token& token) { _impl->run(token); });
    log::debug("Build queue started with {} worker(s)", count);
}

BuildQueue::~BuildQueue()
{
    cancelAll();
    for (auto& worker: _impl->workers)
        worker.request_stop();
    _impl->workers.clear();
}

auto BuildQueue::submit(BuildJob job) -> std::future<Result<BuildResult>>
{
    auto entry = std::make_shared<PendingBuild>();
    entry->job = std::move(job);
    entry->key = rootKey(entry->job.projectRoot);
    auto future = entry->promise.get_future();

    // Registered before the job becomes visible to workers, which unregister it on pickup.
    entry->watcher.emplace(entry->job.stopToken,
                           [impl = _impl.get(), target = entry.get()] { impl->cancelPending(target); });

    auto released = std::vector<PendingBuildPtr> {};
    auto stoppedAlready = false;
    {
        auto lock = std::lock_guard(_impl->mutex);
        released.swap(_impl->retired);
        // A stop requested before this point found nothing to cancel; later ones find the entry.
        stoppedAlready = entry->job.stopToken.stop_requested();
        if (!stoppedAlready)
            _impl->pending.push_back(entry);
    }

    if (stoppedAlready)
        entry->promise.set_value(cancelledBeforeStart(entry->key));
    else
        _impl->cv.notify_all();
    return future;
}

void BuildQueue::cancelAll()
{
    auto dropped = std::deque<PendingBuildPtr> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        dropped.swap(_impl->pending);
        for (auto& build: _impl->running)
            build.stop.request_stop();
    }

    for (auto& entry: dropped)
    {
        entry->watcher.reset();
        entry->promise.set_value(cancelledBeforeStart(entry->key));
    }
    if (!dropped.empty())
        log::info("Dropped {} queued build(s)", dropped.size());
}

auto BuildQueue::workerCount() const noexcept -> std::size_t
{
    return _impl->workers.size();
}

auto BuildQueue::defaultConcurrency() -> std::size_t
{
    return std::max<std::size_t>(1, std::thread::hardware_concurrency() / 2);
}

} // namespace apkforge
