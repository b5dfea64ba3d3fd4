/**
 * @file Scheduler.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/Scheduler.hpp>

// Standard Library Includes
#include <atomic>
#include <chrono>
#include <exception>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Third Party Library Includes
#include <spdlog/fmt/chrono.h>
#include <spdlog/spdlog.h>

// Project Includes
#include <bsdmirrors/sync_engine/Errors.hpp>

namespace bsdmirrors::sync_engine
{
Scheduler::Scheduler(
    MirrorRegistry&                 registry,
    MirrorLockManager&              locks,
    JobHistoryStore&                history,
    SettingsStore&                  settings,
    JobExecutor&                    executor,
    const std::chrono::milliseconds tickInterval
)
    : m_Registry(registry),
      m_Locks(locks),
      m_History(history),
      m_Settings(settings),
      m_Executor(executor),
      m_TickInterval(tickInterval),
      m_FirstTick(true),
      m_Stopping(false),
      m_LoopRunning(false)
{
}

Scheduler::~Scheduler()
{
    this->stop();
}

auto Scheduler::start() -> void
{
    {
        const std::lock_guard<std::mutex> runLock(m_RunMutex);
        m_Stopping = false;
    }

    spdlog::trace("Starting scheduler thread");
    m_LoopRunning = true;
    m_Loop = std::jthread([this](const std::stop_token& stopToken)
                          { this->run_loop(stopToken); });
    spdlog::info("Scheduler started, ticking every {}", m_TickInterval);
}

auto Scheduler::stop() -> void
{
    if (m_Loop.joinable())
    {
        spdlog::info("Joining scheduler thread");
        m_Loop.request_stop();
        {
            const std::lock_guard<std::mutex> sleepLock(m_SleepMutex);
            m_SleepVariable.notify_all();
        }
        m_Loop.join();
        spdlog::info("Scheduler thread joined!");
    }

    std::map<JobId, ActiveRun> runs;
    {
        const std::lock_guard<std::mutex> runLock(m_RunMutex);
        m_Stopping = true;
        runs.swap(m_Runs);
    }

    if (runs.empty())
    {
        return;
    }

    spdlog::info(
        "Interrupting {} running sync job{}",
        runs.size(),
        (runs.size() == 1 ? "" : "s")
    );

    for (auto& [jobId, run] : runs)
    {
        run.worker.request_stop();
    }

    // Joins every worker
    runs.clear();

    spdlog::info("All running syncs have been stopped!");
}

auto Scheduler::dispatch(const TargetId id, const TriggerOrigin& trigger) -> SyncJob
{
    {
        const std::lock_guard<std::mutex> runLock(m_RunMutex);
        if (m_Stopping)
        {
            throw precondition_violation("Cannot dispatch a sync while stopping");
        }
    }

    auto acquired = m_Locks.try_lease(id);

    if (!acquired.has_value())
    {
        const auto target = m_Registry.get_target(id);

        if (!target.enabled)
        {
            throw target_disabled(std::format("Mirror {} is disabled", target.name));
        }

        throw target_busy(std::format("Mirror {} is already syncing", target.name));
    }

    auto job = m_History.append(id, trigger);

    spdlog::info(
        "Dispatching job {} for mirror {} ({})",
        job.id,
        id,
        trigger.to_string()
    );

    auto finished = std::make_shared<std::atomic<bool>>(false);

    std::jthread worker(
        [this, job, lease = std::move(*acquired), finished](
            const std::stop_token& stopToken
        ) mutable
        {
            const JobId jobId = job.id;

            try
            {
                m_Executor.run(std::move(job), std::move(lease), stopToken);
            }
            catch (std::exception& e)
            {
                spdlog::error("Sync job {} ended abnormally: {}", jobId, e.what());
            }

            finished->store(true);
        }
    );

    const std::lock_guard<std::mutex> runLock(m_RunMutex);

    if (m_Stopping)
    {
        // stop() already collected the running jobs; this one ends here
        worker.request_stop();
        return job;
    }

    m_Runs.emplace(
        job.id,
        ActiveRun { .worker = std::move(worker), .finished = finished }
    );

    return job;
}

auto Scheduler::tick(const std::chrono::system_clock::time_point now) -> void
{
    const auto settings = m_Settings.snapshot();

    this->reap_finished();

    if (!this->refresh_schedule(settings.schedule))
    {
        return;
    }

    std::map<TargetId, std::chrono::system_clock::time_point> nextFire;

    for (const auto& target : m_Registry.list_targets())
    {
        if (!target.enabled)
        {
            continue;
        }

        bool due = m_FirstTick && settings.syncOnStartup;

        std::optional<std::chrono::system_clock::time_point> fireTime;

        if (const auto known = m_NextFire.find(target.id); known != m_NextFire.end())
        {
            fireTime = known->second;
        }
        else
        {
            fireTime = m_Cron->next_after(now);
        }

        if (fireTime.has_value() && *fireTime <= now)
        {
            due      = true;
            fireTime = m_Cron->next_after(now);
        }

        if (fireTime.has_value())
        {
            nextFire.emplace(target.id, *fireTime);
        }

        if (!due)
        {
            continue;
        }

        try
        {
            this->dispatch(target.id, TriggerOrigin::schedule());
        }
        catch (target_busy& tb)
        {
            spdlog::debug("Skipping scheduled sync: {}", tb.what());
        }
        catch (target_disabled& td)
        {
            spdlog::debug("Skipping scheduled sync: {}", td.what());
        }
        catch (target_not_found& tnf)
        {
            spdlog::debug("Skipping scheduled sync: {}", tnf.what());
        }
    }

    m_NextFire  = std::move(nextFire);
    m_FirstTick = false;
}

auto Scheduler::running_jobs() const -> std::size_t
{
    const std::lock_guard<std::mutex> runLock(m_RunMutex);

    std::size_t running = 0;
    for (const auto& [jobId, run] : m_Runs)
    {
        if (!run.finished->load())
        {
            ++running;
        }
    }

    return running;
}

auto Scheduler::is_running() const -> bool
{
    return m_LoopRunning;
}

auto Scheduler::run_loop(const std::stop_token& stopToken) -> void
{
    spdlog::trace("Entering the scheduler loop");

    while (!stopToken.stop_requested())
    {
        try
        {
            this->tick(std::chrono::system_clock::now());
        }
        catch (std::runtime_error& re)
        {
            spdlog::error("Scheduler tick failed: {}", re.what());
        }

        std::unique_lock<std::mutex> sleepLock(m_SleepMutex);
        m_SleepVariable.wait_for(
            sleepLock,
            m_TickInterval,
            [&stopToken]() -> bool { return stopToken.stop_requested(); }
        );
    }

    m_LoopRunning = false;
    spdlog::trace("Leaving the scheduler loop");
}

auto Scheduler::refresh_schedule(const std::string& expression) -> bool
{
    if (m_Cron.has_value() && m_Cron->text() == expression)
    {
        return true;
    }

    try
    {
        m_Cron = CronExpression::parse(expression);
    }
    catch (validation_error& ve)
    {
        spdlog::error("Ignoring sync schedule `{}`: {}", expression, ve.what());
        return m_Cron.has_value();
    }

    // Fire times computed from the old expression no longer apply
    m_NextFire.clear();

    if (const auto next = m_Cron->next_after(std::chrono::system_clock::now()))
    {
        spdlog::info(
            "Sync schedule is `{}`. Next sync scheduled for {:%m/%d @ %H:%M}",
            m_Cron->text(),
            *next
        );
    }

    return true;
}

auto Scheduler::reap_finished() -> void
{
    std::vector<std::jthread> finishedWorkers;

    {
        const std::lock_guard<std::mutex> runLock(m_RunMutex);

        for (auto run = m_Runs.begin(); run != m_Runs.end();)
        {
            if (run->second.finished->load())
            {
                finishedWorkers.emplace_back(std::move(run->second.worker));
                run = m_Runs.erase(run);
            }
            else
            {
                ++run;
            }
        }
    }

    if (!finishedWorkers.empty())
    {
        spdlog::trace("Reaped {} finished job threads", finishedWorkers.size());
    }
}
} // namespace bsdmirrors::sync_engine
