/**
 * @file Scheduler.hpp
 * @brief Cron-driven tick loop and the shared dispatch path for sync jobs
 */

#pragma once

// Standard Library Includes
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

// Project Includes
#include <bsdmirrors/sync_engine/CronExpression.hpp>
#include <bsdmirrors/sync_engine/JobExecutor.hpp>
#include <bsdmirrors/sync_engine/JobHistoryStore.hpp>
#include <bsdmirrors/sync_engine/MirrorLockManager.hpp>
#include <bsdmirrors/sync_engine/MirrorRegistry.hpp>
#include <bsdmirrors/sync_engine/SettingsStore.hpp>
#include <bsdmirrors/sync_engine/SyncJob.hpp>

namespace bsdmirrors::sync_engine
{
class Scheduler
{
  public: // Constructors
    Scheduler(
        MirrorRegistry&           registry,
        MirrorLockManager&        locks,
        JobHistoryStore&          history,
        SettingsStore&            settings,
        JobExecutor&              executor,
        std::chrono::milliseconds tickInterval
    );
    Scheduler(Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    auto operator=(Scheduler&) -> Scheduler& = delete;
    auto operator=(Scheduler&&) -> Scheduler& = delete;

    ~Scheduler();

  public: // Methods
    auto start() -> void;

    // Stops the loop, interrupts every running job and waits for them
    auto stop() -> void;

    // Acquires the target and runs a job for it on its own thread. Throws
    // `target_busy`, `target_disabled` or `target_not_found`; no job is
    // created in those cases.
    auto dispatch(TargetId id, const TriggerOrigin& trigger) -> SyncJob;

    // One scheduling pass as of `now`. Called by the loop every tick.
    auto tick(std::chrono::system_clock::time_point now) -> void;

    [[nodiscard]]
    auto running_jobs() const -> std::size_t;

    // True from `start` until the loop thread exits
    [[nodiscard]]
    auto is_running() const -> bool;

  private: // Types
    struct ActiveRun
    {
        std::jthread                       worker;
        std::shared_ptr<std::atomic<bool>> finished;
    };

  private: // Methods
    auto run_loop(const std::stop_token& stopToken) -> void;
    auto refresh_schedule(const std::string& expression) -> bool;
    auto reap_finished() -> void;

  private: // Members
    MirrorRegistry&           m_Registry;
    MirrorLockManager&        m_Locks;
    JobHistoryStore&          m_History;
    SettingsStore&            m_Settings;
    JobExecutor&              m_Executor;
    std::chrono::milliseconds m_TickInterval;

    // Owned by the loop thread
    std::optional<CronExpression>                             m_Cron;
    std::map<TargetId, std::chrono::system_clock::time_point> m_NextFire;
    bool                                                      m_FirstTick;

    mutable std::mutex         m_RunMutex;
    std::map<JobId, ActiveRun> m_Runs;
    bool                       m_Stopping;

    std::mutex              m_SleepMutex;
    std::condition_variable m_SleepVariable;
    std::atomic<bool>       m_LoopRunning;
    std::jthread            m_Loop;
};
} // namespace bsdmirrors::sync_engine
