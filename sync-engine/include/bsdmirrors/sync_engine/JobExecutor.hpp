/**
 * @file JobExecutor.hpp
 * @brief Runs one sync job from spawn to release
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <cstddef>
#include <stop_token>

// Project Includes
#include <bsdmirrors/sync_engine/JobHistoryStore.hpp>
#include <bsdmirrors/sync_engine/MirrorLockManager.hpp>
#include <bsdmirrors/sync_engine/MirrorRegistry.hpp>
#include <bsdmirrors/sync_engine/RsyncStats.hpp>
#include <bsdmirrors/sync_engine/SettingsStore.hpp>
#include <bsdmirrors/sync_engine/SyncJob.hpp>
#include <bsdmirrors/sync_engine/TransferCommand.hpp>

namespace bsdmirrors::sync_engine
{
struct ExecutorOptions
{
    TransferOptions      transfer;
    std::chrono::seconds terminationGrace = std::chrono::seconds(30);
    std::size_t          outputLimitBytes = 10000;
    bool                 dryRun           = false;
};

struct JobResult
{
    SyncJob      job;
    TargetStatus targetStatus = TargetStatus::ERROR;
};

class JobExecutor
{
  public: // Constructors
    JobExecutor(
        MirrorRegistry&  registry,
        JobHistoryStore& history,
        SettingsStore&   settings,
        ExecutorOptions  options
    );
    JobExecutor(JobExecutor&) = delete;
    JobExecutor(JobExecutor&&) = delete;
    auto operator=(JobExecutor&) -> JobExecutor& = delete;
    auto operator=(JobExecutor&&) -> JobExecutor& = delete;

    ~JobExecutor() = default;

  public: // Methods
    // `lease` must hold `job`'s target. The job is recorded as completed or
    // failed and the lease released on every path.
    auto run(SyncJob job, TargetLease lease, const std::stop_token& stopToken)
        -> JobResult;

  private: // Methods
    auto execute(
        SyncJob&               job,
        const MirrorTarget&    target,
        const SyncSettings&    settings,
        const std::stop_token& stopToken
    ) -> RsyncStats;

  private: // Members
    MirrorRegistry&  m_Registry;
    JobHistoryStore& m_History;
    SettingsStore&   m_Settings;
    ExecutorOptions  m_Options;
};
} // namespace bsdmirrors::sync_engine
