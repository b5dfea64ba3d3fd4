/**
 * @file SyncEngine.hpp
 * @brief Owns the engine's components and exposes its operations
 */

#pragma once

// Standard Library Includes
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Project Includes
#include <bsdmirrors/sync_engine/Database.hpp>
#include <bsdmirrors/sync_engine/EngineConfig.hpp>
#include <bsdmirrors/sync_engine/JobExecutor.hpp>
#include <bsdmirrors/sync_engine/JobHistoryStore.hpp>
#include <bsdmirrors/sync_engine/MirrorLockManager.hpp>
#include <bsdmirrors/sync_engine/MirrorRegistry.hpp>
#include <bsdmirrors/sync_engine/MirrorTarget.hpp>
#include <bsdmirrors/sync_engine/Scheduler.hpp>
#include <bsdmirrors/sync_engine/SettingsStore.hpp>
#include <bsdmirrors/sync_engine/SyncJob.hpp>

namespace bsdmirrors::sync_engine
{
class SyncEngine
{
  public: // Constructors
    explicit SyncEngine(EngineConfig config);
    SyncEngine(SyncEngine&) = delete;
    SyncEngine(SyncEngine&&) = delete;
    auto operator=(SyncEngine&) -> SyncEngine& = delete;
    auto operator=(SyncEngine&&) -> SyncEngine& = delete;

    ~SyncEngine();

  public: // Methods
    // Recovers from an unclean shutdown, registers the configured mirrors
    // and starts the scheduler
    auto start() -> void;
    auto stop() -> void;

    auto register_target(const TargetDefinition& definition) -> MirrorTarget;

    [[nodiscard]]
    auto list_targets() const -> std::vector<MirrorTarget>;
    [[nodiscard]]
    auto get_target(TargetId id) const -> MirrorTarget;
    [[nodiscard]]
    auto find_target(std::string_view name) const -> std::optional<MirrorTarget>;

    // Changing the upstream of a syncing target throws `target_busy`;
    // enabling or disabling is allowed at any time
    auto update_target(TargetId id, const TargetUpdate& update) -> MirrorTarget;

    // Throws `target_busy` while the target is syncing
    auto remove_target(TargetId id) -> void;

    // Throws `target_busy`, `target_disabled`, `target_not_found` or
    // `validation_error` (empty actor)
    auto trigger_sync(TargetId id, std::string actor) -> SyncJob;

    [[nodiscard]]
    auto list_jobs(TargetId id, std::size_t limit) const -> std::vector<SyncJob>;
    [[nodiscard]]
    auto list_recent_jobs(std::size_t limit) const -> std::vector<SyncJob>;
    [[nodiscard]]
    auto get_job(JobId id) const -> SyncJob;

    [[nodiscard]]
    auto get_settings() const -> std::vector<Setting>;
    auto update_settings(const SettingsStore::SettingMap& values)
        -> std::vector<Setting>;

    auto prune_history(const RetentionPolicy& policy) -> std::size_t;

    [[nodiscard]]
    auto running_jobs() const -> std::size_t
    {
        return m_Scheduler.running_jobs();
    }

    [[nodiscard]]
    auto is_running() const -> bool
    {
        return m_Scheduler.is_running();
    }

  private: // Members
    EngineConfig      m_Config;
    Database          m_Database;
    SettingsStore     m_Settings;
    MirrorRegistry    m_Registry;
    MirrorLockManager m_Locks;
    JobHistoryStore   m_History;
    JobExecutor       m_Executor;
    Scheduler         m_Scheduler;
    bool              m_Started;
};
} // namespace bsdmirrors::sync_engine
