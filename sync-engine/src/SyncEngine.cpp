/**
 * @file SyncEngine.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/SyncEngine.hpp>

// Standard Library Includes
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Third Party Library Includes
#include <spdlog/spdlog.h>

namespace bsdmirrors::sync_engine
{
namespace
{
constexpr std::string_view INTERRUPTED_MESSAGE = "sync interrupted by engine restart";
} // namespace

SyncEngine::SyncEngine(EngineConfig config)
    : m_Config(std::move(config)),
      m_Database(m_Config.database),
      m_Settings(m_Database, m_Config.settingSeeds),
      m_Registry(m_Database),
      m_Locks(m_Registry),
      m_History(m_Database),
      m_Executor(m_Registry, m_History, m_Settings, m_Config.executor),
      m_Scheduler(
          m_Registry,
          m_Locks,
          m_History,
          m_Settings,
          m_Executor,
          m_Config.tickInterval
      ),
      m_Started(false)
{
    if (m_Config.executor.dryRun)
    {
        spdlog::info("Dry run enabled. No syncing will occur.");
    }
}

SyncEngine::~SyncEngine()
{
    this->stop();
}

auto SyncEngine::start() -> void
{
    if (m_Started)
    {
        return;
    }

    // Nothing can hold a lock yet, so `syncing` rows are left over from a crash
    const auto recoveredTargets = m_Registry.recover_interrupted(INTERRUPTED_MESSAGE);
    const auto recoveredJobs    = m_History.fail_interrupted(INTERRUPTED_MESSAGE);

    if (recoveredTargets > 0 || recoveredJobs > 0)
    {
        spdlog::warn(
            "Recovered {} mirror{} and {} job{} interrupted by the last shutdown",
            recoveredTargets,
            (recoveredTargets == 1 ? "" : "s"),
            recoveredJobs,
            (recoveredJobs == 1 ? "" : "s")
        );
    }

    for (const auto& definition : m_Config.mirrors)
    {
        m_Registry.register_target(definition);
    }

    m_Scheduler.start();
    m_Started = true;

    spdlog::info("Sync engine started");
}

auto SyncEngine::stop() -> void
{
    m_Scheduler.stop();

    if (m_Started)
    {
        m_Started = false;
        spdlog::info("Sync engine stopped");
    }
}

auto SyncEngine::register_target(const TargetDefinition& definition) -> MirrorTarget
{
    return m_Registry.register_target(definition);
}

auto SyncEngine::list_targets() const -> std::vector<MirrorTarget>
{
    return m_Registry.list_targets();
}

auto SyncEngine::get_target(const TargetId id) const -> MirrorTarget
{
    return m_Registry.get_target(id);
}

auto SyncEngine::find_target(std::string_view name) const
    -> std::optional<MirrorTarget>
{
    return m_Registry.find_target(name);
}

auto SyncEngine::update_target(const TargetId id, const TargetUpdate& update)
    -> MirrorTarget
{
    if (!update.upstreamUrl.has_value())
    {
        return m_Registry.apply_update(id, update);
    }

    MirrorRegistry::validate_upstream_url(*update.upstreamUrl);

    return m_Locks.with_target_idle(
        id,
        [this, id, &update]() -> MirrorTarget
        { return m_Registry.apply_update(id, update); }
    );
}

auto SyncEngine::remove_target(const TargetId id) -> void
{
    m_Locks.with_target_idle(id, [this, id]() { m_Registry.remove_target(id); });
}

auto SyncEngine::trigger_sync(const TargetId id, std::string actor) -> SyncJob
{
    const auto trigger = TriggerOrigin::manual(std::move(actor));

    spdlog::info("Manual sync requested for mirror {} by {}", id, *trigger.actor());

    return m_Scheduler.dispatch(id, trigger);
}

auto SyncEngine::list_jobs(const TargetId id, const std::size_t limit) const
    -> std::vector<SyncJob>
{
    return m_History.list(id, limit);
}

auto SyncEngine::list_recent_jobs(const std::size_t limit) const
    -> std::vector<SyncJob>
{
    return m_History.list_recent(limit);
}

auto SyncEngine::get_job(const JobId id) const -> SyncJob
{
    return m_History.get(id);
}

auto SyncEngine::get_settings() const -> std::vector<Setting>
{
    return m_Settings.list();
}

auto SyncEngine::update_settings(const SettingsStore::SettingMap& values)
    -> std::vector<Setting>
{
    return m_Settings.update(values);
}

auto SyncEngine::prune_history(const RetentionPolicy& policy) -> std::size_t
{
    return m_History.prune(policy);
}
} // namespace bsdmirrors::sync_engine
