/**
 * @file MirrorLockManager.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/MirrorLockManager.hpp>

// Standard Library Includes
#include <exception>
#include <format>
#include <mutex>
#include <optional>

// Third Party Library Includes
#include <spdlog/spdlog.h>

// Project Includes
#include <bsdmirrors/sync_engine/Errors.hpp>
#include <bsdmirrors/sync_engine/Timestamp.hpp>

namespace bsdmirrors::sync_engine
{
TargetLease::TargetLease(MirrorLockManager& manager, const TargetId targetId)
    : m_Manager(&manager),
      m_TargetId(targetId)
{
}

TargetLease::TargetLease(TargetLease&& other) noexcept
    : m_Manager(other.m_Manager),
      m_TargetId(other.m_TargetId)
{
    other.m_Manager = nullptr;
}

TargetLease::~TargetLease()
{
    if (m_Manager == nullptr)
    {
        return;
    }

    try
    {
        this->release(
            SyncOutcome { .succeeded  = false,
                          .finishedAt = now(),
                          .error = "sync ended without reporting an outcome" }
        );
    }
    catch (std::exception& e)
    {
        spdlog::error(
            "Failed to release mirror {} from an abandoned lease: {}",
            m_TargetId,
            e.what()
        );
    }
}

auto TargetLease::release(const SyncOutcome& outcome) -> TargetStatus
{
    if (m_Manager == nullptr)
    {
        throw precondition_violation(
            std::format("Lease on mirror {} was already released", m_TargetId)
        );
    }

    auto* manager = std::exchange(m_Manager, nullptr);
    return manager->release(m_TargetId, outcome);
}

MirrorLockManager::MirrorLockManager(MirrorRegistry& registry)
    : m_Registry(registry)
{
}

auto MirrorLockManager::try_acquire(const TargetId id) -> bool
{
    const std::lock_guard<std::mutex> lock(m_Mutex);

    if (m_Held.contains(id))
    {
        spdlog::debug("Mirror {} is already locked", id);
        return false;
    }

    if (!m_Registry.mark_syncing(id, now()))
    {
        spdlog::debug("Mirror {} is disabled; not locking", id);
        return false;
    }

    m_Held.insert(id);
    spdlog::trace("Locked mirror {}", id);

    return true;
}

auto MirrorLockManager::release(const TargetId id, const SyncOutcome& outcome)
    -> TargetStatus
{
    const std::lock_guard<std::mutex> lock(m_Mutex);

    if (!m_Held.contains(id))
    {
        throw precondition_violation(
            std::format("Mirror {} released without holding its lock", id)
        );
    }

    TargetStatus finalStatus = TargetStatus::ERROR;
    try
    {
        finalStatus = m_Registry.mark_finished(id, outcome);
    }
    catch (...)
    {
        // The lock must not outlive the job even if the status write failed
        m_Held.erase(id);
        throw;
    }

    m_Held.erase(id);
    spdlog::trace("Unlocked mirror {} ({})", id, to_string(finalStatus));

    return finalStatus;
}

auto MirrorLockManager::try_lease(const TargetId id) -> std::optional<TargetLease>
{
    if (!this->try_acquire(id))
    {
        return std::nullopt;
    }

    return TargetLease(*this, id);
}

auto MirrorLockManager::is_locked(const TargetId id) const -> bool
{
    const std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Held.contains(id);
}
} // namespace bsdmirrors::sync_engine
