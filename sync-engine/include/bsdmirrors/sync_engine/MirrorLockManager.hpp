/**
 * @file MirrorLockManager.hpp
 * @brief Per-target mutual exclusion for sync jobs
 */

#pragma once

// Standard Library Includes
#include <format>
#include <mutex>
#include <optional>
#include <set>
#include <type_traits>
#include <utility>

// Project Includes
#include <bsdmirrors/sync_engine/Errors.hpp>
#include <bsdmirrors/sync_engine/MirrorRegistry.hpp>
#include <bsdmirrors/sync_engine/MirrorTarget.hpp>

namespace bsdmirrors::sync_engine
{
class MirrorLockManager;

// Scoped ownership of one target's lock. A lease that is destroyed without
// being released releases the target as failed.
class TargetLease
{
  public: // Constructors
    TargetLease(TargetLease&) = delete;
    TargetLease(TargetLease&& other) noexcept;
    auto operator=(TargetLease&) -> TargetLease& = delete;
    auto operator=(TargetLease&&) -> TargetLease& = delete;

    ~TargetLease();

  public: // Methods
    [[nodiscard]]
    auto target_id() const -> TargetId
    {
        return m_TargetId;
    }

    [[nodiscard]]
    auto held() const -> bool
    {
        return m_Manager != nullptr;
    }

    auto release(const SyncOutcome& outcome) -> TargetStatus;

  private: // Constructors
    friend class MirrorLockManager;

    TargetLease(MirrorLockManager& manager, TargetId targetId);

  private: // Members
    MirrorLockManager* m_Manager;
    TargetId           m_TargetId;
};

// In-memory lock table. The engine is single-instance, so holding the lock
// here is authoritative; the registry's `syncing` status mirrors it.
class MirrorLockManager
{
  public: // Constructors
    explicit MirrorLockManager(MirrorRegistry& registry);
    MirrorLockManager(MirrorLockManager&) = delete;
    MirrorLockManager(MirrorLockManager&&) = delete;
    auto operator=(MirrorLockManager&) -> MirrorLockManager& = delete;
    auto operator=(MirrorLockManager&&) -> MirrorLockManager& = delete;

    ~MirrorLockManager() = default;

  public: // Methods
    // Succeeds and marks the target `syncing` iff it is enabled and not
    // already locked. Throws `target_not_found`.
    auto try_acquire(TargetId id) -> bool;

    // Releases a held lock and writes the target's final status. Throws
    // `precondition_violation` if the lock is not held.
    auto release(TargetId id, const SyncOutcome& outcome) -> TargetStatus;

    [[nodiscard]]
    auto try_lease(TargetId id) -> std::optional<TargetLease>;

    [[nodiscard]]
    auto is_locked(TargetId id) const -> bool;

    // Runs `function` while guaranteeing no sync holds the target; nothing
    // can acquire it until `function` returns. Throws `target_busy`.
    template <typename Function>
    auto with_target_idle(const TargetId id, Function&& function)
        -> std::invoke_result_t<Function>
    {
        const std::lock_guard<std::mutex> lock(m_Mutex);

        if (m_Held.contains(id))
        {
            throw target_busy(std::format("Mirror {} is currently syncing", id));
        }

        return std::forward<Function>(function)();
    }

  private: // Members
    MirrorRegistry&    m_Registry;
    mutable std::mutex m_Mutex;
    std::set<TargetId> m_Held;
};
} // namespace bsdmirrors::sync_engine
