/**
 * @file JobHistoryStore.hpp
 * @brief Durable, append-only record of sync jobs
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

// Project Includes
#include <bsdmirrors/sync_engine/Database.hpp>
#include <bsdmirrors/sync_engine/MirrorTarget.hpp>
#include <bsdmirrors/sync_engine/SyncJob.hpp>

namespace bsdmirrors::sync_engine
{
// Unset limits are not applied. Jobs that have not finished are never pruned.
struct RetentionPolicy
{
    std::optional<std::chrono::hours> maxAge;
    std::optional<std::size_t>        keepPerTarget;
};

class JobHistoryStore
{
  public: // Constructors
    explicit JobHistoryStore(Database& database);
    JobHistoryStore(JobHistoryStore&) = delete;
    JobHistoryStore(JobHistoryStore&&) = delete;
    auto operator=(JobHistoryStore&) -> JobHistoryStore& = delete;
    auto operator=(JobHistoryStore&&) -> JobHistoryStore& = delete;

    ~JobHistoryStore() = default;

  public: // Methods
    // Creates a pending job
    auto append(TargetId targetId, const TriggerOrigin& trigger) -> SyncJob;

    // Persists a status transition. A job that is already completed or
    // failed is never rewritten (`precondition_violation`).
    auto record(const SyncJob& job) -> void;

    // Newest first
    [[nodiscard]]
    auto list(TargetId targetId, std::size_t limit) const -> std::vector<SyncJob>;

    [[nodiscard]]
    auto list_recent(std::size_t limit) const -> std::vector<SyncJob>;

    // Throws `job_not_found`
    [[nodiscard]]
    auto get(JobId id) const -> SyncJob;

    // Returns the number of jobs deleted
    auto prune(const RetentionPolicy& policy) -> std::size_t;

    // Fails every pending or running job left behind by a previous process
    auto fail_interrupted(std::string_view message) -> std::size_t;

  private: // Members
    Database& m_Database;
};
} // namespace bsdmirrors::sync_engine
