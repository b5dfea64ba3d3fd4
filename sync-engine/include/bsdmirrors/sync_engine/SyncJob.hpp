/**
 * @file SyncJob.hpp
 * @brief One attempted synchronization run for a target
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Project Includes
#include <bsdmirrors/sync_engine/MirrorTarget.hpp>
#include <bsdmirrors/sync_engine/Timestamp.hpp>

namespace bsdmirrors::sync_engine
{
using JobId = std::int64_t;

enum class JobStatus : std::uint8_t
{
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
};

enum class FailureKind : std::uint8_t
{
    TIMEOUT,
    TRANSFER_FAILED,
    SPAWN_FAILED,
    INTERRUPTED,
};

[[nodiscard]]
auto to_string(JobStatus status) -> std::string_view;
[[nodiscard]]
auto job_status_from_string(std::string_view status) -> JobStatus;

[[nodiscard]]
auto to_string(FailureKind kind) -> std::string_view;
[[nodiscard]]
auto failure_kind_from_string(std::string_view kind) -> FailureKind;

[[nodiscard]]
constexpr auto is_terminal(const JobStatus status) -> bool
{
    return status == JobStatus::COMPLETED || status == JobStatus::FAILED;
}

// `schedule` or `manual:<actor>`
class TriggerOrigin
{
  public: // Constructors
    [[nodiscard]]
    static auto schedule() -> TriggerOrigin;
    [[nodiscard]]
    static auto manual(std::string actor) -> TriggerOrigin;

    // Throws `validation_error` if `text` is neither form
    [[nodiscard]]
    static auto parse(std::string_view text) -> TriggerOrigin;

  public: // Methods
    [[nodiscard]]
    auto is_manual() const -> bool
    {
        return m_Actor.has_value();
    }

    [[nodiscard]]
    auto actor() const -> const std::optional<std::string>&
    {
        return m_Actor;
    }

    [[nodiscard]]
    auto to_string() const -> std::string;

    auto operator==(const TriggerOrigin&) const -> bool = default;

  private: // Constructors
    explicit TriggerOrigin(std::optional<std::string> actor);

  private: // Members
    std::optional<std::string> m_Actor;
};

struct SyncJob
{
    JobId                       id       = 0;
    TargetId                    targetId = 0;
    JobStatus                   status   = JobStatus::PENDING;
    TriggerOrigin               trigger  = TriggerOrigin::schedule();
    Timestamp                   createdAt;
    std::optional<Timestamp>    startedAt;
    std::optional<Timestamp>    completedAt;
    std::optional<std::int64_t> bytesTransferred;
    std::optional<std::int64_t> filesTransferred;
    std::optional<std::int64_t> filesDeleted;
    std::optional<std::int64_t> exitCode;
    std::optional<FailureKind>  failureKind;
    std::string                 output;
    std::optional<std::string>  errorMessage;
};
} // namespace bsdmirrors::sync_engine
