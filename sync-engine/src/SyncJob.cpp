/**
 * @file SyncJob.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/SyncJob.hpp>

// Standard Library Includes
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Project Includes
#include <bsdmirrors/sync_engine/Errors.hpp>

namespace bsdmirrors::sync_engine
{
namespace
{
constexpr std::string_view SCHEDULE_ORIGIN = "schedule";
constexpr std::string_view MANUAL_PREFIX   = "manual:";
} // namespace

auto to_string(const JobStatus status) -> std::string_view
{
    switch (status)
    {
    case JobStatus::PENDING:
        return "pending";
    case JobStatus::RUNNING:
        return "running";
    case JobStatus::COMPLETED:
        return "completed";
    case JobStatus::FAILED:
        return "failed";
    }

    return "unknown";
}

auto job_status_from_string(std::string_view status) -> JobStatus
{
    for (const auto candidate : { JobStatus::PENDING,
                                  JobStatus::RUNNING,
                                  JobStatus::COMPLETED,
                                  JobStatus::FAILED })
    {
        if (to_string(candidate) == status)
        {
            return candidate;
        }
    }

    throw database_error(std::format("Unknown job status `{}`", status));
}

auto to_string(const FailureKind kind) -> std::string_view
{
    switch (kind)
    {
    case FailureKind::TIMEOUT:
        return "timeout";
    case FailureKind::TRANSFER_FAILED:
        return "transfer_failed";
    case FailureKind::SPAWN_FAILED:
        return "spawn_failed";
    case FailureKind::INTERRUPTED:
        return "interrupted";
    }

    return "unknown";
}

auto failure_kind_from_string(std::string_view kind) -> FailureKind
{
    for (const auto candidate : { FailureKind::TIMEOUT,
                                  FailureKind::TRANSFER_FAILED,
                                  FailureKind::SPAWN_FAILED,
                                  FailureKind::INTERRUPTED })
    {
        if (to_string(candidate) == kind)
        {
            return candidate;
        }
    }

    throw database_error(std::format("Unknown failure kind `{}`", kind));
}

TriggerOrigin::TriggerOrigin(std::optional<std::string> actor)
    : m_Actor(std::move(actor))
{
}

auto TriggerOrigin::schedule() -> TriggerOrigin
{
    return TriggerOrigin(std::nullopt);
}

auto TriggerOrigin::manual(std::string actor) -> TriggerOrigin
{
    if (actor.empty())
    {
        throw validation_error("A manual trigger requires an actor");
    }

    return TriggerOrigin(std::move(actor));
}

auto TriggerOrigin::parse(std::string_view text) -> TriggerOrigin
{
    if (text == SCHEDULE_ORIGIN)
    {
        return TriggerOrigin::schedule();
    }

    if (text.starts_with(MANUAL_PREFIX))
    {
        return TriggerOrigin::manual(
            std::string(text.substr(MANUAL_PREFIX.size()))
        );
    }

    throw validation_error(std::format("Unknown trigger origin `{}`", text));
}

auto TriggerOrigin::to_string() const -> std::string
{
    if (m_Actor.has_value())
    {
        return std::format("{}{}", MANUAL_PREFIX, *m_Actor);
    }

    return std::string(SCHEDULE_ORIGIN);
}
} // namespace bsdmirrors::sync_engine
