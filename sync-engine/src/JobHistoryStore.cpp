/**
 * @file JobHistoryStore.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/JobHistoryStore.hpp>

// Standard Library Includes
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Third Party Library Includes
#include <spdlog/spdlog.h>

// Project Includes
#include <bsdmirrors/sync_engine/Errors.hpp>
#include <bsdmirrors/sync_engine/Timestamp.hpp>

namespace bsdmirrors::sync_engine
{
namespace
{
constexpr std::string_view JOB_COLUMNS
    = "id, mirror_id, status, triggered_by, created_at, started_at, "
      "completed_at, bytes_transferred, files_transferred, files_deleted, "
      "exit_code, failure_kind, output, error_message";

auto optional_timestamp(const std::optional<std::int64_t>& millis)
    -> std::optional<Timestamp>
{
    if (!millis.has_value())
    {
        return std::nullopt;
    }

    return from_unix_millis(*millis);
}

auto optional_millis(const std::optional<Timestamp>& timestamp)
    -> std::optional<std::int64_t>
{
    if (!timestamp.has_value())
    {
        return std::nullopt;
    }

    return to_unix_millis(*timestamp);
}

auto read_job(const Statement& row) -> SyncJob
{
    const auto failureKind = row.column_optional_text(11);

    return SyncJob {
        .id               = row.column_int64(0),
        .targetId         = row.column_int64(1),
        .status           = job_status_from_string(row.column_text(2)),
        .trigger          = TriggerOrigin::parse(row.column_text(3)),
        .createdAt        = from_unix_millis(row.column_int64(4)),
        .startedAt        = optional_timestamp(row.column_optional_int64(5)),
        .completedAt      = optional_timestamp(row.column_optional_int64(6)),
        .bytesTransferred = row.column_optional_int64(7),
        .filesTransferred = row.column_optional_int64(8),
        .filesDeleted     = row.column_optional_int64(9),
        .exitCode         = row.column_optional_int64(10),
        .failureKind      = (failureKind.has_value()
                                 ? std::optional(failure_kind_from_string(*failureKind))
                                 : std::nullopt),
        .output           = row.column_text(12),
        .errorMessage     = row.column_optional_text(13),
    };
}

auto read_jobs(Statement& select) -> std::vector<SyncJob>
{
    std::vector<SyncJob> jobs;

    while (select.step())
    {
        jobs.emplace_back(read_job(select));
    }

    return jobs;
}
} // namespace

JobHistoryStore::JobHistoryStore(Database& database)
    : m_Database(database)
{
}

auto JobHistoryStore::append(const TargetId targetId, const TriggerOrigin& trigger)
    -> SyncJob
{
    SyncJob job { .targetId  = targetId,
                  .status    = JobStatus::PENDING,
                  .trigger   = trigger,
                  .createdAt = now() };

    auto transaction = m_Database.begin();

    {
        auto insert = transaction.prepare(
            "INSERT INTO sync_jobs (mirror_id, status, triggered_by, created_at) "
            "VALUES (?, ?, ?, ?)"
        );
        insert.bind_int64(1, targetId)
            .bind_text(2, to_string(job.status))
            .bind_text(3, trigger.to_string())
            .bind_int64(4, to_unix_millis(job.createdAt));
        insert.step();
    }

    job.id = transaction.last_insert_id();
    transaction.commit();

    spdlog::debug(
        "Created job {} for mirror {} ({})",
        job.id,
        targetId,
        trigger.to_string()
    );

    return job;
}

auto JobHistoryStore::record(const SyncJob& job) -> void
{
    auto transaction = m_Database.begin();

    {
        auto select = transaction.prepare(
            "SELECT status FROM sync_jobs WHERE id = ?"
        );
        select.bind_int64(1, job.id);

        if (!select.step())
        {
            throw job_not_found(std::format("Job {} not found", job.id));
        }

        const auto storedStatus = job_status_from_string(select.column_text(0));

        if (is_terminal(storedStatus))
        {
            throw precondition_violation(
                std::format(
                    "Job {} is already {} and cannot be rewritten",
                    job.id,
                    to_string(storedStatus)
                )
            );
        }

        if (storedStatus == JobStatus::RUNNING && job.status == JobStatus::PENDING)
        {
            throw precondition_violation(
                std::format("Job {} cannot move from running to pending", job.id)
            );
        }
    }

    {
        auto update = transaction.prepare(
            "UPDATE sync_jobs SET status = ?, started_at = ?, completed_at = ?, "
            "bytes_transferred = ?, files_transferred = ?, files_deleted = ?, "
            "exit_code = ?, failure_kind = ?, output = ?, error_message = ? "
            "WHERE id = ?"
        );
        update.bind_text(1, to_string(job.status))
            .bind_optional_int64(2, optional_millis(job.startedAt))
            .bind_optional_int64(3, optional_millis(job.completedAt))
            .bind_optional_int64(4, job.bytesTransferred)
            .bind_optional_int64(5, job.filesTransferred)
            .bind_optional_int64(6, job.filesDeleted)
            .bind_optional_int64(7, job.exitCode)
            .bind_optional_text(
                8,
                (job.failureKind.has_value()
                     ? std::optional<std::string>(to_string(*job.failureKind))
                     : std::nullopt)
            )
            .bind_text(9, job.output)
            .bind_optional_text(10, job.errorMessage)
            .bind_int64(11, job.id);
        update.step();
    }

    transaction.commit();
}

auto JobHistoryStore::list(const TargetId targetId, const std::size_t limit) const
    -> std::vector<SyncJob>
{
    auto transaction = m_Database.begin();
    auto select      = transaction.prepare(
        std::format(
            "SELECT {} FROM sync_jobs WHERE mirror_id = ? ORDER BY id DESC LIMIT ?",
            JOB_COLUMNS
        )
    );
    select.bind_int64(1, targetId).bind_int64(2, static_cast<std::int64_t>(limit));

    return read_jobs(select);
}

auto JobHistoryStore::list_recent(const std::size_t limit) const
    -> std::vector<SyncJob>
{
    auto transaction = m_Database.begin();
    auto select      = transaction.prepare(
        std::format("SELECT {} FROM sync_jobs ORDER BY id DESC LIMIT ?", JOB_COLUMNS)
    );
    select.bind_int64(1, static_cast<std::int64_t>(limit));

    return read_jobs(select);
}

auto JobHistoryStore::get(const JobId id) const -> SyncJob
{
    auto transaction = m_Database.begin();
    auto select      = transaction.prepare(
        std::format("SELECT {} FROM sync_jobs WHERE id = ?", JOB_COLUMNS)
    );
    select.bind_int64(1, id);

    if (!select.step())
    {
        throw job_not_found(std::format("Job {} not found", id));
    }

    return read_job(select);
}

auto JobHistoryStore::prune(const RetentionPolicy& policy) -> std::size_t
{
    std::size_t deleted = 0;

    auto transaction = m_Database.begin();

    if (policy.maxAge.has_value())
    {
        const auto cutoff = now() - *policy.maxAge;

        auto statement = transaction.prepare(
            "DELETE FROM sync_jobs "
            "WHERE status IN ('completed', 'failed') AND created_at < ?"
        );
        statement.bind_int64(1, to_unix_millis(cutoff));
        statement.step();

        deleted += static_cast<std::size_t>(transaction.changes());
    }

    if (policy.keepPerTarget.has_value())
    {
        auto statement = transaction.prepare(
            "DELETE FROM sync_jobs "
            "WHERE status IN ('completed', 'failed') AND id IN ("
            "  SELECT id FROM ("
            "    SELECT id, ROW_NUMBER() OVER ("
            "      PARTITION BY mirror_id ORDER BY id DESC"
            "    ) AS position FROM sync_jobs"
            "  ) WHERE position > ?"
            ")"
        );
        statement.bind_int64(1, static_cast<std::int64_t>(*policy.keepPerTarget));
        statement.step();

        deleted += static_cast<std::size_t>(transaction.changes());
    }

    transaction.commit();

    spdlog::info(
        "Pruned {} finished job{} from history",
        deleted,
        (deleted == 1 ? "" : "s")
    );

    return deleted;
}

auto JobHistoryStore::fail_interrupted(std::string_view message) -> std::size_t
{
    auto transaction = m_Database.begin();

    {
        auto statement = transaction.prepare(
            "UPDATE sync_jobs SET status = 'failed', failure_kind = ?, "
            "error_message = ?, completed_at = ? "
            "WHERE status IN ('pending', 'running')"
        );
        statement.bind_text(1, to_string(FailureKind::INTERRUPTED))
            .bind_text(2, message)
            .bind_int64(3, to_unix_millis(now()));
        statement.step();
    }

    const auto failed = static_cast<std::size_t>(transaction.changes());
    transaction.commit();

    return failed;
}
} // namespace bsdmirrors::sync_engine
