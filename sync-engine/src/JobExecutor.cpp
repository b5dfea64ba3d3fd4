/**
 * @file JobExecutor.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/JobExecutor.hpp>

// Standard Library Includes
#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <format>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

// Third Party Library Includes
#include <spdlog/spdlog.h>

// Project Includes
#include <bsdmirrors/sync_engine/Errors.hpp>
#include <bsdmirrors/sync_engine/OutputBuffer.hpp>
#include <bsdmirrors/sync_engine/RsyncStats.hpp>
#include <bsdmirrors/sync_engine/Timestamp.hpp>
#include <bsdmirrors/sync_engine/TransferProcess.hpp>

namespace bsdmirrors::sync_engine
{
namespace
{
constexpr std::size_t DIAGNOSTIC_LINES  = 10;
constexpr std::size_t MAX_ERROR_MESSAGE = 1000;

// `heading` followed by the last lines of output, at most 1000 bytes
auto diagnostic_message(std::string_view heading, const OutputBuffer& output)
    -> std::string
{
    std::string tail = output.tail_lines(DIAGNOSTIC_LINES);

    if (tail.empty())
    {
        return std::string(heading);
    }

    const std::size_t budget
        = MAX_ERROR_MESSAGE - std::min(MAX_ERROR_MESSAGE, heading.size() + 1);
    if (tail.size() > budget)
    {
        tail.erase(0, tail.size() - budget);
    }

    return std::format("{}\n{}", heading, tail);
}

auto fail(
    SyncJob&            job,
    const FailureKind   kind,
    std::string         message,
    const OutputBuffer& output
) -> void
{
    job.status       = JobStatus::FAILED;
    job.failureKind  = kind;
    job.errorMessage = std::move(message);
    job.output       = output.contents();
    job.completedAt  = now();
}
} // namespace

JobExecutor::JobExecutor(
    MirrorRegistry&  registry,
    JobHistoryStore& history,
    SettingsStore&   settings,
    ExecutorOptions  options
)
    : m_Registry(registry),
      m_History(history),
      m_Settings(settings),
      m_Options(std::move(options))
{
}

auto JobExecutor::run(
    SyncJob                job,
    TargetLease            lease,
    const std::stop_token& stopToken
) -> JobResult
{
    if (!lease.held() || lease.target_id() != job.targetId)
    {
        throw precondition_violation(
            std::format(
                "Job {} was started without holding mirror {}",
                job.id,
                job.targetId
            )
        );
    }

    RsyncStats stats;

    try
    {
        const auto target   = m_Registry.get_target(job.targetId);
        const auto settings = m_Settings.snapshot();

        stats = this->execute(job, target, settings, stopToken);
    }
    catch (std::runtime_error& re)
    {
        spdlog::error(
            "Job {} for mirror {} failed unexpectedly: {}",
            job.id,
            job.targetId,
            re.what()
        );

        job.status       = JobStatus::FAILED;
        job.failureKind  = job.failureKind.value_or(FailureKind::TRANSFER_FAILED);
        job.errorMessage = re.what();
        job.completedAt  = now();
    }

    try
    {
        m_History.record(job);
    }
    catch (database_error& de)
    {
        spdlog::error(
            "Failed to record the outcome of job {} for mirror {}: {}",
            job.id,
            job.targetId,
            de.what()
        );
    }

    const auto targetStatus = lease.release(
        SyncOutcome { .succeeded      = job.status == JobStatus::COMPLETED,
                      .finishedAt     = job.completedAt.value_or(now()),
                      .totalSizeBytes = stats.totalSizeBytes,
                      .fileCount      = stats.totalFiles,
                      .error          = job.errorMessage }
    );

    if (job.status == JobStatus::COMPLETED)
    {
        spdlog::info("Job {} for mirror {} completed", job.id, job.targetId);
    }
    else
    {
        spdlog::warn(
            "Job {} for mirror {} failed ({}): {}",
            job.id,
            job.targetId,
            to_string(job.failureKind.value_or(FailureKind::TRANSFER_FAILED)),
            job.errorMessage.value_or("")
        );
    }

    return JobResult { .job = std::move(job), .targetStatus = targetStatus };
}

auto JobExecutor::execute(
    SyncJob&               job,
    const MirrorTarget&    target,
    const SyncSettings&    settings,
    const std::stop_token& stopToken
) -> RsyncStats
{
    OutputBuffer output(m_Options.outputLimitBytes);

    TransferCommand command;
    try
    {
        command = compose_transfer_command(
            target,
            m_Options.transfer,
            settings.bandwidthLimit
        );
    }
    catch (spawn_error& se)
    {
        fail(job, FailureKind::SPAWN_FAILED, se.what(), output);
        return {};
    }

    if (m_Options.dryRun)
    {
        spdlog::info(
            "Starting dry run sync for {}: {}",
            target.name,
            command.to_string()
        );

        job.status    = JobStatus::RUNNING;
        job.startedAt = now();
        m_History.record(job);

        output.append(std::format("dry run: {}\n", command.to_string()));

        job.status      = JobStatus::COMPLETED;
        job.exitCode    = 0;
        job.output      = output.contents();
        job.completedAt = now();

        return {};
    }

    std::error_code error;
    std::filesystem::create_directories(target.localPath, error);

    if (error)
    {
        fail(
            job,
            FailureKind::TRANSFER_FAILED,
            std::format(
                "Failed to create destination {}: {}",
                target.localPath,
                error.message()
            ),
            output
        );
        return {};
    }

    std::optional<TransferProcess> process;
    try
    {
        process.emplace(command, target.name);
    }
    catch (spawn_error& se)
    {
        fail(job, FailureKind::SPAWN_FAILED, se.what(), output);
        return {};
    }

    job.status    = JobStatus::RUNNING;
    job.startedAt = now();
    m_History.record(job);

    spdlog::info(
        "Started sync for {} (job {}, pid: {})",
        target.name,
        job.id,
        process->pid()
    );

    const auto exit = process->supervise(
        output,
        settings.timeout,
        m_Options.terminationGrace,
        stopToken
    );

    switch (exit.reason)
    {
    case ProcessExit::Reason::TIMED_OUT:
        fail(
            job,
            FailureKind::TIMEOUT,
            std::format("Sync timed out after {} seconds", settings.timeout.count()),
            output
        );
        return {};

    case ProcessExit::Reason::CANCELLED:
        fail(
            job,
            FailureKind::INTERRUPTED,
            "Sync interrupted by engine shutdown",
            output
        );
        return {};

    case ProcessExit::Reason::SIGNALED:
        job.exitCode = -exit.status;
        fail(
            job,
            FailureKind::TRANSFER_FAILED,
            diagnostic_message(
                std::format("rsync was killed by signal {}", exit.status),
                output
            ),
            output
        );
        return {};

    case ProcessExit::Reason::EXITED:
        break;
    }

    job.exitCode = exit.status;

    if (exit.status != 0)
    {
        fail(
            job,
            FailureKind::TRANSFER_FAILED,
            diagnostic_message(
                std::format("rsync exited with code {}", exit.status),
                output
            ),
            output
        );
        return {};
    }

    const auto stats = parse_rsync_stats(output.contents());

    job.status           = JobStatus::COMPLETED;
    job.bytesTransferred = stats.bytesTransferred;
    job.filesTransferred = stats.filesTransferred;
    job.filesDeleted     = stats.filesDeleted;
    job.output           = output.contents();
    job.completedAt      = now();

    return stats;
}
} // namespace bsdmirrors::sync_engine
