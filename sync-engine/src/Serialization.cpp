/**
 * @file Serialization.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/Serialization.hpp>

// Standard Library Includes
#include <optional>
#include <string>

// Third Party Library Includes
#include <nlohmann/json.hpp>

// Project Includes
#include <bsdmirrors/sync_engine/Timestamp.hpp>

namespace bsdmirrors::sync_engine
{
namespace
{
template <typename T>
auto optional_json(const std::optional<T>& value) -> nlohmann::json
{
    if (!value.has_value())
    {
        return nullptr;
    }

    return *value;
}

auto timestamp_json(const std::optional<Timestamp>& timestamp) -> nlohmann::json
{
    if (!timestamp.has_value())
    {
        return nullptr;
    }

    return to_iso8601(*timestamp);
}
} // namespace

auto to_json(nlohmann::json& json, const MirrorTarget& target) -> void
{
    json = nlohmann::json {
        { "id", target.id },
        { "name", target.name },
        { "kind", target.kind },
        { "upstream_url", target.upstreamUrl },
        { "local_path", target.localPath },
        { "enabled", target.enabled },
        { "status", to_string(target.status) },
        { "last_sync_started", timestamp_json(target.lastSyncStarted) },
        { "last_sync_completed", timestamp_json(target.lastSyncCompleted) },
        { "last_sync_error", optional_json(target.lastSyncError) },
        { "total_size_bytes", optional_json(target.totalSizeBytes) },
        { "file_count", optional_json(target.fileCount) },
    };
}

auto to_json(nlohmann::json& json, const SyncJob& job) -> void
{
    json = nlohmann::json {
        { "id", job.id },
        { "mirror_id", job.targetId },
        { "status", to_string(job.status) },
        { "triggered_by", job.trigger.to_string() },
        { "created_at", to_iso8601(job.createdAt) },
        { "started_at", timestamp_json(job.startedAt) },
        { "completed_at", timestamp_json(job.completedAt) },
        { "bytes_transferred", optional_json(job.bytesTransferred) },
        { "files_transferred", optional_json(job.filesTransferred) },
        { "files_deleted", optional_json(job.filesDeleted) },
        { "exit_code", optional_json(job.exitCode) },
        { "failure_kind", nullptr },
        { "output", job.output },
        { "error_message", optional_json(job.errorMessage) },
    };

    if (job.failureKind.has_value())
    {
        json["failure_kind"] = to_string(*job.failureKind);
    }
}

auto to_json(nlohmann::json& json, const Setting& setting) -> void
{
    json = nlohmann::json {
        { "key", setting.key },
        { "value", setting.value },
        { "description", setting.description },
        { "updated_at", to_iso8601(setting.updatedAt) },
    };
}
} // namespace bsdmirrors::sync_engine
